#ifndef NATDEV_LOG_HEADER
#define NATDEV_LOG_HEADER

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace natdev {

/**
 * Component loggers built on spdlog.
 *
 * Every component ("default", "device", "natpmp") gets its own named logger,
 * all of them writing to a shared colour stdout sink. Devices accept any
 * `spdlog::logger` so that hosts may route their output elsewhere.
 *
 * @par Thread Safety
 * All functions are safe to call concurrently. Loggers are created with the
 * `_mt` sinks.
 */
namespace log {

namespace detail {

struct registry
{
    std::mutex mutex;
    bool initialized = false;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

inline registry& get_registry()
{
    static registry instance;
    return instance;
}

inline const std::vector<std::string>& component_names()
{
    static const std::vector<std::string> names{"default", "device", "natpmp"};
    return names;
}

inline void initialize_locked(registry& r, const std::string& level)
{
    if(r.initialized) { return; }

    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    for(const auto& name : component_names()) {
        auto logger = std::make_shared<spdlog::logger>(name, sink);
        logger->set_level(spdlog::level::from_str(level));
        r.loggers[name] = std::move(logger);
    }
    r.initialized = true;
}

} // detail

/**
 * Creates the component loggers with the minimum severity @p level (one of
 * "trace", "debug", "info", "warn", "error", "critical", "off").
 *
 * Only the first call has an effect; use @ref set_level afterwards.
 */
inline void initialize(const std::string& level = "info")
{
    auto& r = detail::get_registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    detail::initialize_locked(r, level);
}

/**
 * Returns the logger of @p component, initializing the registry with the
 * default level if necessary. Unknown components get the "default" logger.
 */
inline std::shared_ptr<spdlog::logger> get(const std::string& component = "default")
{
    auto& r = detail::get_registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    detail::initialize_locked(r, "info");
    auto it = r.loggers.find(component);
    if(it != r.loggers.end()) {
        return it->second;
    }
    return r.loggers["default"];
}

inline void set_level(const std::string& level)
{
    auto& r = detail::get_registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    const auto l = spdlog::level::from_str(level);
    for(auto& entry : r.loggers) {
        entry.second->set_level(l);
    }
}

/** Flushes all component loggers. */
inline void flush()
{
    auto& r = detail::get_registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    for(auto& entry : r.loggers) {
        entry.second->flush();
    }
}

} // log
} // natdev

#endif // NATDEV_LOG_HEADER
