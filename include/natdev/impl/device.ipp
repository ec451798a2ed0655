#ifndef NATDEV_DEVICE_IMPL
#define NATDEV_DEVICE_IMPL

#include "../device.hpp"
#include "../log.hpp"

#include <algorithm>
#include <exception>

#include <asio/post.hpp>

namespace natdev {

/** State of an `async_release_all` operation in flight. */
struct device::release_all_op
{
    // Copy of the registry taken when the operation started. Deletions that
    // race with the teardown shrink the registry but not this list.
    std::vector<port_mapping> mappings;
    std::size_t next = 0;
    std::size_t num_failed = 0;
    std::function<void()> handler;
};

inline device::device(asio::io_context& io_context, asio::ip::address address,
        std::shared_ptr<spdlog::logger> logger)
    : io_context_(io_context)
    , address_(std::move(address))
    , logger_(logger ? std::move(logger) : log::get("device"))
    , last_seen_(clock::now())
{}

inline std::vector<port_mapping> device::owned_mappings() const
{
    std::lock_guard<std::mutex> lock(mappings_mutex_);
    return mappings_;
}

inline mapping_error device::make_error(error_code cause, std::string operation,
        std::optional<port_mapping> mapping) const
{
    return mapping_error(cause, std::string(protocol_name()) + ' ' + operation,
            address_, std::move(mapping));
}

inline std::exception_ptr device::make_failure(error_code error,
        const char* operation, std::optional<port_mapping> mapping) const
{
    if(!error) {
        return nullptr;
    }
    return std::make_exception_ptr(make_error(error, operation, std::move(mapping)));
}

inline void device::create_mapping_impl(const port_mapping& mapping,
        mapping_completion handler)
{
    if(mapping.private_port == 0) {
        asio::post(io_context_, [this, mapping, handler = std::move(handler)] {
            handler(make_failure(make_error_code(error::mapping_errc::invalid_mapping),
                    "create_mapping", mapping), {});
        });
        return;
    }
    do_create_mapping(mapping, [this, mapping, handler = std::move(handler)](
            error_code error, port_mapping created) {
        if(!error) {
            register_mapping(created);
        }
        handler(make_failure(error, "create_mapping", mapping), std::move(created));
    });
}

inline void device::delete_mapping_impl(const port_mapping& mapping,
        delete_completion handler)
{
    remove_mapping(mapping, [this, mapping, handler = std::move(handler)](error_code error) {
        handler(make_failure(error, "delete_mapping", mapping));
    });
}

inline void device::get_all_mappings_impl(list_completion handler)
{
    do_get_all_mappings([this, handler = std::move(handler)](
            error_code error, std::vector<port_mapping> mappings) {
        handler(make_failure(error, "get_all_mappings"), std::move(mappings));
    });
}

inline void device::get_external_address_impl(address_completion handler)
{
    do_get_external_address([this, handler = std::move(handler)](
            error_code error, asio::ip::address address) {
        handler(make_failure(error, "get_external_address"), std::move(address));
    });
}

inline void device::get_specific_mapping_impl(protocol type, uint16_t public_port,
        mapping_completion handler)
{
    do_get_specific_mapping(type, public_port, [this, type, public_port,
            handler = std::move(handler)](error_code error, port_mapping mapping) {
        std::optional<port_mapping> attempted;
        if(error) {
            attempted.emplace();
            attempted->type = type;
            attempted->public_port = public_port;
        }
        handler(make_failure(error, "get_specific_mapping", std::move(attempted)),
                std::move(mapping));
    });
}

inline void device::remove_mapping(const port_mapping& mapping,
        delete_handler handler)
{
    if(mapping.private_port == 0) {
        asio::post(io_context_, [handler = std::move(handler)] {
            handler(make_error_code(error::mapping_errc::invalid_mapping));
        });
        return;
    }
    do_delete_mapping(mapping,
            [this, mapping, handler = std::move(handler)](error_code error) {
                if(!error) {
                    unregister_mapping(mapping);
                }
                handler(error);
            });
}

inline void device::release_all_impl(std::function<void()> handler)
{
    auto op = std::make_shared<release_all_op>();
    op->mappings = owned_mappings();
    op->handler = std::move(handler);
    logger_->info("{} ports to close on {} device {}", op->mappings.size(),
            protocol_name(), address_.to_string());
    release_next(std::move(op));
}

inline void device::release_next(std::shared_ptr<release_all_op> op)
{
    if(op->next == op->mappings.size()) {
        {
            std::lock_guard<std::mutex> lock(mappings_mutex_);
            mappings_.clear();
        }
        if(op->num_failed > 0) {
            logger_->info("{} of {} ports on {} could not be closed",
                    op->num_failed, op->mappings.size(), address_.to_string());
        }
        // The op may be the last owner of the handler.
        auto handler = std::move(op->handler);
        op.reset();
        handler();
        return;
    }

    const port_mapping mapping = op->mappings[op->next++];
    remove_mapping(mapping, [this, op, mapping](error_code error) {
        if(error) {
            ++op->num_failed;
            const auto failure = make_error(error, "delete_mapping", mapping);
            logger_->error("{} port couldn't be closed: {}", to_string(mapping),
                    failure.what());
        } else {
            logger_->info("{} port successfully closed", to_string(mapping));
        }
        release_next(op);
    });
}

inline void device::register_mapping(const port_mapping& mapping)
{
    std::lock_guard<std::mutex> lock(mappings_mutex_);
    // Renewing a mapping must not register it twice.
    auto it = std::find_if(mappings_.begin(), mappings_.end(),
            [this, &mapping](const port_mapping& owned) {
                return same_device_mapping(owned, mapping);
            });
    if(it != mappings_.end()) {
        *it = mapping;
    } else {
        mappings_.push_back(mapping);
    }
}

inline void device::unregister_mapping(const port_mapping& mapping)
{
    std::lock_guard<std::mutex> lock(mappings_mutex_);
    auto it = std::find_if(mappings_.begin(), mappings_.end(),
            [this, &mapping](const port_mapping& owned) {
                return same_device_mapping(owned, mapping);
            });
    if(it != mappings_.end()) {
        mappings_.erase(it);
    }
}

} // natdev

#endif // NATDEV_DEVICE_IMPL
