#ifndef NATDEV_DEVICE_HEADER
#define NATDEV_DEVICE_HEADER

#include "port_mapping.hpp"
#include "error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <asio/async_result.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <spdlog/logger.h>

namespace natdev {

/**
 * @brief A gateway that accepts port mapping requests through some protocol.
 *
 * Concrete protocol drivers derive from this class and implement the
 * protected `do_*` hooks, which perform the actual network exchange. The base
 * class owns the registry of mappings that this process created on the device
 * and keeps it up to date: a mapping is registered once its creation succeeds
 * and unregistered once its deletion succeeds. Drivers never touch it.
 *
 * The registry is a client side view. It may diverge from the device's own
 * list, which @ref async_get_all_mappings queries.
 *
 * Operations complete with a `std::exception_ptr` as their first argument.
 * It is null on success and otherwise holds a @ref mapping_error naming the
 * operation, the device and the mapping attempted, whose `code()` is the
 * cause. This is the form asio's `use_future` and coroutine tokens turn into
 * a thrown exception.
 *
 * Completion handlers are stored type erased and must be copy constructible.
 *
 * A device is created by a discovery component when it learns of a gateway.
 * That component calls @ref refresh_presence whenever it observes the gateway
 * again, uses @ref last_seen to evict stale devices and should call
 * @ref async_release_all before dropping one.
 *
 * @par Thread Safety
 * @e Distinct @e objects: Safe.@n
 * @e Shared @e objects: Safe. Registry updates are atomic with respect to
 * each other; the lock is never held across a network exchange.
 *
 * @note The device must outlive all of its outstanding asynchronous
 * operations.
 */
class device
{
public:
    using clock = std::chrono::steady_clock;

protected:
    // Handlers of the protocol hooks.
    using create_handler = std::function<void(error_code, port_mapping)>;
    using delete_handler = std::function<void(error_code)>;
    using list_handler = std::function<void(error_code, std::vector<port_mapping>)>;
    using address_handler = std::function<void(error_code, asio::ip::address)>;

private:
    using mapping_completion = std::function<void(std::exception_ptr, port_mapping)>;
    using delete_completion = std::function<void(std::exception_ptr)>;
    using list_completion = std::function<void(std::exception_ptr,
            std::vector<port_mapping>)>;
    using address_completion = std::function<void(std::exception_ptr,
            asio::ip::address)>;

    asio::io_context& io_context_;
    asio::ip::address address_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<clock::time_point> last_seen_;

    mutable std::mutex mappings_mutex_;
    // Mappings this process believes it created on the device, in insertion
    // order.
    std::vector<port_mapping> mappings_;

    struct release_all_op;

public:
    device(const device&) = delete;
    device& operator=(const device&) = delete;
    virtual ~device() = default;

    asio::io_context& get_io_context() noexcept { return io_context_; }

    /** The address on which the gateway is reached from the LAN. */
    const asio::ip::address& address() const noexcept { return address_; }

    /** Short name of the protocol through which the device is controlled. */
    virtual const char* protocol_name() const noexcept = 0;

    /** The last time the device was observed by discovery. */
    clock::time_point last_seen() const noexcept { return last_seen_.load(); }

    /**
     * Records that discovery has observed the device just now. Does not
     * perform any I/O.
     */
    void refresh_presence() noexcept { last_seen_.store(clock::now()); }

    /** Returns a snapshot of the mappings created by this process. */
    std::vector<port_mapping> owned_mappings() const;

    /** Builds the error reported for a failed @p operation on this device. */
    mapping_error make_error(error_code cause, std::string operation,
            std::optional<port_mapping> mapping = std::nullopt) const;

    /**
     * @brief Asks the device to create @p mapping.
     *
     * @param mapping The requested mapping. `private_port` must not be zero.
     *
     * @param handler The handler to be called when the operation completes.
     * The function signature of the handler must be:
     * @code void handler(
     *   std::exception_ptr, // Null, or the mapping_error that occurred.
     *   natdev::port_mapping // The mapping that the device created.
     * ); @endcode
     * The created mapping may differ from the requested one (e.g. a NAT-PMP box
     * may choose another public port or lifetime). On success it is part of
     * @ref owned_mappings by the time the handler runs.
     * Regardless of whether the asynchronous operation completes immediately or
     * not, the handler will not be invoked from within this function.
     */
    template<typename Handler>
    ASIO_INITFN_RESULT_TYPE(Handler, void(std::exception_ptr, port_mapping))
    async_create_mapping(const port_mapping& mapping, Handler handler)
    {
        asio::async_completion<Handler,
                void(std::exception_ptr, port_mapping)> init(handler);
        create_mapping_impl(mapping,
                erase_handler<mapping_completion>(init.completion_handler));
        return init.result.get();
    }

    /**
     * @brief Asks the device to remove @p mapping.
     *
     * Only the mapping's protocol, public and private ports are relevant. On
     * success the owned mapping that the driver considers the same (see
     * @ref same_device_mapping) is no longer part of @ref owned_mappings. If the
     * device could not be told, the mapping stays registered since it may still
     * exist on the device. Deleting a mapping that was not created by this
     * process is not an error.
     *
     * @param handler The handler to be called when the operation completes.
     * The function signature of the handler must be:
     * @code void handler(std::exception_ptr); @endcode
     */
    template<typename Handler>
    ASIO_INITFN_RESULT_TYPE(Handler, void(std::exception_ptr))
    async_delete_mapping(const port_mapping& mapping, Handler handler)
    {
        asio::async_completion<Handler, void(std::exception_ptr)> init(handler);
        delete_mapping_impl(mapping,
                erase_handler<delete_completion>(init.completion_handler));
        return init.result.get();
    }

    /**
     * @brief Queries every mapping the device has, including the ones created
     * by other clients.
     *
     * The function signature of the handler must be:
     * @code void handler(std::exception_ptr, std::vector<natdev::port_mapping>); @endcode
     */
    template<typename Handler>
    ASIO_INITFN_RESULT_TYPE(Handler, void(std::exception_ptr, std::vector<port_mapping>))
    async_get_all_mappings(Handler handler)
    {
        asio::async_completion<Handler,
                void(std::exception_ptr, std::vector<port_mapping>)> init(handler);
        get_all_mappings_impl(erase_handler<list_completion>(init.completion_handler));
        return init.result.get();
    }

    /**
     * @brief Queries the address of the WAN facing side of the device. The
     * result is never cached.
     *
     * The function signature of the handler must be:
     * @code void handler(std::exception_ptr, asio::ip::address); @endcode
     */
    template<typename Handler>
    ASIO_INITFN_RESULT_TYPE(Handler, void(std::exception_ptr, asio::ip::address))
    async_get_external_address(Handler handler)
    {
        asio::async_completion<Handler,
                void(std::exception_ptr, asio::ip::address)> init(handler);
        get_external_address_impl(
                erase_handler<address_completion>(init.completion_handler));
        return init.result.get();
    }

    /**
     * @brief Queries the mapping of @p public_port for @p type.
     *
     * If the device has no such mapping the handler receives a
     * @ref mapping_error with `error::mapping_errc::not_found`.
     *
     * The function signature of the handler must be:
     * @code void handler(std::exception_ptr, natdev::port_mapping); @endcode
     */
    template<typename Handler>
    ASIO_INITFN_RESULT_TYPE(Handler, void(std::exception_ptr, port_mapping))
    async_get_specific_mapping(protocol type, uint16_t public_port, Handler handler)
    {
        asio::async_completion<Handler,
                void(std::exception_ptr, port_mapping)> init(handler);
        get_specific_mapping_impl(type, public_port,
                erase_handler<mapping_completion>(init.completion_handler));
        return init.result.get();
    }

    /**
     * @brief Deletes every mapping in @ref owned_mappings, one at a time.
     *
     * Best effort: a failed deletion is logged and the next mapping is tried
     * regardless. Once all mappings have been attempted the registry is
     * emptied, whether or not the device removed them. Failures are only
     * visible in the log.
     *
     * The function signature of the handler must be:
     * @code void handler(); @endcode
     */
    template<typename Handler>
    ASIO_INITFN_RESULT_TYPE(Handler, void())
    async_release_all(Handler handler)
    {
        asio::async_completion<Handler, void()> init(handler);
        release_all_impl(
                erase_handler<std::function<void()>>(init.completion_handler));
        return init.result.get();
    }

protected:
    /**
     * @param logger Destination of the teardown log. Defaults to the "device"
     * component logger.
     */
    device(asio::io_context& io_context, asio::ip::address address,
            std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * Whether deleting @p deleted removes @p owned on the device. Drivers
     * whose protocol identifies mappings by something other than the public
     * port override this, so that the registry follows what the device did.
     */
    virtual bool same_device_mapping(const port_mapping& owned,
            const port_mapping& deleted) const noexcept
    {
        return same_mapping(owned, deleted);
    }

    // Protocol hooks. Each must eventually invoke its handler exactly once, and
    // never from within the hook itself.

    virtual void do_create_mapping(const port_mapping& mapping,
            create_handler handler) = 0;
    virtual void do_delete_mapping(const port_mapping& mapping,
            delete_handler handler) = 0;
    virtual void do_get_all_mappings(list_handler handler) = 0;
    virtual void do_get_external_address(address_handler handler) = 0;
    virtual void do_get_specific_mapping(protocol type, uint16_t public_port,
            create_handler handler) = 0;

private:
    template<typename Function, typename CompletionHandler>
    static Function erase_handler(CompletionHandler& handler)
    {
        static_assert(std::is_copy_constructible<CompletionHandler>::value,
                "natdev completion handlers must be copy constructible");
        return Function(std::move(handler));
    }

    std::exception_ptr make_failure(error_code error, const char* operation,
            std::optional<port_mapping> mapping = std::nullopt) const;

    void create_mapping_impl(const port_mapping& mapping, mapping_completion handler);
    void delete_mapping_impl(const port_mapping& mapping, delete_completion handler);
    void get_all_mappings_impl(list_completion handler);
    void get_external_address_impl(address_completion handler);
    void get_specific_mapping_impl(protocol type, uint16_t public_port,
            mapping_completion handler);
    // Deletes @p mapping and unregisters it on success, without wrapping the
    // error. Shared by `async_delete_mapping` and the teardown.
    void remove_mapping(const port_mapping& mapping, delete_handler handler);
    void release_all_impl(std::function<void()> handler);
    void release_next(std::shared_ptr<release_all_op> op);

    void register_mapping(const port_mapping& mapping);
    void unregister_mapping(const port_mapping& mapping);
};

} // natdev

#include "impl/device.ipp"

#endif // NATDEV_DEVICE_HEADER
