#ifndef NATDEV_NATPMP_DEVICE_HEADER
#define NATDEV_NATPMP_DEVICE_HEADER

#include "device.hpp"
#include "port_mapping.hpp"
#include "error.hpp"
#include "detail/natpmp_codec.hpp"

#include <array>
#include <cstddef>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <variant>

#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/udp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <spdlog/logger.h>

namespace natdev {

struct natpmp_options
{
    // The port on which the gateway listens for NAT-PMP requests.
    uint16_t port = 5351;
    // How long to wait for the gateway's response to a single request before
    // failing it with `error::mapping_errc::unreachable`. There are no
    // retransmissions.
    std::chrono::milliseconds request_timeout{2000};
};

/**
 * @brief A gateway controlled through the NAT-PMP protocol (RFC 6886).
 *
 * NAT-PMP has no way of listing mappings, so @ref async_get_all_mappings and
 * @ref async_get_specific_mapping always fail with
 * `error::mapping_errc::operation_not_supported`.
 *
 * Only a single request may be outstanding to the gateway at any given time;
 * requests issued meanwhile are queued up and sent in order. Datagrams that
 * don't answer the request in flight, such as the late response to a request
 * that timed out, are discarded.
 *
 * The gateway keeps one mapping per protocol and private port, and that is
 * what a deletion names. The registry follows suit, so deleting the
 * originally requested mapping also unregisters the one that was granted
 * with another public port.
 *
 * @par Thread Safety
 * @e Distinct @e objects: Safe.@n
 * @e Shared @e objects: Safe. All socket work is serialized on a strand.
 */
class natpmp_device : public device
{
    struct address_request
    {
        address_handler handler;
    };

    struct mapping_request
    {
        port_mapping mapping;
        create_handler handler;
    };

    struct remove_request
    {
        port_mapping mapping;
        delete_handler handler;
    };

    using pending_request = std::variant<address_request,
            mapping_request, remove_request>;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket socket_;
    asio::steady_timer timer_;
    natpmp_options options_;
    std::shared_ptr<spdlog::logger> natpmp_logger_;

    // Set if the socket could not be connected to the gateway, in which case
    // every request fails with it.
    error_code open_error_;

    // The currently executed request is the first item of the queue and is
    // only removed once it's been served. Only accessed on `strand_`.
    std::deque<pending_request> pending_requests_;

    // Identifies the request in flight so that late completions of a previous
    // request's socket and timer operations are ignored.
    uint64_t current_request_id_ = 0;
    error_code send_error_;
    bool timed_out_ = false;

    std::array<char, detail::natpmp_mapping_request_size> send_buffer_;
    std::array<char, detail::natpmp_max_message_size> receive_buffer_;

public:
    /**
     * Constructs a device for the NAT-PMP server of @p gateway_address.
     *
     * @param io_context The io_context object that the datagram socket will use
     * to dispatch handlers for any asynchronous operations performed on this
     * object.
     *
     * @param gateway_address Usually the host's default gateway, see
     * @ref default_gateway_address.
     */
    natpmp_device(asio::io_context& io_context,
            const asio::ip::address& gateway_address,
            natpmp_options options = natpmp_options(),
            std::shared_ptr<spdlog::logger> logger = nullptr);

    const char* protocol_name() const noexcept override { return "natpmp"; }

    /** The UDP endpoint of the gateway's NAT-PMP server. */
    asio::ip::udp::endpoint gateway_endpoint() const
    {
        return asio::ip::udp::endpoint(address(), options_.port);
    }

protected:
    bool same_device_mapping(const port_mapping& owned,
            const port_mapping& deleted) const noexcept override
    {
        return (owned.type == deleted.type)
            && (owned.private_port == deleted.private_port);
    }

    void do_create_mapping(const port_mapping& mapping,
            create_handler handler) override;
    void do_delete_mapping(const port_mapping& mapping,
            delete_handler handler) override;
    void do_get_all_mappings(list_handler handler) override;
    void do_get_external_address(address_handler handler) override;
    void do_get_specific_mapping(protocol type, uint16_t public_port,
            create_handler handler) override;

private:
    void enqueue(pending_request request);
    void execute_request();
    void receive_response(uint64_t request_id);
    bool answers_current_request(std::size_t num_received) const;
    asio::const_buffer prep_request_message(const pending_request& request);
    void on_response(error_code error, std::size_t num_received);
    void complete_current_request(error_code error, std::size_t num_received);
    void complete(address_request& request, error_code error,
            std::size_t num_received);
    void complete(mapping_request& request, error_code error,
            std::size_t num_received);
    void complete(remove_request& request, error_code error,
            std::size_t num_received);
};

} // natdev

#include "impl/natpmp_device.ipp"

#endif // NATDEV_NATPMP_DEVICE_HEADER
