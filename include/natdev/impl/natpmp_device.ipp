#ifndef NATDEV_NATPMP_DEVICE_IMPL
#define NATDEV_NATPMP_DEVICE_IMPL

#include "../natpmp_device.hpp"
#include "../log.hpp"

#include <cstdint>
#include <system_error>
#include <utility>

#include <endian/endian.hpp>

#include <asio/bind_executor.hpp>
#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>

namespace natdev {

inline natpmp_device::natpmp_device(asio::io_context& io_context,
        const asio::ip::address& gateway_address, natpmp_options options,
        std::shared_ptr<spdlog::logger> logger)
    : device(io_context, gateway_address, logger)
    , strand_(io_context.get_executor())
    , socket_(io_context)
    , timer_(io_context)
    , options_(options)
    , natpmp_logger_(logger ? std::move(logger) : log::get("natpmp"))
{
    socket_.connect(gateway_endpoint(), open_error_);
    if(open_error_) {
        natpmp_logger_->warn("cannot reach NAT-PMP server at {}:{}: {}",
                gateway_address.to_string(), options_.port,
                open_error_.message());
        error_code ignored;
        socket_.close(ignored);
    }
}

inline void natpmp_device::do_create_mapping(const port_mapping& mapping,
        create_handler handler)
{
    enqueue(mapping_request{mapping, std::move(handler)});
}

inline void natpmp_device::do_delete_mapping(const port_mapping& mapping,
        delete_handler handler)
{
    enqueue(remove_request{mapping, std::move(handler)});
}

inline void natpmp_device::do_get_external_address(address_handler handler)
{
    enqueue(address_request{std::move(handler)});
}

inline void natpmp_device::do_get_all_mappings(list_handler handler)
{
    asio::post(strand_, [handler = std::move(handler)] {
        handler(make_error_code(error::mapping_errc::operation_not_supported), {});
    });
}

inline void natpmp_device::do_get_specific_mapping(protocol, uint16_t,
        create_handler handler)
{
    asio::post(strand_, [handler = std::move(handler)] {
        handler(make_error_code(error::mapping_errc::operation_not_supported), {});
    });
}

inline void natpmp_device::enqueue(pending_request request)
{
    // Posting also guarantees that the handler is not invoked from within the
    // initiating function.
    asio::post(strand_, [this, request = std::move(request)]() mutable {
        pending_requests_.push_back(std::move(request));
        if(pending_requests_.size() == 1) {
            // No pending requests (other than the one just added), we're free
            // to request away.
            execute_request();
        }
    });
}

inline asio::const_buffer natpmp_device::prep_request_message(
        const pending_request& request)
{
    if(std::holds_alternative<address_request>(request)) {
        return detail::prep_public_address_request_message(send_buffer_.data());
    } else if(std::holds_alternative<mapping_request>(request)) {
        return detail::prep_mapping_request_message(send_buffer_.data(),
                std::get<mapping_request>(request).mapping);
    } else {
        return detail::prep_remove_mapping_request_message(send_buffer_.data(),
                std::get<remove_request>(request).mapping);
    }
}

inline void natpmp_device::execute_request()
{
    const auto id = ++current_request_id_;
    send_error_ = error_code();
    timed_out_ = false;

    if(open_error_) {
        asio::post(strand_, [this] { complete_current_request(open_error_, 0); });
        return;
    }

    const auto message = prep_request_message(pending_requests_.front());
    natpmp_logger_->debug("sending {} byte request to {}", message.size(),
            address().to_string());

    // Send the request...
    socket_.async_send(message, asio::bind_executor(strand_,
            [this, id, size = message.size()](error_code error, std::size_t num_sent) {
                if(id != current_request_id_) { return; }
                if(!error && num_sent != size) {
                    error = std::make_error_code(std::errc::bad_message);
                }
                if(error) {
                    // The pending receive is the one that completes the request.
                    send_error_ = error;
                    error_code ignored;
                    socket_.cancel(ignored);
                }
            }));

    // ...and simultaneously initiate a receive operation.
    receive_response(id);

    timer_.expires_after(options_.request_timeout);
    timer_.async_wait(asio::bind_executor(strand_, [this, id](error_code error) {
        if(error || (id != current_request_id_) || pending_requests_.empty()) {
            return;
        }
        natpmp_logger_->warn("NAT-PMP request to {} timed out after {} ms",
                address().to_string(), options_.request_timeout.count());
        timed_out_ = true;
        error_code ignored;
        socket_.cancel(ignored);
    }));
}

inline void natpmp_device::receive_response(uint64_t request_id)
{
    socket_.async_receive(asio::buffer(receive_buffer_), asio::bind_executor(strand_,
            [this, request_id](error_code error, std::size_t num_received) {
                if(request_id != current_request_id_) { return; }
                if(!error && !answers_current_request(num_received)) {
                    natpmp_logger_->debug("discarding {} byte datagram from {}, "
                            "it does not answer the current request",
                            num_received, address().to_string());
                    receive_response(request_id);
                    return;
                }
                on_response(error, num_received);
            }));
}

inline bool natpmp_device::answers_current_request(std::size_t num_received) const
{
    const auto& request = pending_requests_.front();
    const port_mapping* mapping = nullptr;
    int opcode = detail::opcode::public_address;
    if(std::holds_alternative<mapping_request>(request)) {
        mapping = &std::get<mapping_request>(request).mapping;
    } else if(std::holds_alternative<remove_request>(request)) {
        mapping = &std::get<remove_request>(request).mapping;
    }
    if(mapping) {
        opcode = detail::mapping_opcode(mapping->type);
    }

    if(num_received < 2) {
        return false;
    }
    // NOTE: need to cast to unsigned since char can has a max value of 127.
    if(static_cast<uint8_t>(receive_buffer_[1]) != 128 + opcode) {
        return false;
    }
    // Mapping responses echo the private port of their request. Shorter
    // datagrams are left for the parser to reject.
    if(mapping && (num_received >= detail::natpmp_mapping_response_size)) {
        const auto private_port = endian::read<endian::order::network, uint16_t>(
                &receive_buffer_[8]);
        return private_port == mapping->private_port;
    }
    return true;
}

inline void natpmp_device::on_response(error_code error, std::size_t num_received)
{
    timer_.cancel();
    if(error == asio::error::operation_aborted) {
        if(send_error_) {
            error = send_error_;
        } else if(timed_out_) {
            error = make_error_code(error::mapping_errc::unreachable);
        }
    }
    complete_current_request(error, num_received);
}

inline void natpmp_device::complete_current_request(
        error_code error, std::size_t num_received)
{
    auto request = std::move(pending_requests_.front());
    pending_requests_.pop_front();

    if(std::holds_alternative<address_request>(request)) {
        complete(std::get<address_request>(request), error, num_received);
    } else if(std::holds_alternative<mapping_request>(request)) {
        complete(std::get<mapping_request>(request), error, num_received);
    } else {
        complete(std::get<remove_request>(request), error, num_received);
    }

    // Even if this one was a failure, try to execute the next request.
    if(!pending_requests_.empty()) { execute_request(); }
}

inline void natpmp_device::complete(address_request& request,
        error_code error, std::size_t num_received)
{
    asio::ip::address public_address;
    if(!error) {
        public_address = detail::parse_public_address_response(
                receive_buffer_.data(), num_received, error);
    }
    request.handler(error, public_address);
}

inline void natpmp_device::complete(mapping_request& request,
        error_code error, std::size_t num_received)
{
    const auto& requested = request.mapping;
    port_mapping mapping;
    if(!error) {
        mapping = detail::parse_mapping_response(receive_buffer_.data(),
                num_received, detail::mapping_opcode(requested.type), error);
    }
    if(error) {
        request.handler(error, {});
        return;
    }

    // The gateway maps the sender of the request.
    mapping.private_address = requested.private_address;
    if(mapping.private_address.is_unspecified()) {
        error_code ignored;
        mapping.private_address = socket_.local_endpoint(ignored).address();
    }
    mapping.description = requested.description;
    mapping.public_address = requested.public_address;
    natpmp_logger_->debug("{} created for {}s", to_string(mapping),
            mapping.lifetime.count());
    request.handler(error, std::move(mapping));
}

inline void natpmp_device::complete(remove_request& request,
        error_code error, std::size_t num_received)
{
    if(!error) {
        detail::parse_mapping_response(receive_buffer_.data(), num_received,
                detail::mapping_opcode(request.mapping.type), error);
    }
    request.handler(error);
}

} // natdev

#endif // NATDEV_NATPMP_DEVICE_IMPL
