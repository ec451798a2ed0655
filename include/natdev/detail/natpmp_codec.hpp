#ifndef NATDEV_NATPMP_CODEC_HEADER
#define NATDEV_NATPMP_CODEC_HEADER

#include "../port_mapping.hpp"
#include "../error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <system_error>

#include <endian/endian.hpp>
#include <asio/buffer.hpp>
#include <asio/ip/address.hpp>

namespace natdev {
namespace detail {

// Message formats are described in RFC 6886, sections 3.2 and 3.3. Every
// multi-byte field is in network byte order.

enum opcode
{
    public_address = 0,
    udp_mapping = 1,
    tcp_mapping = 2,
};

constexpr std::size_t natpmp_public_address_request_size = 2;
constexpr std::size_t natpmp_public_address_response_size = 12;
constexpr std::size_t natpmp_mapping_request_size = 12;
constexpr std::size_t natpmp_mapping_response_size = 16;
constexpr std::size_t natpmp_max_message_size = 16;

inline int mapping_opcode(protocol type) noexcept
{
    return type == protocol::udp ? opcode::udp_mapping : opcode::tcp_mapping;
}

inline asio::const_buffer prep_public_address_request_message(char* buffer)
{
    buffer[0] = 0;
    buffer[1] = opcode::public_address;
    return asio::buffer(buffer, natpmp_public_address_request_size);
}

inline asio::const_buffer prep_mapping_request_message(
        char* buffer, const port_mapping& mapping)
{
    buffer[0] = 0;
    buffer[1] = static_cast<char>(mapping_opcode(mapping.type));
    // Reserved.
    buffer[2] = 0;
    buffer[3] = 0;
    endian::write<endian::order::network, uint16_t>(mapping.private_port, &buffer[4]);
    endian::write<endian::order::network, uint16_t>(mapping.public_port, &buffer[6]);
    endian::write<endian::order::network, uint32_t>(
            static_cast<uint32_t>(mapping.lifetime.count()), &buffer[8]);
    return asio::buffer(buffer, natpmp_mapping_request_size);
}

/**
 * A mapping is removed by requesting it again with a zero lifetime and a zero
 * suggested public port.
 */
inline asio::const_buffer prep_remove_mapping_request_message(
        char* buffer, const port_mapping& mapping)
{
    auto request = mapping;
    request.public_port = 0;
    request.lifetime = std::chrono::seconds(0);
    return prep_mapping_request_message(buffer, request);
}

/**
 * Checks the fields common to all responses: version, the opcode that must
 * echo @p opcode and the result code.
 */
inline void verify_response_header(const char* buffer, std::size_t size,
        int opcode, error_code& error)
{
    error = error_code();
    if(size < 4) {
        error = std::make_error_code(std::errc::bad_message);
        return;
    }
    // Version code must be zero.
    if(buffer[0] != 0) {
        error = make_error_code(error::natpmp::unsupported_version);
        return;
    }
    // The protocol number must be 128 + opcode.
    // NOTE: need to cast to unsigned since char can has a max value of 127.
    if(static_cast<uint8_t>(buffer[1]) != 128 + opcode) {
        error = make_error_code(error::natpmp::invalid_opcode);
        return;
    }
    const auto errc = endian::read<endian::order::network, uint16_t>(&buffer[2]);
    if(errc > static_cast<uint16_t>(error::natpmp::unsupported_opcode)) {
        error = make_error_code(error::natpmp::unknown_error);
    } else if(errc != 0) {
        error = make_error_code(static_cast<error::natpmp>(errc));
    }
}

inline asio::ip::address parse_public_address_response(
        const char* buffer, std::size_t size, error_code& error)
{
    verify_response_header(buffer, size, opcode::public_address, error);
    if(error) {
        return {};
    }
    if(size < natpmp_public_address_response_size) {
        error = std::make_error_code(std::errc::bad_message);
        return {};
    }
    return asio::ip::address_v4(endian::read<endian::order::network,
            uint32_t>(&buffer[8]));
}

/**
 * Parses the response to a mapping request. Only the ports and the lifetime
 * are filled in, the rest of the mapping is up to the caller.
 */
inline port_mapping parse_mapping_response(const char* buffer, std::size_t size,
        int opcode, error_code& error)
{
    verify_response_header(buffer, size, opcode, error);
    if(error) {
        return {};
    }
    if(size < natpmp_mapping_response_size) {
        error = std::make_error_code(std::errc::bad_message);
        return {};
    }

    port_mapping mapping;
    mapping.type = opcode == opcode::tcp_mapping ? protocol::tcp : protocol::udp;
    mapping.private_port = endian::read<endian::order::network, uint16_t>(&buffer[8]);
    mapping.public_port = endian::read<endian::order::network, uint16_t>(&buffer[10]);
    mapping.lifetime = std::chrono::seconds(
            endian::read<endian::order::network, uint32_t>(&buffer[12]));
    return mapping;
}

} // detail
} // natdev

#endif // NATDEV_NATPMP_CODEC_HEADER
