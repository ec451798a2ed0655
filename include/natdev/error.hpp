#ifndef NATDEV_ERROR_HEADER
#define NATDEV_ERROR_HEADER

#include "port_mapping.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <asio/error.hpp>
#include <asio/ip/address.hpp>

namespace natdev {

using asio::error_code;
using asio::error_category;

namespace error {

/** Device level failures that don't originate in a specific protocol. */
enum class mapping_errc
{
    // The device has no mapping for the requested protocol and port.
    not_found = 1,
    // The protocol driver cannot express the operation (e.g. NAT-PMP has no
    // way to enumerate mappings).
    operation_not_supported,
    // The requested public port is already mapped to another host.
    conflict,
    // The mapping's fields are not valid for the target network stack.
    invalid_mapping,
    // The device did not answer in time.
    unreachable
};

struct mapping_error_category : public natdev::error_category
{
    const char* name() const noexcept override { return "natdev.mapping"; }
    std::string message(int ev) const override
    {
        switch(static_cast<mapping_errc>(ev)) {
        case mapping_errc::not_found: return "No such mapping";
        case mapping_errc::operation_not_supported: return "Operation not supported by device";
        case mapping_errc::conflict: return "Conflict with existing mapping";
        case mapping_errc::invalid_mapping: return "Invalid mapping";
        case mapping_errc::unreachable: return "Device unreachable";
        default: return "Unknown";
        }
    }
};

inline const mapping_error_category& get_mapping_error_category()
{
    static mapping_error_category instance;
    return instance;
}

/** Result codes of a NAT-PMP response header (RFC 6886 section 3.5). */
enum class natpmp
{
    unsupported_version = 1,
    // E.g. box supports mapping but user has turned feature off.
    unauthorized = 2,
    // E.g. box hasn't obtained a DHCP lease.
    network_failure = 3,
    // Box cannot create any more mappings at this time.
    out_of_resources = 4,
    unsupported_opcode = 5,
    // The response did not answer the request that was sent.
    invalid_opcode = 6,
    unknown_error
};

struct natpmp_error_category : public natdev::error_category
{
    const char* name() const noexcept override { return "natpmp"; }
    std::string message(int ev) const override
    {
        switch(static_cast<natpmp>(ev)) {
        case natpmp::unsupported_version: return "Unsupported version";
        case natpmp::unauthorized: return "Unauthorized";
        case natpmp::network_failure: return "Network failure";
        case natpmp::out_of_resources: return "Out of resources";
        case natpmp::unsupported_opcode: return "Unsupported opcode";
        case natpmp::invalid_opcode: return "Invalid opcode in response";
        default: return "Unknown";
        }
    }
};

inline const natpmp_error_category& get_natpmp_error_category()
{
    static natpmp_error_category instance;
    return instance;
}

inline error_code make_error_code(mapping_errc ec)
{
    return error_code(static_cast<int>(ec), get_mapping_error_category());
}

inline error_code make_error_code(natpmp ec)
{
    return error_code(static_cast<int>(ec), get_natpmp_error_category());
}

} // error

/**
 * The failure of a single device operation together with its context.
 *
 * `code()` is the underlying cause as reported by the protocol driver or the
 * transport, so callers can tell e.g. `error::mapping_errc::conflict` (retry
 * with another port) from `error::mapping_errc::unreachable` (no answer).
 */
class mapping_error : public std::system_error
{
    std::string operation_;
    asio::ip::address device_address_;
    std::optional<port_mapping> mapping_;

public:
    mapping_error(error_code cause, std::string operation,
            asio::ip::address device_address,
            std::optional<port_mapping> mapping = std::nullopt)
        : std::system_error(cause,
                describe(operation, device_address, mapping))
        , operation_(std::move(operation))
        , device_address_(std::move(device_address))
        , mapping_(std::move(mapping))
    {}

    const std::string& operation() const noexcept { return operation_; }
    const asio::ip::address& device_address() const noexcept { return device_address_; }
    const std::optional<port_mapping>& mapping() const noexcept { return mapping_; }

private:
    static std::string describe(const std::string& operation,
            const asio::ip::address& device_address,
            const std::optional<port_mapping>& mapping)
    {
        std::string what = operation + " on " + device_address.to_string();
        if(mapping) {
            what += " for " + to_string(*mapping);
        }
        return what;
    }
};

} // natdev

namespace std {
template<> struct is_error_code_enum<natdev::error::mapping_errc> : public true_type {};
template<> struct is_error_code_enum<natdev::error::natpmp> : public true_type {};
} // std

#endif // NATDEV_ERROR_HEADER
