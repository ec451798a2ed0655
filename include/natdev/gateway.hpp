#ifndef NATDEV_GATEWAY_HEADER
#define NATDEV_GATEWAY_HEADER

#include "error.hpp"

#include <istream>

#include <asio/ip/address.hpp>

namespace natdev {

/**
 * @brief Returns the IP address of the default gateway that is configured for
 * this host.
 *
 * The implementation does not make any network requests. It instead parses
 * OS dependent config files. Only Linux is supported at the moment; elsewhere
 * @p error is set to `asio::error::operation_not_supported`.
 *
 * @param error The variable through which errors are reported.
 *
 * @return The default gateway address if no error occurred. Otherwise the
 * return value is an unspecified `asio::ip::address_v4` object.
 */
asio::ip::address default_gateway_address(error_code& error);

/**
 * @brief Finds the default route in a routing table in the format of Linux's
 * `/proc/net/route`.
 *
 * If the table has no default route, @p error is set to
 * `error::mapping_errc::not_found`.
 */
asio::ip::address parse_default_gateway(std::istream& route_table, error_code& error);

} // natdev

#include "impl/gateway.ipp"

#endif // NATDEV_GATEWAY_HEADER
