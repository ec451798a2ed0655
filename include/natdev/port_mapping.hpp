#ifndef NATDEV_PORT_MAPPING_HEADER
#define NATDEV_PORT_MAPPING_HEADER

#include <chrono>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>

#include <asio/ip/address.hpp>

namespace natdev {

enum class protocol { udp, tcp };

inline const char* to_string(protocol p) noexcept
{
    return p == protocol::tcp ? "Tcp" : "Udp";
}

/**
 * This object represents a forwarding rule between a port on the gateway's
 * WAN facing side and a port of a host on the LAN.
 *
 * A mapping is identified on its device by the pair (`type`, `public_port`),
 * see @ref same_mapping.
 */
struct port_mapping
{
    protocol type = protocol::udp;
    // The LAN host that the gateway forwards to.
    asio::ip::address private_address;
    // The port on which the LAN host will be listening for connections.
    uint16_t private_port = 0;
    // The port on which the router's WAN facing side will be listening for
    // connections.
    //
    // @note For NAT-PMP this is a suggestion and NAT boxes are free to ignore
    // it and map `private_port` to something else.
    uint16_t public_port = 0;
    std::string description;
    // The total lifetime of the mapping. It is advised that the mapping be
    // renewed at an interval half of this value. If it's 0, NAT-PMP boxes
    // choose a suitable value while UPnP ones create a permanent mapping.
    std::chrono::seconds lifetime{0};
    // Restricts the mapping to a single remote host. Unspecified means any.
    asio::ip::address public_address;
};

/** Two mappings denote the same forwarding rule on a device. */
inline bool same_mapping(const port_mapping& a, const port_mapping& b) noexcept
{
    return (a.type == b.type) && (a.public_port == b.public_port);
}

inline bool operator==(const port_mapping& a, const port_mapping& b) noexcept
{
    return same_mapping(a, b);
}

inline bool operator!=(const port_mapping& a, const port_mapping& b) noexcept
{
    return !(a == b);
}

inline std::ostream& operator<<(std::ostream& out, const port_mapping& m)
{
    return out << to_string(m.type)
               << ' ' << m.public_port
               << " --> " << m.private_address
               << ':' << m.private_port
               << " (" << m.description << ')';
}

/** E.g. "Tcp 8080 --> 192.168.1.10:80 (web)". */
inline std::string to_string(const port_mapping& m)
{
    std::ostringstream ss;
    ss << m;
    return ss.str();
}

} // natdev

#endif // NATDEV_PORT_MAPPING_HEADER
