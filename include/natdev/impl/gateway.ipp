#ifndef NATDEV_GATEWAY_IMPL
#define NATDEV_GATEWAY_IMPL

#if defined(__linux__)
# define NATDEV_USE_PROC_NET
#endif

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

#include <endian/endian.hpp>
#include <asio/error.hpp>
#include <asio/ip/address.hpp>

namespace natdev {

/* Example route file:
Iface	Destination	Gateway 	Flags	RefCnt	Use	Metric	Mask		MTU	Window	IRTT
wlp7s0	00000000	0100A8C0	0003	0	0	600	00000000	0	0	0
wlp7s0	0000A8C0	00000000	0001	0	0	600	00FFFFFF	0	0	0
*/
inline asio::ip::address parse_default_gateway(
        std::istream& route_table, error_code& error)
{
    error = error_code();
    std::string line;
    // Ignore the header line.
    std::getline(route_table, line);
    while(std::getline(route_table, line))
    {
        // Ignore the interface identifier by trimming up to the first whitespace char.
        line.erase(line.cbegin(), std::find_if(line.cbegin(), line.cend(),
            [](const char c) { return std::isspace(static_cast<unsigned char>(c)); }));
        std::stringstream ss;
        ss << std::hex << line;
        uint32_t dest;
        uint32_t gateway;
        if(!(ss >> dest >> gateway)) {
            continue;
        }
        if((dest == 0) && (gateway != 0))
        {
            // The table stores addresses in the architecture's byte order, but
            // since stringstream reads the digits as a big endian number, we
            // have to manually convert it if the system is not big endian.
            if(endian::order::host == endian::order::little)
                return asio::ip::address_v4(endian::reverse(gateway));
            else
                return asio::ip::address_v4(gateway);
        }
    }
    error = make_error_code(error::mapping_errc::not_found);
    return asio::ip::address_v4(0);
}

inline asio::ip::address default_gateway_address(error_code& error)
{
#ifdef NATDEV_USE_PROC_NET
    std::ifstream file("/proc/net/route");
    if(!file)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return asio::ip::address_v4(0);
    }
    return parse_default_gateway(file, error);
#else
    error = make_error_code(asio::error::operation_not_supported);
    return asio::ip::address_v4(0);
#endif
}

} // natdev

#endif // NATDEV_GATEWAY_IMPL
