#include <catch2/catch.hpp>

#include <natdev/port_mapping.hpp>

using namespace natdev;

namespace {

port_mapping mapping(protocol type, uint16_t public_port, uint16_t private_port)
{
    port_mapping m;
    m.type = type;
    m.private_address = asio::ip::make_address("10.0.0.2");
    m.private_port = private_port;
    m.public_port = public_port;
    m.description = "game";
    return m;
}

} // namespace

TEST_CASE("Mappings are identified by protocol and public port", "[port_mapping]")
{
    const auto m = mapping(protocol::udp, 27015, 27015);

    auto other_host = mapping(protocol::udp, 27015, 1234);
    other_host.private_address = asio::ip::make_address("10.0.0.3");
    other_host.description = "someone else";
    REQUIRE(same_mapping(m, other_host));
    REQUIRE(m == other_host);

    REQUIRE_FALSE(same_mapping(m, mapping(protocol::tcp, 27015, 27015)));
    REQUIRE(m != mapping(protocol::udp, 27016, 27015));
}

TEST_CASE("Mappings are printed with their own protocol", "[port_mapping]")
{
    REQUIRE(to_string(mapping(protocol::udp, 27015, 27016))
            == "Udp 27015 --> 10.0.0.2:27016 (game)");
    REQUIRE(to_string(mapping(protocol::tcp, 80, 8080))
            == "Tcp 80 --> 10.0.0.2:8080 (game)");
}
