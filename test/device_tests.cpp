#include <catch2/catch.hpp>

#include "mock_device.hpp"

#include <atomic>
#include <exception>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

using namespace natdev;
using natdev::test::error_of;
using natdev::test::make_mapping;
using natdev::test::mock_device;

namespace {

void run(asio::io_context& io)
{
    io.run();
    io.restart();
}

error_code create(asio::io_context& io, device& d, const port_mapping& m)
{
    error_code result = asio::error::would_block;
    d.async_create_mapping(m, [&result](std::exception_ptr error, port_mapping) {
        result = error_of(error);
    });
    run(io);
    return result;
}

error_code remove(asio::io_context& io, device& d, const port_mapping& m)
{
    error_code result = asio::error::would_block;
    d.async_delete_mapping(m, [&result](std::exception_ptr error) {
        result = error_of(error);
    });
    run(io);
    return result;
}

} // namespace

TEST_CASE("Successful creates are owned in insertion order", "[device]")
{
    asio::io_context io;
    mock_device d(io);

    const auto a = make_mapping(protocol::tcp, 8080, 80);
    const auto b = make_mapping(protocol::udp, 5000, 5000);
    const auto c = make_mapping(protocol::tcp, 2222, 22);

    REQUIRE_FALSE(create(io, d, a));
    REQUIRE_FALSE(create(io, d, b));
    REQUIRE_FALSE(create(io, d, c));

    const auto owned = d.owned_mappings();
    REQUIRE(owned.size() == 3);
    REQUIRE(owned[0] == a);
    REQUIRE(owned[1] == b);
    REQUIRE(owned[2] == c);

    SECTION("a successful delete removes only that mapping")
    {
        REQUIRE_FALSE(remove(io, d, b));
        const auto after = d.owned_mappings();
        REQUIRE(after.size() == 2);
        REQUIRE(after[0] == a);
        REQUIRE(after[1] == c);
    }

    SECTION("the same port with another protocol is a different mapping")
    {
        REQUIRE_FALSE(remove(io, d, make_mapping(protocol::udp, 8080, 80)));
        REQUIRE(d.owned_mappings().size() == 3);
    }
}

TEST_CASE("The mapping is registered before the create handler runs", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    const auto m = make_mapping(protocol::tcp, 8080, 80);

    std::size_t num_owned = 0;
    d.async_create_mapping(m, [&](std::exception_ptr error, port_mapping created) {
        REQUIRE_FALSE(error);
        REQUIRE(created == m);
        num_owned = d.owned_mappings().size();
    });
    REQUIRE(d.owned_mappings().empty());
    run(io);
    REQUIRE(num_owned == 1);
}

TEST_CASE("A failed create is not registered", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    d.fail_creates(true);

    const auto error = create(io, d, make_mapping(protocol::tcp, 8080, 80));
    REQUIRE(error == error::mapping_errc::conflict);
    REQUIRE(d.owned_mappings().empty());
}

TEST_CASE("A failed delete stays registered", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    const auto m = make_mapping(protocol::udp, 6000, 6000);
    REQUIRE_FALSE(create(io, d, m));

    d.fail_all_deletes(true);
    REQUIRE(remove(io, d, m) == error::mapping_errc::unreachable);
    REQUIRE(d.owned_mappings().size() == 1);

    d.fail_all_deletes(false);
    REQUIRE_FALSE(remove(io, d, m));
    REQUIRE(d.owned_mappings().empty());
}

TEST_CASE("Deleting a mapping that is not owned succeeds", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    const auto owned = make_mapping(protocol::tcp, 8080, 80);
    REQUIRE_FALSE(create(io, d, owned));

    REQUIRE_FALSE(remove(io, d, make_mapping(protocol::tcp, 9999, 99)));
    REQUIRE(d.owned_mappings().size() == 1);
    REQUIRE(d.delete_attempts().size() == 1);

    SECTION("deleting twice is harmless")
    {
        REQUIRE_FALSE(remove(io, d, owned));
        REQUIRE_FALSE(remove(io, d, owned));
        REQUIRE(d.owned_mappings().empty());
    }
}

TEST_CASE("Renewing a mapping does not register it twice", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    auto m = make_mapping(protocol::tcp, 8080, 80, "first");
    REQUIRE_FALSE(create(io, d, m));
    m.description = "renewed";
    REQUIRE_FALSE(create(io, d, m));

    const auto owned = d.owned_mappings();
    REQUIRE(owned.size() == 1);
    REQUIRE(owned[0].description == "renewed");
}

TEST_CASE("Mappings without a private port are rejected", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    auto m = make_mapping(protocol::tcp, 8080, 0);

    bool called = false;
    d.async_create_mapping(m, [&](std::exception_ptr error, port_mapping) {
        called = true;
        REQUIRE(error_of(error) == error::mapping_errc::invalid_mapping);
    });
    // Not invoked from within the initiating function.
    REQUIRE_FALSE(called);
    run(io);
    REQUIRE(called);
    REQUIRE(d.owned_mappings().empty());
    REQUIRE(d.table().empty());

    REQUIRE(remove(io, d, m) == error::mapping_errc::invalid_mapping);
    REQUIRE(d.delete_attempts().empty());
}

TEST_CASE("Presence refresh only moves last_seen forward", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    REQUIRE_FALSE(create(io, d, make_mapping(protocol::tcp, 8080, 80)));

    const auto before = d.last_seen();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    d.refresh_presence();
    const auto after = d.last_seen();
    REQUIRE(after > before);

    d.refresh_presence();
    REQUIRE(d.last_seen() >= after);
    REQUIRE(d.owned_mappings().size() == 1);
    // No I/O was queued.
    REQUIRE(io.poll() == 0);
}

TEST_CASE("The device's list is independent of the owned mappings", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    const auto foreign = make_mapping(protocol::udp, 3478, 3478, "other client");
    const auto ours = make_mapping(protocol::tcp, 8080, 80);
    d.add_foreign_mapping(foreign);
    REQUIRE_FALSE(create(io, d, ours));

    std::vector<port_mapping> all;
    d.async_get_all_mappings([&](std::exception_ptr error, std::vector<port_mapping> mappings) {
        REQUIRE_FALSE(error);
        all = std::move(mappings);
    });
    run(io);

    REQUIRE(all.size() == 2);
    REQUIRE(d.owned_mappings().size() == 1);
    REQUIRE(d.owned_mappings()[0] == ours);
}

TEST_CASE("Querying a specific mapping", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    const auto m = make_mapping(protocol::tcp, 8080, 80, "web");
    REQUIRE_FALSE(create(io, d, m));

    SECTION("an existing mapping is returned")
    {
        port_mapping found;
        d.async_get_specific_mapping(protocol::tcp, 8080,
                [&](std::exception_ptr error, port_mapping mapping) {
                    REQUIRE_FALSE(error);
                    found = mapping;
                });
        run(io);
        REQUIRE(found == m);
        REQUIRE(found.description == "web");
    }

    SECTION("a missing mapping is an error, not an empty result")
    {
        error_code result;
        d.async_get_specific_mapping(protocol::udp, 8080,
                [&](std::exception_ptr error, port_mapping) {
                    result = error_of(error);
                });
        run(io);
        REQUIRE(result == error::mapping_errc::not_found);
    }
}

TEST_CASE("Querying the external address", "[device]")
{
    asio::io_context io;
    mock_device d(io);
    asio::ip::address address;
    d.async_get_external_address([&](std::exception_ptr error, asio::ip::address a) {
        REQUIRE_FALSE(error);
        address = a;
    });
    run(io);
    REQUIRE(address == asio::ip::make_address("203.0.113.7"));
}

TEST_CASE("Errors carry the device and mapping", "[device][error]")
{
    asio::io_context io;
    mock_device d(io);
    const auto m = make_mapping(protocol::tcp, 8080, 80, "web");
    const auto e = d.make_error(make_error_code(error::mapping_errc::conflict),
            "create_mapping", m);

    REQUIRE(e.code() == error::mapping_errc::conflict);
    REQUIRE(e.device_address() == d.address());
    REQUIRE(e.mapping());
    REQUIRE(*e.mapping() == m);
    REQUIRE(e.operation() == "mock create_mapping");
    const std::string what = e.what();
    REQUIRE_THAT(what, Catch::Contains("192.168.1.1"));
    REQUIRE_THAT(what, Catch::Contains("Tcp 8080 --> 192.168.1.10:80 (web)"));
    REQUIRE_THAT(what, Catch::Contains("Conflict"));
}

TEST_CASE("Failed operations report the device and mapping to the caller", "[device][error]")
{
    asio::io_context io;
    mock_device d(io);
    const auto m = make_mapping(protocol::tcp, 8080, 80, "web");

    SECTION("a rejected create")
    {
        d.fail_creates(true);
        std::exception_ptr failure;
        d.async_create_mapping(m, [&](std::exception_ptr error, port_mapping) {
            failure = error;
        });
        run(io);

        REQUIRE(failure);
        try {
            std::rethrow_exception(failure);
        } catch(const mapping_error& e) {
            REQUIRE(e.code() == error::mapping_errc::conflict);
            REQUIRE(e.operation() == "mock create_mapping");
            REQUIRE(e.device_address() == asio::ip::make_address("192.168.1.1"));
            REQUIRE(e.mapping());
            REQUIRE(*e.mapping() == m);
            REQUIRE(e.mapping()->description == "web");
        }
    }

    SECTION("a failed delete")
    {
        REQUIRE_FALSE(create(io, d, m));
        d.fail_all_deletes(true);
        std::exception_ptr failure;
        d.async_delete_mapping(m, [&](std::exception_ptr error) { failure = error; });
        run(io);

        REQUIRE(failure);
        REQUIRE_THROWS_AS(std::rethrow_exception(failure), mapping_error);
        try {
            std::rethrow_exception(failure);
        } catch(const mapping_error& e) {
            REQUIRE(e.code() == error::mapping_errc::unreachable);
            REQUIRE(e.operation() == "mock delete_mapping");
            REQUIRE(*e.mapping() == m);
            REQUIRE_THAT(std::string(e.what()),
                    Catch::Contains("Tcp 8080 --> 192.168.1.10:80 (web)"));
        }
    }

    SECTION("a missing specific mapping names the queried port")
    {
        std::exception_ptr failure;
        d.async_get_specific_mapping(protocol::udp, 9000,
                [&](std::exception_ptr error, port_mapping) { failure = error; });
        run(io);

        REQUIRE(failure);
        try {
            std::rethrow_exception(failure);
        } catch(const mapping_error& e) {
            REQUIRE(e.code() == error::mapping_errc::not_found);
            REQUIRE(e.operation() == "mock get_specific_mapping");
            REQUIRE(e.mapping());
            REQUIRE(e.mapping()->type == protocol::udp);
            REQUIRE(e.mapping()->public_port == 9000);
        }
    }
}

TEST_CASE("Concurrent creates on one device are all registered", "[device][stress]")
{
    asio::io_context io;
    mock_device d(io);
    constexpr int num_threads = 8;
    constexpr int per_thread = 100;

    std::atomic<int> num_failed{0};
    std::vector<std::thread> issuers;
    for(int t = 0; t < num_threads; ++t) {
        issuers.emplace_back([&, t] {
            for(int i = 0; i < per_thread; ++i) {
                const auto port = static_cast<uint16_t>(10000 + t * per_thread + i);
                d.async_create_mapping(make_mapping(protocol::tcp, port, port),
                        [&](std::exception_ptr error, port_mapping) {
                            if(error) { ++num_failed; }
                        });
            }
        });
    }
    for(auto& t : issuers) { t.join(); }

    std::vector<std::thread> runners;
    for(int t = 0; t < num_threads; ++t) {
        runners.emplace_back([&io] { io.run(); });
    }
    for(auto& t : runners) { t.join(); }

    REQUIRE(num_failed.load() == 0);
    const auto owned = d.owned_mappings();
    REQUIRE(owned.size() == num_threads * per_thread);
    std::set<uint16_t> ports;
    for(const auto& m : owned) { ports.insert(m.public_port); }
    REQUIRE(ports.size() == owned.size());
}
