#include <doctest/doctest.h>
#include "wqlink/uplink_connection.hpp"
#include "fakes.hpp"

using namespace wqlink;
using wqlink::test::FakeClock;
using wqlink::test::FakeTransport;

namespace {

ConnectionPolicy policy(bool keep_alive = true, uint32_t renewal = 60000) {
    ConnectionPolicy p;
    p.keep_alive = keep_alive;
    p.renewal_interval_ms = renewal;
    p.connect_timeout_ms = 5000;
    p.connect_poll_ms = 100;
    return p;
}

} // namespace

TEST_CASE("disconnected -> opened, then reused") {
    FakeClock clock(1000);
    FakeTransport tcp(clock);
    Endpoint ep;
    ep.host = "10.1.2.3";
    ep.port = 8123;
    UplinkConnection conn(tcp, clock, ep, policy());

    CHECK(conn.state() == ConnectionState::Disconnected);
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    CHECK(conn.is_connected());
    CHECK(conn.last_activity_ms() == 1000);
    CHECK(tcp.last_host == "10.1.2.3");
    CHECK(tcp.last_port == 8123);

    clock.advance(1000);
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Reused);
    CHECK(tcp.opens == 1);
    CHECK(tcp.closes == 0);
}

TEST_CASE("keep-alive off closes and reopens on every use") {
    FakeClock clock;
    FakeTransport tcp(clock);
    UplinkConnection conn(tcp, clock, Endpoint{}, policy(false));

    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    CHECK(tcp.opens == 2);
    CHECK(tcp.closes == 1);
}

TEST_CASE("renewal closes a connection idle for the interval") {
    FakeClock clock;
    FakeTransport tcp(clock);
    UplinkConnection conn(tcp, clock, Endpoint{}, policy(true, 60000));

    REQUIRE(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    clock.advance(59999);
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Reused);
    clock.advance(1);
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Renewed);
    CHECK(tcp.closes == 1);
    CHECK(tcp.opens == 2);
    CHECK(conn.last_activity_ms() == 60000);
}

TEST_CASE("exchanges keep a busy connection from being renewed") {
    FakeClock clock;
    FakeTransport tcp(clock);
    UplinkConnection conn(tcp, clock, Endpoint{}, policy(true, 60000));

    REQUIRE(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    for (int s = 1; s <= 180; ++s) {
        clock.advance(1000);
        CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Reused);
        conn.note_activity(clock.now_ms());
    }
    CHECK(tcp.opens == 1);
    CHECK(conn.last_activity_ms() == 180000);

    // idle from here on: renewal is measured from the last exchange
    clock.advance(59999);
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Reused);
    clock.advance(1);
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Renewed);
}

TEST_CASE("note_activity() is ignored while disconnected") {
    FakeClock clock(500);
    FakeTransport tcp(clock);
    UplinkConnection conn(tcp, clock, Endpoint{}, policy());

    REQUIRE(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    conn.discard();
    conn.note_activity(9000);
    CHECK(conn.last_activity_ms() == 500);
}

TEST_CASE("renewal survives 32-bit clock wrap") {
    FakeClock clock(0xFFFFFF00u);
    FakeTransport tcp(clock);
    UplinkConnection conn(tcp, clock, Endpoint{}, policy(true, 1000));

    REQUIRE(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    clock.advance(500);                          // wraps past zero
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Reused);
    clock.advance(600);
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Renewed);
}

TEST_CASE("a peer-closed connection is reopened before use") {
    FakeClock clock;
    FakeTransport tcp(clock);
    UplinkConnection conn(tcp, clock, Endpoint{}, policy());

    REQUIRE(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    tcp.drop_peer();
    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::PeerClosed);
    CHECK(conn.is_connected());
    CHECK(tcp.opens == 2);
}

TEST_CASE("connect attempts are bounded by the connect window") {
    FakeClock clock;
    FakeTransport tcp(clock);
    tcp.connect_default = false;
    UplinkConnection conn(tcp, clock, Endpoint{}, policy());

    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Failed);
    CHECK(conn.state() == ConnectionState::Disconnected);
    CHECK(clock.now_ms() >= 5000);
    CHECK(clock.now_ms() < 5000 + 100 + 1);
    CHECK(conn.last_connect_ms() >= 5000);
    CHECK(tcp.open_attempts == 50);
    CHECK(tcp.opens == 0);
}

TEST_CASE("connect retries until one attempt succeeds") {
    FakeClock clock;
    FakeTransport tcp(clock);
    tcp.connect_script = {false, false, true};
    UplinkConnection conn(tcp, clock, Endpoint{}, policy());

    CHECK(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    CHECK(tcp.open_attempts == 3);
    CHECK(clock.now_ms() == 200);
    CHECK(conn.last_connect_ms() == 200);
}

TEST_CASE("guarded I/O never reaches the transport while disconnected") {
    FakeClock clock;
    FakeTransport tcp(clock);
    UplinkConnection conn(tcp, clock, Endpoint{}, policy());

    const uint8_t data[3] = {1, 2, 3};
    uint8_t buf[8];
    size_t n = 99;
    CHECK(conn.write(data, sizeof(data)) == transport::TxResult::Error);
    CHECK_FALSE(conn.flush());
    CHECK(conn.available() == 0);
    CHECK(conn.read(buf, sizeof(buf), n) == transport::RxResult::Error);
    CHECK(n == 0);
    CHECK_FALSE(conn.peer_alive());
    CHECK(tcp.sends_while_closed == 0);
    CHECK(tcp.reads_while_closed == 0);
    CHECK(tcp.requests.empty());
}

TEST_CASE("discard() is idempotent") {
    FakeClock clock;
    FakeTransport tcp(clock);
    UplinkConnection conn(tcp, clock, Endpoint{}, policy());

    conn.discard();
    CHECK(conn.state() == ConnectionState::Disconnected);
    REQUIRE(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    conn.discard();
    conn.discard();
    CHECK(conn.state() == ConnectionState::Disconnected);
    CHECK(tcp.closes == 1);
}
