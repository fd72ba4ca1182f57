#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "wqlink/adc/adc_linux_iio.hpp"
#include "wqlink/adc/adc_simulated.hpp"
#include "wqlink/transport/link_linux_sysfs.hpp"
#include "wqlink/clock.hpp"
#include "wqlink/request_pipeline.hpp"
#include "wqlink/transport/transport_linux_tcp.hpp"
#include "wqlink/uplink_connection.hpp"

using namespace wqlink;
namespace fs = std::filesystem;

namespace {

fs::path scratch(const char* name) {
    fs::path p = fs::temp_directory_path() / name;
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

void write_file(const fs::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::trunc);
    out << text;
}

} // namespace

TEST_CASE("LinuxIio: begin() needs every mapped channel, reads clamp to 12 bits") {
    const fs::path dev = scratch("wqlink_iio_test");
    write_file(dev / "in_voltage0_raw", "1234\n");
    write_file(dev / "in_voltage1_raw", "5000\n");

    adc::LinuxIio missing(dev.string(), {0, 1, 2});
    CHECK_FALSE(missing.begin());

    write_file(dev / "in_voltage2_raw", "-7\n");
    adc::LinuxIio iio(dev.string(), {0, 1, 2});
    REQUIRE(iio.begin());
    CHECK(iio.read_raw(0) == 1234);
    CHECK(iio.read_raw(1) == 4095);
    CHECK(iio.read_raw(2) == 0);

    fs::remove(dev / "in_voltage0_raw");          // a failed read holds the last value
    CHECK(iio.read_raw(0) == 1234);
    fs::remove_all(dev);
}

TEST_CASE("LinuxIio: empty device path is not a front-end") {
    adc::LinuxIio iio("", {0, 1, 2});
    CHECK_FALSE(iio.begin());
}

TEST_CASE("Simulated front-end stays in range and is deterministic") {
    adc::Simulated a(42), b(42);
    REQUIRE(a.begin());
    for (int i = 0; i < 3000; ++i) {
        const uint8_t ch = static_cast<uint8_t>(i % 3);
        const uint16_t va = a.read_raw(ch);
        REQUIRE(va <= adc::RAW_MAX);
        REQUIRE(va == b.read_raw(ch));
    }
}

TEST_CASE("LinuxSysfsLink: up and unknown count as up") {
    const fs::path root = scratch("wqlink_net_test");
    fs::create_directories(root / "wlan0");

    transport::LinuxSysfsLink link("wlan0", root.string());
    CHECK_FALSE(link.present());
    CHECK_FALSE(link.link_up());

    write_file(root / "wlan0" / "operstate", "down\n");
    CHECK(link.present());
    CHECK_FALSE(link.link_up());

    write_file(root / "wlan0" / "operstate", "up\n");
    CHECK(link.link_up());

    write_file(root / "wlan0" / "operstate", "unknown\n");
    CHECK(link.link_up());
    fs::remove_all(root);
}

TEST_CASE("LinuxTcp: nothing reachable on a closed port") {
    transport::LinuxTcp tcp;
    REQUIRE(tcp.begin());
    CHECK_FALSE(tcp.connected());
    CHECK(tcp.available() == 0);
    CHECK_FALSE(tcp.open("127.0.0.1", 1, 200));
    tcp.close();
    tcp.close();
    CHECK_FALSE(tcp.connected());
}

TEST_CASE("LinuxTcp: one exchange against a loopback collector") {
    const int lfd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(lfd >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(lfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(lfd, 1) == 0);
    socklen_t alen = sizeof(addr);
    REQUIRE(::getsockname(lfd, reinterpret_cast<sockaddr*>(&addr), &alen) == 0);
    const uint16_t port = ntohs(addr.sin_port);

    std::string seen;
    std::thread collector([lfd, &seen] {
        const int cfd = ::accept(lfd, nullptr, nullptr);
        if (cfd < 0) return;
        char buf[256];
        while (seen.empty() || seen.back() != '}') {       // body is the last thing sent
            const ssize_t n = ::recv(cfd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            seen.append(buf, static_cast<size_t>(n));
        }
        const char reply[] = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n{}";
        (void)::send(cfd, reply, sizeof(reply) - 1, MSG_NOSIGNAL);
        ::usleep(100 * 1000);
        ::close(cfd);
    });

    Config cfg;
    cfg.endpoint.port = port;
    SteadyClock clock;
    transport::LinuxTcp tcp(cfg.request_timeout_ms);
    REQUIRE(tcp.begin());
    UplinkConnection conn(tcp, clock, cfg.endpoint, connection_policy(cfg));
    RequestPipeline pipe(conn, clock, pipeline_policy(cfg));

    REQUIRE(conn.ensure_connection(clock.now_ms()) == EnsureResult::Opened);
    REQUIRE(pipe.send(codec::Body("{\"T\":1.00,\"PH\":7.00,\"C\":2.00}")));
    const Outcome out = pipe.receive(cfg.request_timeout_ms);
    conn.discard();
    collector.join();
    ::close(lfd);

    REQUIRE(out.status_code.has_value());
    CHECK(*out.status_code == 200);
    CHECK(out.header_ended);
    CHECK(seen.rfind("POST /water-monitor/publish HTTP/1.1\r\n", 0) == 0);
    CHECK(seen.find("Host: 127.0.0.1:" + std::to_string(port) + "\r\n") != std::string::npos);
}
