#include <iostream>
#include <string>
#include <cmath>
#include <cstdint>
#include <optional>
#include "CLI/CLI11.hpp"

#include "wqlink/clock.hpp"
#include "wqlink/codec.hpp"
#include "wqlink/config.hpp"
#include "wqlink/health_monitor.hpp"            // classify(), to_string(CycleResult)
#include "wqlink/request_pipeline.hpp"          // RequestPipeline, Outcome
#include "wqlink/transport/transport_linux_tcp.hpp"
#include "wqlink/uplink_connection.hpp"

// One exchange with the collector, with hand-picked values:
//   wqlink-probe --host 10.0.0.5 --T 12.5 --PH 7.1 --C 480
// Prints one status=... line and maps the outcome to the exit code.
int main(int argc, char** argv) {
  CLI::App app{"wqlink probe: send one reading and report the collector's answer"};

  wqlink::Config cfg;
  double t = 0.0, ph = 7.0, c = 0.0;
  bool keep_alive = false;

  app.add_option("--host", cfg.endpoint.host, "Collector host")->capture_default_str();
  app.add_option("--port", cfg.endpoint.port, "Collector port")->capture_default_str();
  app.add_option("--path", cfg.endpoint.path, "Request path")->capture_default_str();
  // same ranges the calibrated front-end can produce
  app.add_option("--T", t, "Turbidity (NTU)")->required()->check(CLI::Range(0.0, 1000.0));
  app.add_option("--PH", ph, "pH")->required()->check(CLI::Range(0.0, 14.0));
  app.add_option("--C", c, "Conductivity (uS/cm)")->required()->check(CLI::Range(0.0, 1500.0));
  app.add_option("--timeout", cfg.request_timeout_ms, "Response window (ms)")->capture_default_str();
  app.add_option("--connect-timeout", cfg.connect_timeout_ms, "Connection-attempt window (ms)")->capture_default_str();
  app.add_flag("--keep-alive", keep_alive, "Send Connection: keep-alive instead of close");

  CLI11_PARSE(app, argc, argv);

  cfg.keep_alive = keep_alive;
  std::string err;
  if (!wqlink::validate(cfg, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 2;
  }
  if (!std::isfinite(t) || !std::isfinite(ph) || !std::isfinite(c)) {
    std::cerr << "status=error reason=value_not_finite\n";
    return 2;
  }

  wqlink::SensorReading reading;
  reading.turbidity_ntu      = static_cast<float>(t);
  reading.ph                 = static_cast<float>(ph);
  reading.conductivity_us_cm = static_cast<float>(c);
  const std::optional<wqlink::codec::Body> encoded = wqlink::codec::encode(reading);
  if (!encoded) {
    std::cerr << "status=error reason=value_not_encodable\n";
    return 2;
  }
  const wqlink::codec::Body& body = *encoded;

  wqlink::SteadyClock clock;
  wqlink::transport::LinuxTcp tcp(cfg.request_timeout_ms);
  if (!tcp.begin()) {
    std::cerr << "status=fatal reason=transport_unavailable\n";
    return 10;
  }

  wqlink::UplinkConnection conn(tcp, clock, cfg.endpoint, wqlink::connection_policy(cfg));
  wqlink::RequestPipeline  pipe(conn, clock, wqlink::pipeline_policy(cfg));

  // -------- connect --------
  if (conn.ensure_connection(clock.now_ms()) == wqlink::EnsureResult::Failed) {
    std::cerr << "status=error reason=connect_failed host=" << cfg.endpoint.host
              << " port=" << cfg.endpoint.port
              << " elapsed_ms=" << conn.last_connect_ms() << "\n";
    return 1;
  }

  // -------- send --------
  if (!pipe.send(body)) {
    std::cerr << "status=error reason=write_failed\n";
    return 1;
  }

  // -------- receive --------
  const wqlink::Outcome out = pipe.receive(cfg.request_timeout_ms);
  conn.discard();

  const wqlink::CycleResult result = wqlink::classify(out.status_code, out.malformed);
  std::ostream& os = (result == wqlink::CycleResult::Accepted
                   || result == wqlink::CycleResult::Ignored) ? std::cout : std::cerr;
  os << "status=" << wqlink::to_string(result);
  if (out.status_code) os << " code=" << *out.status_code;
  os << " elapsed_ms=" << out.elapsed_ms
     << " body=" << body.c_str() << "\n";

  switch (result) {
    case wqlink::CycleResult::Accepted:  return 0;
    case wqlink::CycleResult::Ignored:   return 5;
    case wqlink::CycleResult::Rejected:  return 4;
    case wqlink::CycleResult::Answered:  return 6;
    default:                             return 3;   // timeout / malformed
  }
}
