/**
 * @file main.cpp
 * @brief wqlink node runner - long-running Linux wrapper around wqlink::Uplink.
 *
 * Responsibilities:
 *  - Build the effective Config: defaults, then `--config <file.json>`, then flags.
 *  - Pick capabilities: LinuxTcp transport, IIO or simulated ADC, sysfs or
 *    always-up link signal.
 *  - Probe hardware once (`begin()`); a missing transport or ADC is fatal.
 *  - Run uplink.tick(now) until stopped, drain events after every cycle and
 *    print them as key=value lines or JSON lines.
 *  - Optionally persist stats + last reading to a state file after each cycle.
 *
 * Exit codes:
 *  - 0  stopped cleanly (signal, --once, --count reached)
 *  - 2  bad command line or configuration
 *  - 10 fatal: transport or analog front-end missing
 *
 * Notes:
 *  - Error-severity events go to stderr, everything else to stdout.
 *  - SIGINT/SIGTERM finish the current tick, close the connection, then exit.
 *  - State file layout:
 *      {"updated_ms", "last_result", "last_reading":{T,PH,C},
 *       "health":{...}, "stats":{...}}
 */

#include <array>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "wqlink/adc/adc_linux_iio.hpp"
#include "wqlink/adc/adc_simulated.hpp"
#include "wqlink/clock.hpp"
#include "wqlink/codec.hpp"
#include "wqlink/config.hpp"
#include "wqlink/config_file.hpp"
#include "wqlink/event_format.hpp"
#include "wqlink/link_status.hpp"
#include "wqlink/transport/link_linux_sysfs.hpp"
#include "wqlink/transport/transport_linux_tcp.hpp"
#include "wqlink/uplink.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace wqlink;

static constexpr int EXIT_USAGE = 2;
static constexpr int EXIT_FATAL = 10;
static constexpr uint32_t IDLE_SLEEP_MS = 10;

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

// ---------- small utilities ----------

static uint64_t now_ms_system() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static int fail(const char* status, const std::string& reason, int code) {
  std::cerr << "status=" << status << " reason=" << reason << "\n";
  return code;
}

// tmp + rename so a reader never sees a half-written file
static bool atomic_write_json(const fs::path& p, const json& j) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) return false;
  }
  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << j.dump(2) << "\n";
    out.flush();
    if (!out) return false;
  }
  fs::rename(tmp, p, ec);
  return !ec;
}

static json state_to_json(const Uplink& uplink) {
  json st;
  st["updated_ms"]  = now_ms_system();
  st["last_result"] = to_string(uplink.last_result());
  if (uplink.has_reading()) {
    const SensorReading& r = uplink.last_reading();
    st["last_reading"] = {
      {"T",  codec::round2(r.turbidity_ntu)},
      {"PH", codec::round2(r.ph)},
      {"C",  codec::round2(r.conductivity_us_cm)},
      {"sampled_at_ms", r.sampled_at_ms},
    };
  }
  const HealthCounters& h = uplink.health().counters();
  st["health"] = {
    {"consecutive_timeouts", h.consecutive_timeouts},
    {"last_success_ms",      h.last_success_ms},
    {"has_success",          h.has_success},
    {"connected",            uplink.connection().is_connected()},
  };
  st["stats"] = stats_to_json(uplink.stats());
  return st;
}

static void print_event(const Event& ev, bool as_json) {
  std::ostream& os = (ev.severity == Severity::Error) ? std::cerr : std::cout;
  if (as_json) os << event_to_json(ev).dump() << "\n";
  else         os << format_event(ev) << "\n";
}

static void drain_events(Uplink& uplink, bool as_json) {
  Event ev;
  while (uplink.get_event(ev)) print_event(ev, as_json);
}

// ---------- main ----------

int main(int argc, char** argv) {
  Config cfg;

  // Pass 1: find --config by scanning argv, so the file lands under the flags.
  std::string opt_config;
  for (int i = 1; i < argc; ++i) {
    const std::string t = argv[i];
    if (t == "--config" && i + 1 < argc)   opt_config = argv[i + 1];
    else if (t.rfind("--config=", 0) == 0) opt_config = t.substr(9);
  }
  if (!opt_config.empty()) {
    std::string err;
    if (!load_config_file(opt_config, cfg, err)) return fail("error", err, EXIT_USAGE);
  }

  // Pass 2: every flag writes straight into cfg, only when given.
  bool        opt_once = false;
  uint32_t    opt_count = 0;
  std::string opt_format = "kv";
  std::string opt_state_file;
  bool        opt_print_config = false;

  // CLI11 reads uint8_t as a character; go through wider temporaries.
  unsigned samples   = cfg.sampler.samples;
  unsigned max_to    = cfg.max_consecutive_timeouts;
  unsigned ch_turb   = cfg.channels.turbidity;
  unsigned ch_ph     = cfg.channels.ph;
  unsigned ch_cond   = cfg.channels.conductivity;

  CLI::App app{"wqlink node: sample, encode and deliver water-quality readings"};

  app.add_option("--config", opt_config, "JSON config file (flags override it)");
  app.add_flag("--once", opt_once, "Run a single cycle and exit");
  app.add_option("--count", opt_count, "Stop after N cycles (0 = run until signalled)");
  app.add_option("--format", opt_format, "Event output: kv|json")->check(CLI::IsMember({"kv", "json"}));
  app.add_option("--state-file", opt_state_file, "Write stats and last reading here after each cycle");
  app.add_flag("--print-config", opt_print_config, "Print effective config as JSON and exit");

  // endpoint
  app.add_option("--host", cfg.endpoint.host, "Collector host")->capture_default_str();
  app.add_option("--port", cfg.endpoint.port, "Collector port")->capture_default_str();
  app.add_option("--path", cfg.endpoint.path, "Request path")->capture_default_str();

  // loop / keep-alive
  app.add_option("--sample-interval-ms", cfg.sample_interval_ms, "Tick period")->capture_default_str();
  app.add_option("--keep-alive", cfg.keep_alive, "Reuse one connection across ticks (true|false)")->capture_default_str();
  app.add_option("--renewal-interval-ms", cfg.renewal_interval_ms, "Proactive keep-alive renewal")->capture_default_str();
  app.add_option("--request-timeout-ms", cfg.request_timeout_ms, "Response window")->capture_default_str();
  app.add_option("--connect-timeout-ms", cfg.connect_timeout_ms, "Connection-attempt window")->capture_default_str();
  app.add_option("--connect-poll-ms", cfg.connect_poll_ms, "Pause between connect attempts")->capture_default_str();
  app.add_option("--response-poll-ms", cfg.response_poll_ms, "Pause between empty response polls")->capture_default_str();
  app.add_option("--max-timeouts", max_to, "Consecutive timeouts before a forced reconnect")
     ->capture_default_str()->check(CLI::Range(1u, 255u));
  app.add_option("--stale-warning-ms", cfg.stale_warning_ms, "Warn after this long without a 200 (0 = off)")->capture_default_str();
  app.add_option("--report-interval-ms", cfg.report_interval_ms, "Throttle for success/warning events")->capture_default_str();
  app.add_option("--reading-report-ms", cfg.reading_report_ms, "Throttle for reading events")->capture_default_str();
  app.add_option("--drain-cap", cfg.drain_cap_bytes, "Residual-byte drain bound")->capture_default_str();

  // sampler / hardware
  app.add_option("--samples", samples, "Reads averaged per sample")->capture_default_str()->check(CLI::Range(1u, 255u));
  app.add_option("--pause-ms", cfg.sampler.pause_ms, "Pause between reads")->capture_default_str();
  app.add_option("--ch-turbidity", ch_turb, "ADC channel for turbidity")->capture_default_str()->check(CLI::Range(0u, 255u));
  app.add_option("--ch-ph", ch_ph, "ADC channel for pH")->capture_default_str()->check(CLI::Range(0u, 255u));
  app.add_option("--ch-conductivity", ch_cond, "ADC channel for conductivity")->capture_default_str()->check(CLI::Range(0u, 255u));
  app.add_option("--link-interface", cfg.link_interface, "Interface whose operstate gates sending (empty = always up)");
  app.add_option("--adc-device", cfg.adc_device, "IIO device dir (empty = simulated front-end)");

  CLI11_PARSE(app, argc, argv);

  cfg.sampler.samples          = static_cast<uint8_t>(samples);
  cfg.max_consecutive_timeouts = static_cast<uint8_t>(max_to);
  cfg.channels.turbidity       = static_cast<uint8_t>(ch_turb);
  cfg.channels.ph              = static_cast<uint8_t>(ch_ph);
  cfg.channels.conductivity    = static_cast<uint8_t>(ch_cond);

  {
    std::string err;
    if (!validate(cfg, err)) return fail("error", err, EXIT_USAGE);
  }

  if (opt_print_config) {
    std::cout << config_to_json(cfg).dump(2) << "\n";
    return 0;
  }

  const bool as_json = (opt_format == "json");
  if (opt_once) opt_count = 1;

  // ---- capabilities ----
  SteadyClock clock;
  transport::LinuxTcp tcp(cfg.request_timeout_ms);

  std::unique_ptr<adc::IAnalogInput> analog;
  if (cfg.adc_device.empty()) {
    analog = std::make_unique<adc::Simulated>();
  } else {
    analog = std::make_unique<adc::LinuxIio>(
        cfg.adc_device,
        std::array<uint8_t, 3>{cfg.channels.turbidity, cfg.channels.ph, cfg.channels.conductivity});
  }

  std::unique_ptr<ILinkStatus> link;
  if (cfg.link_interface.empty()) {
    link = std::make_unique<AlwaysUpLink>();
  } else {
    auto sysfs = std::make_unique<transport::LinuxSysfsLink>(cfg.link_interface);
    if (!sysfs->present()) return fail("error", "link_interface_missing", EXIT_USAGE);
    link = std::move(sysfs);
  }

  if (!tcp.begin())     return fail("fatal", "transport_unavailable", EXIT_FATAL);
  if (!analog->begin()) return fail("fatal", "adc_unavailable", EXIT_FATAL);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  Uplink uplink(cfg, *analog, tcp, *link, clock);

  std::cout << "status=started endpoint=" << cfg.endpoint.host << ":" << cfg.endpoint.port
            << " path=" << cfg.endpoint.path
            << " transport=" << tcp.name()
            << " adc=" << analog->name()
            << " keep_alive=" << (cfg.keep_alive ? 1 : 0) << "\n";

  uint32_t cycles = 0;
  bool state_ok = true;
  while (!g_stop) {
    if (uplink.tick(clock.now_ms())) {
      ++cycles;
      drain_events(uplink, as_json);
      if (!opt_state_file.empty()) {
        const bool ok = atomic_write_json(opt_state_file, state_to_json(uplink));
        if (!ok && state_ok) std::cerr << "status=error reason=state_write_failed\n";
        state_ok = ok;
      }
      if (opt_count > 0 && cycles >= opt_count) break;
    }
    clock.sleep_ms(IDLE_SLEEP_MS);
  }

  uplink.shutdown();
  drain_events(uplink, as_json);

  const UplinkStats& s = uplink.stats();
  std::cout << "status=stopped cycles=" << s.cycles
            << " accepted=" << s.accepted
            << " timeouts=" << s.timeouts
            << " rejected=" << s.rejected
            << " forced_reconnects=" << s.forced_reconnects << "\n";
  return 0;
}
