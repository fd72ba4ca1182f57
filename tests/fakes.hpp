#pragma once
/**
 * @file fakes.hpp
 * @brief In-memory capabilities for driving the uplink without sockets or ADCs.
 *
 * - FakeClock: time moves only when someone sleeps or the test advances it.
 * - FakeTransport: scripted connect results and replies; every request is
 *   recorded. A reply becomes readable `delay_ms` after the request was sent,
 *   measured on the FakeClock, so response windows behave as in the field.
 * - FakeAnalog: per-channel scripted raw values with a fallback.
 * - FakeLink: a settable link-up flag.
 */

#include <cstring>
#include <initializer_list>
#include <deque>
#include <string>
#include <vector>

#include "wqlink/adc/adc_base.hpp"
#include "wqlink/clock.hpp"
#include "wqlink/link_status.hpp"
#include "wqlink/transport/transport_base.hpp"

namespace wqlink {
namespace test {

class FakeClock : public IClock {
public:
    explicit FakeClock(uint32_t start = 0) : now_(start) {}

    uint32_t now_ms() const override { return now_; }
    void sleep_ms(uint32_t ms) override { now_ += ms; slept_ += ms; ++sleeps_; }

    void set(uint32_t t) { now_ = t; }
    void advance(uint32_t ms) { now_ += ms; }

    uint64_t slept() const { return slept_; }
    uint32_t sleeps() const { return sleeps_; }

private:
    uint32_t now_;
    uint64_t slept_{0};
    uint32_t sleeps_{0};
};

/// Canned HTTP reply head (and optional body).
inline std::string http_reply(uint16_t code, const char* reason = "OK", const std::string& body = "{}") {
    return "HTTP/1.1 " + std::to_string(code) + " " + reason + "\r\n"
           "Content-Type: application/json\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "\r\n" + body;
}

class FakeTransport : public transport::ITransport {
public:
    struct Reply {
        std::string bytes;
        uint32_t    delay_ms{0};
        bool        close_after{false};   ///< peer closes once the bytes are read
    };

    explicit FakeTransport(FakeClock& clock) : clock_(clock) {}

    // ---- script ----
    bool begin_ok{true};
    bool connect_default{true};
    std::deque<bool>  connect_script;     ///< consumed by open(), then connect_default
    std::deque<Reply> replies;            ///< one consumed per successful send()
    uint32_t fail_writes{0};              ///< next N sends fail
    bool     fail_flush{false};

    void reply(const std::string& bytes, uint32_t delay_ms = 0, bool close_after = false) {
        replies.push_back(Reply{bytes, delay_ms, close_after});
    }
    void reply_status(uint16_t code, const char* reason = "OK") { reply(http_reply(code, reason)); }

    /// Silence: the request is swallowed and nothing ever comes back.
    void reply_nothing() { reply(std::string(), 0, false); }

    /// Collector closes the idle connection.
    void drop_peer() { peer_gone_ = true; }

    // ---- observations ----
    std::vector<std::string> requests;
    uint32_t opens{0};
    uint32_t open_attempts{0};
    uint32_t closes{0};
    uint32_t sends_while_closed{0};
    uint32_t reads_while_closed{0};
    std::string last_host;
    uint16_t    last_port{0};

    bool is_open() const { return open_; }
    size_t pending_rx() const { return rx_.size() + pending_.size(); }

    // ---- ITransport ----
    bool begin() override { return begin_ok; }

    bool open(const char* host, uint16_t port, uint32_t) override {
        ++open_attempts;
        last_host = host;
        last_port = port;
        bool ok = connect_default;
        if (!connect_script.empty()) {
            ok = connect_script.front();
            connect_script.pop_front();
        }
        if (!ok) return false;
        open_ = true;
        peer_gone_ = false;
        rx_.clear();
        pending_.clear();
        ++opens;
        return true;
    }

    void close() override {
        if (open_) ++closes;
        open_ = false;
        peer_gone_ = false;
        rx_.clear();
        pending_.clear();
    }

    bool connected() const override {
        if (!open_) return false;
        promote();
        return !(peer_gone_ && rx_.empty());
    }

    size_t available() const override {
        if (!open_) return 0;
        promote();
        return rx_.size();
    }

    transport::RxResult recv(uint8_t* out, size_t cap, size_t& out_len) override {
        out_len = 0;
        if (!open_) { ++reads_while_closed; return transport::RxResult::Error; }
        promote();
        if (rx_.empty()) return peer_gone_ ? transport::RxResult::Error : transport::RxResult::None;
        const size_t n = rx_.size() < cap ? rx_.size() : cap;
        std::memcpy(out, rx_.data(), n);
        rx_.erase(0, n);
        out_len = n;
        return transport::RxResult::Ok;
    }

    transport::TxResult send(const uint8_t* data, size_t len) override {
        if (!open_) { ++sends_while_closed; return transport::TxResult::Error; }
        if (fail_writes > 0) { --fail_writes; return transport::TxResult::Error; }
        requests.emplace_back(reinterpret_cast<const char*>(data), len);
        if (!replies.empty()) {
            const Reply r = replies.front();
            replies.pop_front();
            pending_       = r.bytes;
            ready_at_      = clock_.now_ms() + r.delay_ms;
            close_after_   = r.close_after;
        }
        return transport::TxResult::Ok;
    }

    bool flush() override { return open_ && !fail_flush; }

    const char* name() const override { return "fake"; }

private:
    // Move a due reply into the readable buffer.
    void promote() const {
        if (pending_.empty() && !close_after_) return;
        if (elapsed_ms(clock_.now_ms(), ready_at_) > 0x7FFFFFFFu) return;   // not yet due
        rx_ += pending_;
        pending_.clear();
        if (close_after_) { peer_gone_ = true; close_after_ = false; }
    }

    FakeClock& clock_;
    bool open_{false};
    mutable bool        peer_gone_{false};
    mutable std::string rx_;
    mutable std::string pending_;
    mutable bool        close_after_{false};
    uint32_t ready_at_{0};
};

class FakeAnalog : public adc::IAnalogInput {
public:
    static constexpr uint8_t CHANNELS = 8;

    bool begin_ok{true};

    void set(uint8_t channel, uint16_t value) { fallback_[channel] = value; }
    void script(uint8_t channel, std::initializer_list<uint16_t> values) {
        for (uint16_t v : values) script_[channel].push_back(v);
    }

    uint32_t reads(uint8_t channel) const { return reads_[channel]; }
    uint32_t total_reads() const {
        uint32_t n = 0;
        for (uint32_t r : reads_) n += r;
        return n;
    }

    bool begin() override { return begin_ok; }

    uint16_t read_raw(uint8_t channel) override {
        ++reads_[channel];
        if (!script_[channel].empty()) {
            const uint16_t v = script_[channel].front();
            script_[channel].pop_front();
            return v;
        }
        return fallback_[channel];
    }

    const char* name() const override { return "fake"; }

private:
    std::deque<uint16_t> script_[CHANNELS];
    uint16_t fallback_[CHANNELS]{};
    uint32_t reads_[CHANNELS]{};
};

class FakeLink : public ILinkStatus {
public:
    bool up{true};
    bool link_up() const override { return up; }
};

} // namespace test
} // namespace wqlink
