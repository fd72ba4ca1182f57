#include <doctest/doctest.h>
#include "wqlink/sampler.hpp"
#include "fakes.hpp"

using namespace wqlink;
using wqlink::test::FakeAnalog;
using wqlink::test::FakeClock;

TEST_CASE("sample() returns the integer mean of N reads") {
    FakeAnalog adc;
    FakeClock clock;
    SamplerPolicy policy;
    policy.samples = 4;
    policy.pause_ms = 2;
    Sampler s(adc, clock, policy, ChannelMap{});

    adc.script(0, {100, 101, 102, 104});       // 407 / 4 = 101.75
    CHECK(s.sample(0) == 101);
    CHECK(adc.reads(0) == 4);
}

TEST_CASE("sample() stays within min/max of the reads taken") {
    FakeAnalog adc;
    FakeClock clock;
    SamplerPolicy policy;
    policy.samples = 10;
    Sampler s(adc, clock, policy, ChannelMap{});

    adc.script(1, {0, 4095, 17, 3000, 2048, 1, 4094, 999, 5, 2500});
    const RawSample v = s.sample(1);
    CHECK(v <= 4095);
    CHECK(v == (0 + 4095 + 17 + 3000 + 2048 + 1 + 4094 + 999 + 5 + 2500) / 10);
}

TEST_CASE("sample() pauses between reads only") {
    FakeAnalog adc;
    FakeClock clock(1000);
    SamplerPolicy policy;
    policy.samples = 10;
    policy.pause_ms = 2;
    Sampler s(adc, clock, policy, ChannelMap{});

    (void)s.sample(0);
    CHECK(clock.sleeps() == 9);
    CHECK(clock.now_ms() == 1018);
}

TEST_CASE("out-of-range backend values are clamped to 12 bits") {
    FakeAnalog adc;
    FakeClock clock;
    SamplerPolicy policy;
    policy.samples = 2;
    policy.pause_ms = 0;
    Sampler s(adc, clock, policy, ChannelMap{});

    adc.set(2, 60000);
    CHECK(s.sample(2) == 4095);
}

TEST_CASE("convert() hits the calibration endpoints") {
    CHECK(Sampler::convert(0, ChannelKind::Turbidity) == doctest::Approx(1000.0f));
    CHECK(Sampler::convert(4095, ChannelKind::Turbidity) == doctest::Approx(0.0f));
    CHECK(Sampler::convert(0, ChannelKind::Acidity) == doctest::Approx(0.0f));
    CHECK(Sampler::convert(4095, ChannelKind::Acidity) == doctest::Approx(14.0f));
    CHECK(Sampler::convert(0, ChannelKind::Conductivity) == doctest::Approx(0.0f));
    CHECK(Sampler::convert(4095, ChannelKind::Conductivity) == doctest::Approx(1500.0f));
}

TEST_CASE("convert() is monotonic: turbidity falls, pH and conductivity rise") {
    float prev_t = Sampler::convert(0, ChannelKind::Turbidity);
    float prev_p = Sampler::convert(0, ChannelKind::Acidity);
    float prev_c = Sampler::convert(0, ChannelKind::Conductivity);
    for (RawSample raw = 1; raw <= 4095; ++raw) {
        const float t = Sampler::convert(raw, ChannelKind::Turbidity);
        const float p = Sampler::convert(raw, ChannelKind::Acidity);
        const float c = Sampler::convert(raw, ChannelKind::Conductivity);
        REQUIRE(t <= prev_t);
        REQUIRE(p >= prev_p);
        REQUIRE(c >= prev_c);
        REQUIRE(t >= 0.0f);
        REQUIRE(p <= 14.0f);
        REQUIRE(c <= 1500.0f);
        prev_t = t; prev_p = p; prev_c = c;
    }
}

TEST_CASE("read() uses the channel map and stamps the time") {
    FakeAnalog adc;
    FakeClock clock;
    SamplerPolicy policy;
    policy.samples = 1;
    policy.pause_ms = 0;
    ChannelMap map;
    map.turbidity = 5;
    map.ph = 6;
    map.conductivity = 7;
    Sampler s(adc, clock, policy, map);

    adc.set(5, 4095);
    adc.set(6, 4095);
    adc.set(7, 0);
    const SensorReading r = s.read(4242);
    CHECK(r.turbidity_ntu == doctest::Approx(0.0f));
    CHECK(r.ph == doctest::Approx(14.0f));
    CHECK(r.conductivity_us_cm == doctest::Approx(0.0f));
    CHECK(r.sampled_at_ms == 4242);
    CHECK(adc.reads(0) == 0);
}
