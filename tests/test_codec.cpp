#include <doctest/doctest.h>
#include <cmath>
#include <cstring>
#include <string>
#include "wqlink/ajson_config.hpp"   // switches only; ArduinoJson itself is ARDUINO-only
#include "wqlink/codec.hpp"
#include "wqlink/sampler.hpp"

using namespace wqlink;

static SensorReading reading(float t, float ph, float c) {
    SensorReading r;
    r.turbidity_ntu = t;
    r.ph = ph;
    r.conductivity_us_cm = c;
    return r;
}

TEST_CASE("encode() emits exactly three members with two decimals") {
    const auto b = codec::encode(reading(12.5f, 7.0f, 480.0f));
    REQUIRE(b.has_value());
    CHECK(std::string(b->c_str()) == "{\"T\":12.50,\"PH\":7.00,\"C\":480.00}");
}

TEST_CASE("mid-scale raw 2048 on every channel encodes to the calibrated body") {
    const SensorReading r = reading(Sampler::convert(2048, ChannelKind::Turbidity),
                                    Sampler::convert(2048, ChannelKind::Acidity),
                                    Sampler::convert(2048, ChannelKind::Conductivity));
    const auto b = codec::encode(r);
    REQUIRE(b.has_value());
    CHECK(std::string(b->c_str()) == "{\"T\":499.88,\"PH\":7.00,\"C\":750.18}");
    CHECK(b->size() == 33);
}

TEST_CASE("encode() handles the full calibrated range") {
    CHECK(std::string(codec::encode(reading(1000.0f, 14.0f, 1500.0f))->c_str())
          == "{\"T\":1000.00,\"PH\":14.00,\"C\":1500.00}");
    CHECK(std::string(codec::encode(reading(0.0f, 0.0f, 0.0f))->c_str())
          == "{\"T\":0.00,\"PH\":0.00,\"C\":0.00}");
}

TEST_CASE("encode() refuses values that would not make a whole body") {
    CHECK_FALSE(codec::encode(reading(3e38f, 7.0f, 480.0f)).has_value());
    CHECK_FALSE(codec::encode(reading(12.5f, 7.0f, -3e38f)).has_value());
    CHECK_FALSE(codec::encode(reading(NAN, 7.0f, 480.0f)).has_value());
    CHECK_FALSE(codec::encode(reading(12.5f, INFINITY, 480.0f)).has_value());
}

TEST_CASE("round2() rounds half away from zero") {
    CHECK(codec::round2(0.125) == doctest::Approx(0.13));
    CHECK(codec::round2(-0.125) == doctest::Approx(-0.13));
    CHECK(codec::round2(7.0017) == doctest::Approx(7.00));
    CHECK(codec::round2(499.878) == doctest::Approx(499.88));
}

TEST_CASE("decode() recovers encoded values within 0.01") {
    const SensorReading r = reading(333.333f, 6.789f, 1234.567f);
    const auto b = codec::encode(r);
    REQUIRE(b.has_value());
    const auto d = codec::decode(b->c_str(), b->size());
    REQUIRE(d.has_value());
    CHECK(std::abs(d->turbidity - r.turbidity_ntu) <= 0.01);
    CHECK(std::abs(d->ph - r.ph) <= 0.01);
    CHECK(std::abs(d->conductivity - r.conductivity_us_cm) <= 0.01);
}

TEST_CASE("decode() accepts extra members and integer values") {
    const char* body = "{\"C\":10,\"PH\":7,\"T\":1,\"node\":\"a\"}";
    const auto d = codec::decode(body, std::strlen(body));
    REQUIRE(d.has_value());
    CHECK(d->turbidity == doctest::Approx(1.0));
    CHECK(d->ph == doctest::Approx(7.0));
    CHECK(d->conductivity == doctest::Approx(10.0));
}

TEST_CASE("decode() rejects what the collector would answer 400 to") {
    const char* missing   = "{\"T\":1.0,\"PH\":7.0}";
    const char* wrongtype = "{\"T\":\"1.0\",\"PH\":7.0,\"C\":3}";
    const char* notjson   = "T=1,PH=7,C=3";
    const char* array     = "[1,2,3]";
    CHECK_FALSE(codec::decode(missing, std::strlen(missing)).has_value());
    CHECK_FALSE(codec::decode(wrongtype, std::strlen(wrongtype)).has_value());
    CHECK_FALSE(codec::decode(notjson, std::strlen(notjson)).has_value());
    CHECK_FALSE(codec::decode(array, std::strlen(array)).has_value());
    CHECK_FALSE(codec::decode(nullptr, 0).has_value());
}

TEST_CASE("embedded JSON switches keep 0.01 resolution and reject non-JSON numbers") {
    CHECK(ARDUINOJSON_USE_DOUBLE == 1);
    CHECK(ARDUINOJSON_ENABLE_NAN == 0);
    CHECK(ARDUINOJSON_ENABLE_INFINITY == 0);
    CHECK(ARDUINOJSON_DEFAULT_NESTING_LIMIT >= 1);
}
