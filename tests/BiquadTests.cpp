// ==============================================================================
// Unit Tests: Biquad
// ==============================================================================

#include <catch2/catch.hpp>

#include "dsp/Biquad.h"
#include "TestHelpers.h"

using namespace colourdsp;

namespace
{
FilterCoefficients makeSimpleTaps()
{
    FilterCoefficients c;
    c.b0 = 0.5;
    c.b1 = 0.25;
    c.b2 = 0.125;
    c.a1 = -0.5;
    c.a2 = 0.25;
    return c;
}
} // namespace

TEST_CASE("Default biquad passes audio through", "[biquad]")
{
    Biquad filter;
    for (const float x : { 0.25f, -1.0f, 0.75f, 0.0f })
        CHECK(filter.processSample(x) == x);
}

TEST_CASE("Impulse response follows the direct form I recursion", "[biquad]")
{
    Biquad filter;
    filter.setCoefficients(makeSimpleTaps());

    CHECK(filter.processSample(1.0f) == Approx(0.5f));
    CHECK(filter.processSample(0.0f) == Approx(0.5f));
    CHECK(filter.processSample(0.0f) == Approx(0.25f));
    CHECK(filter.processSample(0.0f) == Approx(0.0f).margin(1e-12));
}

TEST_CASE("setCoefficients keeps history and reset clears it", "[biquad]")
{
    Biquad filter;
    filter.setCoefficients(makeSimpleTaps());
    filter.processSample(1.0f);

    const auto before = filter.getState();
    CHECK(before.x1 == 1.0);
    CHECK(before.y1 == 0.5);

    FilterCoefficients other;
    REQUIRE(makePeakCoefficients(48000.0, 1000.0, 1.0, 6.0, other) == Status::ok);
    filter.setCoefficients(other);

    const auto after = filter.getState();
    CHECK(after.x1 == before.x1);
    CHECK(after.y1 == before.y1);
    CHECK(filter.getCoefficients().b0 == other.b0);

    filter.reset();
    const auto cleared = filter.getState();
    CHECK(cleared.x1 == 0.0);
    CHECK(cleared.x2 == 0.0);
    CHECK(cleared.y1 == 0.0);
    CHECK(cleared.y2 == 0.0);
}

TEST_CASE("processBlock matches per-sample processing", "[biquad]")
{
    FilterCoefficients c;
    REQUIRE(makePeakCoefficients(44100.0, 440.0, 100.0, 20.0, c) == Status::ok);

    Biquad perSample;
    Biquad block;
    perSample.setCoefficients(c);
    block.setCoefficients(c);

    auto input = testutil::makeNoise(1024);
    std::vector<float> expected(input.size());
    for (size_t i = 0; i < input.size(); ++i)
        expected[i] = perSample.processSample(input[i]);

    block.processBlock(input.data(), static_cast<int>(input.size()));
    CHECK(testutil::maxAbsDifference(expected, input) < 1e-6f);
    CHECK(block.getState().y1 == Approx(perSample.getState().y1));
}

TEST_CASE("processBlock ignores empty input", "[biquad]")
{
    Biquad filter;
    filter.setCoefficients(makeSimpleTaps());
    filter.processBlock(nullptr, 16);

    float sample = 1.0f;
    filter.processBlock(&sample, 0);

    CHECK(sample == 1.0f);
    CHECK(filter.getState().x1 == 0.0);
}
