// ==============================================================================
// Unit Tests: ColourizerEngine
// ==============================================================================

#include <catch2/catch.hpp>

#include "dsp/ColourizerEngine.h"
#include "TestHelpers.h"

#include <cmath>

using namespace colourdsp;

namespace
{
constexpr double kSampleRate = 48000.0;
constexpr int kBlockSize = 512;

juce::AudioBuffer<float> makeBuffer(const std::vector<std::vector<float>>& channels)
{
    const int numSamples = static_cast<int>(channels.front().size());
    juce::AudioBuffer<float> buffer(static_cast<int>(channels.size()), numSamples);
    for (int ch = 0; ch < buffer.getNumChannels(); ++ch)
        buffer.copyFrom(ch, 0, channels[static_cast<size_t>(ch)].data(), numSamples);
    return buffer;
}

std::vector<float> channelOf(const juce::AudioBuffer<float>& buffer, int ch)
{
    const auto* data = buffer.getReadPointer(ch);
    return std::vector<float>(data, data + buffer.getNumSamples());
}

// Filters a mono signal through a one-channel engine at unity gain and full mix.
std::vector<float> processMono(ColourizerEngine& engine, const std::vector<float>& input)
{
    std::vector<float> data = input;
    float* channels[1] { data.data() };
    REQUIRE(engine.process(channels, 1, static_cast<int>(data.size())) == Status::ok);
    return data;
}

std::vector<float> peakReference(double sampleRate, double frequencyHz, const std::vector<float>& input)
{
    FilterCoefficients c;
    REQUIRE(makePeakCoefficients(sampleRate, frequencyHz, 100.0, 20.0, c) == Status::ok);
    Biquad reference;
    reference.setCoefficients(c);
    std::vector<float> out(input.size());
    for (size_t i = 0; i < input.size(); ++i)
        out[i] = reference.processSample(input[i]);
    return out;
}
} // namespace

TEST_CASE("Engine refuses to process before configure", "[engine]")
{
    ColourizerEngine engine;
    CHECK_FALSE(engine.isConfigured());

    auto buffer = makeBuffer({ testutil::makeNoise(64) });
    const auto before = channelOf(buffer, 0);
    CHECK(engine.process(buffer) == Status::notConfigured);
    CHECK(channelOf(buffer, 0) == before);
}

TEST_CASE("configure validates sample rate and channel count", "[engine]")
{
    ColourizerEngine engine;
    CHECK(engine.configure(0.0, 2) == Status::invalidParameter);
    CHECK(engine.configure(kSampleRate, 0) == Status::unsupportedChannelCount);
    CHECK(engine.configure(kSampleRate, -3) == Status::unsupportedChannelCount);
    CHECK_FALSE(engine.isConfigured());

    REQUIRE(engine.configure(kSampleRate, 2) == Status::ok);
    CHECK(engine.isConfigured());
    CHECK(engine.getSampleRate() == kSampleRate);
    CHECK(engine.getNumChannels() == 2);

    auto mono = makeBuffer({ testutil::makeNoise(64) });
    CHECK(engine.process(mono) == Status::unsupportedChannelCount);

    CHECK(engine.process(nullptr, 2, 64) == Status::invalidParameter);

    auto stereo = makeBuffer({ testutil::makeNoise(16), testutil::makeNoise(16, 2u) });
    CHECK(engine.process(stereo.getArrayOfWritePointers(), 2, 0) == Status::ok);
}

TEST_CASE("A rejected configure keeps the previous format", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.configure(kSampleRate, 2) == Status::ok);

    auto params = engine.getParameters();
    params.frequencyHz = 23000.0f;
    CHECK(engine.configure(44100.0, 2, params) == Status::invalidParameter);

    CHECK(engine.isConfigured());
    CHECK(engine.getSampleRate() == kSampleRate);
    CHECK(engine.getParameter("Frequency") == 440.0f);
}

TEST_CASE("Rejected parameter values leave the old value in place", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.configure(kSampleRate, 2) == Status::ok);

    CHECK(engine.setParameter("Dry/Wet", 1.5f) == Status::invalidParameter);
    CHECK(engine.getParameter("Dry/Wet") == 1.0f);

    CHECK(engine.setParameter("Gain", -1.0f) == Status::invalidParameter);
    CHECK(engine.getParameter("Gain") == 1.0f);

    CHECK(engine.setParameter("Frequency", 24000.0f) == Status::invalidParameter);
    CHECK(engine.getParameter("Frequency") == 440.0f);

    CHECK(engine.setParameter("Q", 0.0f) == Status::invalidParameter);
    CHECK(engine.setParameter("Resonance", 1.0f) == Status::invalidParameter);
    CHECK(std::isnan(engine.getParameter("Resonance")));

    CHECK(engine.setParameter("Frequency", 1000.0f) == Status::ok);
    CHECK(engine.getParameter("frequency") == 1000.0f);
}

TEST_CASE("Choice controls accept labels and notes accept flats", "[engine]")
{
    ColourizerEngine engine;

    CHECK(engine.setParameterText("Processing Mode", "Mono") == Status::ok);
    CHECK(engine.getParameter("Processing Mode") == 0.0f);
    CHECK(engine.getParameters().mode == ProcessingMode::mono);

    CHECK(engine.setParameterText("Processing Mode", "Stereo") == Status::invalidParameter);
    CHECK(engine.getParameters().mode == ProcessingMode::mono);

    CHECK(engine.setParameterText("Voicing", "Note Bank") == Status::ok);
    CHECK(engine.getParameters().voicing == Voicing::noteBank);

    CHECK(engine.setParameter("Db", 0.5f) == Status::ok);
    CHECK(engine.getParameter("C#") == 0.5f);
}

TEST_CASE("Zero mix is an exact passthrough", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.setParameter("Dry/Wet", 0.0f) == Status::ok);
    REQUIRE(engine.setParameter("Gain", 3.0f) == Status::ok);
    REQUIRE(engine.configure(kSampleRate, 2) == Status::ok);

    const auto left = testutil::makeNoise(kBlockSize, 11u);
    const auto right = testutil::makeSine(440.0, kSampleRate, kBlockSize);
    auto buffer = makeBuffer({ left, right });
    REQUIRE(engine.process(buffer) == Status::ok);

    CHECK(channelOf(buffer, 0) == left);
    CHECK(channelOf(buffer, 1) == right);
}

TEST_CASE("Full mix outputs gain times the filtered signal", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.setParameter("Gain", 2.0f) == Status::ok);
    REQUIRE(engine.configure(kSampleRate, 1) == Status::ok);

    const auto input = testutil::makeNoise(kBlockSize * 4, 21u);
    const auto output = processMono(engine, input);
    auto expected = peakReference(kSampleRate, 440.0, input);
    for (auto& s : expected)
        s *= 2.0f;

    CHECK(testutil::maxAbsDifference(output, expected) < 1e-5f);
}

TEST_CASE("Half mix averages dry and wet", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.setParameter("Dry/Wet", 0.5f) == Status::ok);
    REQUIRE(engine.configure(kSampleRate, 1) == Status::ok);

    const auto input = testutil::makeNoise(kBlockSize, 4u);
    const auto output = processMono(engine, input);
    const auto wet = peakReference(kSampleRate, 440.0, input);

    for (size_t i = 0; i < input.size(); ++i)
        CHECK(output[i] == Approx(0.5f * input[i] + 0.5f * wet[i]).margin(1e-5));
}

TEST_CASE("Peak is selective at common sample rates", "[engine]")
{
    for (const double sampleRate : { 44100.0, 48000.0, 96000.0 })
    {
        DYNAMIC_SECTION("Sample rate " << sampleRate)
        {
            // Mean |y - x| over the last half second of a 3 s probe.
            auto residual = [sampleRate](double probeHz)
            {
                ColourizerEngine engine;
                REQUIRE(engine.configure(sampleRate, 1) == Status::ok);

                const int numSamples = static_cast<int>(sampleRate * 3.0);
                const auto input = testutil::makeSine(probeHz, sampleRate, numSamples);
                const auto output = processMono(engine, input);
                return testutil::meanAbsDifference(output, input, static_cast<size_t>(sampleRate * 2.5));
            };

            const double onCentre = residual(440.0);
            const double offCentre = residual(450.0);
            CHECK(onCentre > 4.0);
            CHECK(onCentre > 10.0 * offCentre);
        }
    }
}

TEST_CASE("Multi mode serves 32 independent channels", "[engine]")
{
    constexpr int kNumChannels = 32;
    ColourizerEngine engine;
    REQUIRE(engine.configure(kSampleRate, kNumChannels) == Status::ok);
    CHECK(engine.getNumChannels() == kNumChannels);
    CHECK(engine.getChannelProcessor().getNumActiveLanes() == kNumChannels);

    std::vector<std::vector<float>> channels(kNumChannels, std::vector<float>(kBlockSize, 0.0f));
    const auto signal = testutil::makeNoise(kBlockSize, 43u);
    channels.back() = signal;
    auto buffer = makeBuffer(channels);
    REQUIRE(engine.process(buffer) == Status::ok);

    for (int ch = 0; ch < kNumChannels - 1; ++ch)
        CHECK(testutil::meanAbs(channelOf(buffer, ch)) == 0.0);
    CHECK(testutil::maxAbsDifference(channelOf(buffer, kNumChannels - 1),
                                     peakReference(kSampleRate, 440.0, signal)) < 1e-5f);
}

TEST_CASE("Mono and Multi agree on a single channel", "[engine]")
{
    ColourizerEngine multi;
    ColourizerEngine mono;
    REQUIRE(mono.setParameterText("Processing Mode", "Mono") == Status::ok);
    REQUIRE(multi.configure(kSampleRate, 1) == Status::ok);
    REQUIRE(mono.configure(kSampleRate, 1) == Status::ok);

    const auto input = testutil::makeNoise(kBlockSize * 2, 8u);
    CHECK(testutil::maxAbsDifference(processMono(multi, input), processMono(mono, input)) == 0.0f);
}

TEST_CASE("Mono mode writes the same wet signal to every channel", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.setParameterText("Processing Mode", "Mono") == Status::ok);
    REQUIRE(engine.configure(kSampleRate, 2) == Status::ok);

    auto buffer = makeBuffer({ testutil::makeSine(440.0, kSampleRate, kBlockSize),
                               std::vector<float>(kBlockSize, 0.0f) });
    REQUIRE(engine.process(buffer) == Status::ok);
    CHECK(channelOf(buffer, 0) == channelOf(buffer, 1));
    CHECK(engine.getChannelProcessor().getNumActiveLanes() == 1);
}

TEST_CASE("Single-sample blocks match one long block", "[engine]")
{
    ColourizerEngine whole;
    ColourizerEngine sampled;
    REQUIRE(whole.configure(kSampleRate, 1) == Status::ok);
    REQUIRE(sampled.configure(kSampleRate, 1) == Status::ok);

    const auto input = testutil::makeNoise(kBlockSize, 13u);
    const auto expected = processMono(whole, input);

    std::vector<float> data = input;
    for (size_t i = 0; i < data.size(); ++i)
    {
        float* channels[1] { data.data() + i };
        REQUIRE(sampled.process(channels, 1, 1) == Status::ok);
    }

    CHECK(testutil::maxAbsDifference(expected, data) < 1e-6f);
}

TEST_CASE("Reconfiguring with the same format starts from a clean state", "[engine]")
{
    ColourizerEngine once;
    ColourizerEngine twice;
    REQUIRE(once.configure(kSampleRate, 1) == Status::ok);
    REQUIRE(twice.configure(kSampleRate, 1) == Status::ok);

    processMono(twice, testutil::makeSine(440.0, kSampleRate, kBlockSize));
    REQUIRE(twice.configure(kSampleRate, 1) == Status::ok);
    REQUIRE(twice.configure(kSampleRate, 1) == Status::ok);

    const auto input = testutil::makeNoise(kBlockSize, 17u);
    CHECK(processMono(once, input) == processMono(twice, input));
}

TEST_CASE("Topology changes take effect on the next block with cleared history", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.configure(kSampleRate, 2) == Status::ok);

    const auto sine = testutil::makeSine(440.0, kSampleRate, kBlockSize);
    auto buffer = makeBuffer({ sine, sine });
    REQUIRE(engine.process(buffer) == Status::ok);
    REQUIRE(engine.getChannelProcessor().getLaneState(0).y1 != 0.0);

    auto silence = makeBuffer({ std::vector<float>(1, 0.0f), std::vector<float>(1, 0.0f) });
    REQUIRE(engine.setParameterText("Voicing", "Note Bank") == Status::ok);
    REQUIRE(engine.process(silence) == Status::ok);
    REQUIRE(engine.setParameterText("Voicing", "Peak") == Status::ok);
    REQUIRE(engine.process(silence) == Status::ok);

    const auto& state = engine.getChannelProcessor().getLaneState(0);
    CHECK(state.x1 == 0.0);
    CHECK(state.x2 == 0.0);
    CHECK(state.y1 == 0.0);
    CHECK(state.y2 == 0.0);
}

TEST_CASE("Filter shape changes recompute coefficients", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.configure(kSampleRate, 1) == Status::ok);
    const auto before = engine.getPeakCoefficients();

    REQUIRE(engine.setParameter("Peak Gain", 6.0f) == Status::ok);
    processMono(engine, std::vector<float>(8, 0.0f));

    FilterCoefficients expected;
    REQUIRE(makePeakCoefficients(kSampleRate, 440.0, 100.0, 6.0, expected) == Status::ok);
    CHECK(engine.getPeakCoefficients().b0 == Approx(expected.b0));
    CHECK(engine.getPeakCoefficients().a1 == Approx(expected.a1));
    CHECK(engine.getPeakCoefficients().b0 != before.b0);
}

TEST_CASE("Frequency changes leave the note bank design alone", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.configure(kSampleRate, 1) == Status::ok);
    const auto bankBefore = engine.getNoteBankDesign().coefficients[57];

    REQUIRE(engine.setParameter("Frequency", 1000.0f) == Status::ok);
    processMono(engine, std::vector<float>(8, 0.0f));
    CHECK(engine.getNoteBankDesign().coefficients[57].b0 == bankBefore.b0);
    CHECK(engine.getNoteBankDesign().coefficients[57].a1 == bankBefore.a1);

    REQUIRE(engine.setParameter("Q", 10.0f) == Status::ok);
    processMono(engine, std::vector<float>(8, 0.0f));

    FilterCoefficients expected;
    REQUIRE(makePeakCoefficients(kSampleRate, 440.0, 10.0, 20.0, expected) == Status::ok);
    CHECK(engine.getNoteBankDesign().coefficients[57].b0 == Approx(expected.b0));
    CHECK(engine.getNoteBankDesign().coefficients[57].a2 == Approx(expected.a2));
}

TEST_CASE("Each filter shape change designs the peak the next block uses", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.configure(kSampleRate, 1) == Status::ok);

    for (const float frequency : { 1000.0f, 2000.0f, 440.0f, 2000.0f })
    {
        REQUIRE(engine.setParameter("Frequency", frequency) == Status::ok);
        processMono(engine, std::vector<float>(4, 0.0f));

        FilterCoefficients expected;
        REQUIRE(makePeakCoefficients(kSampleRate, frequency, 100.0, 20.0, expected) == Status::ok);
        CHECK(engine.getPeakCoefficients().b1 == Approx(expected.b1));
        CHECK(engine.getPeakCoefficients().a2 == Approx(expected.a2));
    }
}

TEST_CASE("Gain changes ramp to the new value", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.configure(kSampleRate, 1) == Status::ok);
    REQUIRE(engine.setParameter("Gain", 0.0f) == Status::ok);

    // 20 ms ramp at 48 kHz is 960 samples.
    const auto output = processMono(engine, testutil::makeNoise(2048, 6u));
    CHECK(std::abs(output[0]) > 0.0f);
    for (size_t i = 1000; i < output.size(); ++i)
        CHECK(output[i] == 0.0f);
}

TEST_CASE("Note bank with every note off is silent at full mix", "[engine]")
{
    ColourizerEngine engine;
    REQUIRE(engine.setParameterText("Voicing", "Note Bank") == Status::ok);
    for (int note = 0; note < ParamIDs::kNumNotes; ++note)
        REQUIRE(engine.setParameter(ParamIDs::noteParamName(note), 0.0f) == Status::ok);
    REQUIRE(engine.configure(kSampleRate, 1) == Status::ok);

    const auto output = processMono(engine, testutil::makeNoise(kBlockSize, 2u));
    CHECK(testutil::meanAbs(output) == 0.0);
}

TEST_CASE("Default note bank emphasises the scale", "[engine]")
{
    // G is in the default scale, A is not.
    auto settled = [](double probeHz)
    {
        ColourizerEngine engine;
        REQUIRE(engine.setParameterText("Voicing", "Note Bank") == Status::ok);
        REQUIRE(engine.configure(kSampleRate, 1) == Status::ok);
        const auto input = testutil::makeSine(probeHz, kSampleRate, static_cast<int>(kSampleRate * 3.0));
        return testutil::meanAbs(processMono(engine, input), static_cast<size_t>(kSampleRate * 2.5));
    };

    CHECK(settled(391.995) > 5.0 * settled(440.0));
}
