#pragma once

#include <atomic>
#include <vector>
#include <JuceHeader.h>
#include "ChannelProcessor.h"
#include "ParamSnapshot.h"
#include "ParameterSurface.h"
#include "Status.h"

namespace colourdsp
{
// Colourizer DSP engine: validated parameters, filter topology and dry/wet blend.
//
// configure() and process() belong to the audio side and must not overlap.
// Parameter setters may run on any other thread: each accepted change publishes a
// complete snapshot, and process() picks up the latest one at the start of a block.
class ColourizerEngine
{
public:
    ColourizerEngine();

    // Allocate lanes and coefficients for a sample rate and channel count.
    Status configure(double sampleRate, int numChannels);
    // Same, adopting `params` (validated against the new sample rate) in the same step.
    Status configure(double sampleRate, int numChannels, const ColourizerParameters& params);
    // Zero filter history and settle gain/mix smoothing.
    void reset();
    bool isConfigured() const;
    double getSampleRate() const;
    int getNumChannels() const;

    // Set one control by display name or ID. Nothing changes on failure.
    Status setParameter(juce::StringRef nameOrId, float value);
    // Set a choice control by label, e.g. ("Processing Mode", "Mono").
    Status setParameterText(juce::StringRef nameOrId, juce::StringRef text);
    // Validate and publish a whole snapshot.
    Status setParameters(const ColourizerParameters& params);
    // Last accepted value (choices as their index); NaN for unknown names.
    float getParameter(juce::StringRef nameOrId) const;
    ColourizerParameters getParameters() const;

    // Filter and blend in place. Fails if unconfigured or on a channel-count mismatch.
    Status process(juce::AudioBuffer<float>& buffer);
    Status process(float* const* channels, int numChannels, int numSamples);

    const ChannelProcessor& getChannelProcessor() const;
    const FilterCoefficients& getPeakCoefficients() const;
    const NoteBankDesign& getNoteBankDesign() const;

private:
    // Writer side: copy into the idle slot and flip.
    void publish(const ColourizerParameters& params);
    // Reader side: copy the active slot, keeping the previous block's snapshot on a race.
    void pullSnapshot();
    // Bring coefficients and topology in line with the pulled snapshot.
    void applySnapshot();
    Status rejectParameter(juce::StringRef nameOrId, const juce::String& reason) const;

    juce::CriticalSection writeLock;
    ColourizerParameters latest;
    ColourizerParameters snapshots[2];
    std::atomic<int> activeSnapshot { 0 };
    std::atomic<uint32_t> snapshotGeneration { 0 };

    // Audio side state.
    ColourizerParameters current;
    ColourizerParameters applied;
    ChannelProcessor channelProcessor;
    FilterCoefficients peakCoefficients;
    NoteBankDesign noteBankDesign;
    float noteBankQ = 0.0f;
    float noteBankGainDb = 0.0f;
    // One wet sample per channel, sized by configure().
    std::vector<float> wetScratch;
    juce::SmoothedValue<float> gainSmoothed;
    juce::SmoothedValue<float> mixSmoothed;

    std::atomic<double> sampleRateHz { 0.0 };
    std::atomic<int> configuredChannels { 0 };
    std::atomic<bool> configured { false };

    JUCE_DECLARE_NON_COPYABLE(ColourizerEngine)
};
} // namespace colourdsp
