#pragma once

#include <array>
#include <JuceHeader.h>
#include "ParamSnapshot.h"
#include "Status.h"

namespace colourdsp
{
enum class ParameterKind
{
    continuous,
    choice
};

// Position of each control in the parameter table.
namespace ParameterIndex
{
constexpr int gain = 0;
constexpr int mode = 1;
constexpr int dryWet = 2;
constexpr int frequency = 3;
constexpr int q = 4;
constexpr int peakGain = 5;
constexpr int monoSource = 6;
constexpr int voicing = 7;
constexpr int firstNote = 8;
constexpr int count = firstNote + ParamIDs::kNumNotes;
} // namespace ParameterIndex

// One host-visible control. Engine bounds are what setParameter accepts;
// host bounds are the automation range exposed by the plugin.
struct ParameterInfo
{
    juce::String id;
    juce::String name;
    ParameterKind kind = ParameterKind::continuous;
    float minValue = 0.0f;
    float maxValue = 1.0f;
    bool minInclusive = true;
    float hostMin = 0.0f;
    float hostMax = 1.0f;
    float defaultValue = 0.0f;
    juce::StringArray choices;
};

// Static table of every control, ordered by ParameterIndex.
const std::array<ParameterInfo, ParameterIndex::count>& parameterTable();

// Index for a display name or ID (note names accept flats); -1 if unknown.
int findParameter(juce::StringRef nameOrId);
// Choice index for a choice label ("Mono", "Multi", ...); -1 if unknown.
int findChoice(int parameterIndex, juce::StringRef text);

// Range check for one value. sampleRate <= 0 skips the Nyquist bound on frequency.
Status validateValue(int parameterIndex, float value, double sampleRate);
// Range check for a whole snapshot.
Status validateParameters(const ColourizerParameters& params, double sampleRate);

// Writes a validated value into params; params is untouched on failure.
Status applyValue(ColourizerParameters& params, int parameterIndex, float value, double sampleRate);
// Reads one control back as a float (choices as their index).
float readValue(const ColourizerParameters& params, int parameterIndex);
} // namespace colourdsp
