#pragma once

#include <JuceHeader.h>

namespace ParamIDs
{
constexpr int kNumNotes = 12;

extern const juce::String gain;
extern const juce::String mode;
extern const juce::String dryWet;
extern const juce::String frequency;
extern const juce::String q;
extern const juce::String peakGain;
extern const juce::String monoSource;
extern const juce::String voicing;

// Per pitch-class gain IDs ("note_c", "note_c_sharp", ...).
juce::String noteParamId(int noteIndex);
// Display name for a pitch class ("C", "C#", ...).
juce::String noteParamName(int noteIndex);
// Pitch class for a note name, sharps or flats, case-insensitive; -1 if unknown.
int noteIndexFromName(juce::StringRef name);
} // namespace ParamIDs
