#include "ParamIDs.h"

namespace
{
const char* const kNoteIdSuffixes[ParamIDs::kNumNotes] {
    "c", "c_sharp", "d", "d_sharp", "e", "f", "f_sharp", "g", "g_sharp", "a", "a_sharp", "b"
};

const char* const kNoteNames[ParamIDs::kNumNotes] {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
};

struct NoteAlias
{
    const char* name;
    int index;
};

const NoteAlias kFlatAliases[] {
    { "Db", 1 }, { "Eb", 3 }, { "Gb", 6 }, { "Ab", 8 }, { "Bb", 10 }, { "Cb", 11 }
};
} // namespace

namespace ParamIDs
{
const juce::String gain = "gain";
const juce::String mode = "mode";
const juce::String dryWet = "dryWet";
const juce::String frequency = "frequency";
const juce::String q = "q";
const juce::String peakGain = "peakGain";
const juce::String monoSource = "monoSource";
const juce::String voicing = "voicing";

juce::String noteParamId(int noteIndex)
{
    return "note_" + juce::String(kNoteIdSuffixes[juce::jlimit(0, kNumNotes - 1, noteIndex)]);
}

juce::String noteParamName(int noteIndex)
{
    return kNoteNames[juce::jlimit(0, kNumNotes - 1, noteIndex)];
}

int noteIndexFromName(juce::StringRef name)
{
    const juce::String trimmed = juce::String(name).trim();
    if (trimmed.isEmpty())
        return -1;

    for (int i = 0; i < kNumNotes; ++i)
        if (trimmed.equalsIgnoreCase(kNoteNames[i]))
            return i;

    for (const auto& alias : kFlatAliases)
        if (trimmed.equalsIgnoreCase(alias.name))
            return alias.index;

    return -1;
}
} // namespace ParamIDs
