#pragma once

#include <array>
#include "../util/ParamIDs.h"

namespace colourdsp
{
// Filter topology across channels.
enum class ProcessingMode
{
    mono = 0,
    multi
};

// Representative signal used by the mono topology.
enum class MonoSource
{
    firstChannel = 0,
    downmix
};

// Filter structure producing the wet signal.
enum class Voicing
{
    peak = 0,
    noteBank
};

// Note gains of the Miyako-bushi scale (C C# F G G#), the product default.
constexpr std::array<float, ParamIDs::kNumNotes> kDefaultNoteGains {
    1.0f, 1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 1.0f, 1.0f, 0.0f, 0.0f, 0.0f
};

// Full parameter snapshot consumed by the audio thread (copied once per block).
struct ColourizerParameters
{
    float gain = 1.0f;
    ProcessingMode mode = ProcessingMode::multi;
    float mix = 1.0f;
    float frequencyHz = 440.0f;
    float q = 100.0f;
    float peakGainDb = 20.0f;
    MonoSource monoSource = MonoSource::firstChannel;
    Voicing voicing = Voicing::peak;
    std::array<float, ParamIDs::kNumNotes> noteGains = kDefaultNoteGains;
};

// True when two snapshots need different filter coefficients.
inline bool filterShapeDiffers(const ColourizerParameters& a, const ColourizerParameters& b)
{
    return a.frequencyHz != b.frequencyHz
        || a.q != b.q
        || a.peakGainDb != b.peakGainDb;
}

// True when two snapshots need the filter lanes rebuilt from silence.
inline bool topologyDiffers(const ColourizerParameters& a, const ColourizerParameters& b)
{
    return a.mode != b.mode
        || a.voicing != b.voicing
        || a.monoSource != b.monoSource;
}

// Field-by-field equality.
inline bool sameParameters(const ColourizerParameters& a, const ColourizerParameters& b)
{
    return ! filterShapeDiffers(a, b)
        && ! topologyDiffers(a, b)
        && a.gain == b.gain
        && a.mix == b.mix
        && a.noteGains == b.noteGains;
}
} // namespace colourdsp
