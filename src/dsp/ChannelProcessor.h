#pragma once

#include <vector>
#include "Biquad.h"
#include "NoteBank.h"
#include "ParamSnapshot.h"

namespace colourdsp
{
// Applies the Mono or Multi filter topology to planar audio, one frame at a time.
class ChannelProcessor
{
public:
    // Allocates one lane per channel plus the shared mono lane. Only allocating call.
    void prepare(int numChannels);
    // Zero all filter history.
    void reset();

    // Switching any of these resets every lane.
    void setTopology(ProcessingMode newMode, MonoSource newMonoSource, Voicing newVoicing);
    void setPeakCoefficients(const FilterCoefficients& coefficients);
    void setNoteBankDesign(const NoteBankDesign& design);
    void setNoteGains(const std::array<float, ParamIDs::kNumNotes>& gains);

    // Filters frame `sampleIndex` of `input` and writes one unscaled wet sample per channel.
    // `wet` must hold getNumChannels() samples.
    void processFrame(const float* const* input, int sampleIndex, float* wet);

    int getNumChannels() const;
    int getNumActiveLanes() const;
    ProcessingMode getMode() const;
    MonoSource getMonoSource() const;
    Voicing getVoicing() const;
    // History of the peak section of a lane (lane 0 in mono mode).
    const BiquadState& getLaneState(int lane) const;

private:
    struct Lane
    {
        Biquad peak;
        NoteBank bank;

        void reset();
        float process(float x, Voicing voicing);
    };

    std::vector<Lane> lanes;
    Lane monoLane;
    int numChannels = 0;
    ProcessingMode mode = ProcessingMode::multi;
    MonoSource monoSource = MonoSource::firstChannel;
    Voicing voicing = Voicing::peak;
};
} // namespace colourdsp
