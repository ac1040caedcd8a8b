#include "ChannelProcessor.h"

namespace colourdsp
{
void ChannelProcessor::Lane::reset()
{
    peak.reset();
    bank.reset();
}

float ChannelProcessor::Lane::process(float x, Voicing laneVoicing)
{
    if (laneVoicing == Voicing::noteBank)
        return bank.processSample(x);

    return peak.processSample(x);
}

void ChannelProcessor::prepare(int channels)
{
    numChannels = juce::jmax(0, channels);
    lanes.assign(static_cast<size_t>(numChannels), Lane {});
    monoLane = Lane {};
}

void ChannelProcessor::reset()
{
    for (auto& lane : lanes)
        lane.reset();
    monoLane.reset();
}

void ChannelProcessor::setTopology(ProcessingMode newMode, MonoSource newMonoSource, Voicing newVoicing)
{
    if (newMode == mode && newMonoSource == monoSource && newVoicing == voicing)
        return;

    mode = newMode;
    monoSource = newMonoSource;
    voicing = newVoicing;
    reset();
}

void ChannelProcessor::setPeakCoefficients(const FilterCoefficients& coefficients)
{
    for (auto& lane : lanes)
        lane.peak.setCoefficients(coefficients);
    monoLane.peak.setCoefficients(coefficients);
}

void ChannelProcessor::setNoteBankDesign(const NoteBankDesign& design)
{
    for (auto& lane : lanes)
        lane.bank.setDesign(design);
    monoLane.bank.setDesign(design);
}

void ChannelProcessor::setNoteGains(const std::array<float, ParamIDs::kNumNotes>& gains)
{
    for (auto& lane : lanes)
        lane.bank.setNoteGains(gains);
    monoLane.bank.setNoteGains(gains);
}

void ChannelProcessor::processFrame(const float* const* input, int sampleIndex, float* wet)
{
    if (numChannels == 0)
        return;

    if (mode == ProcessingMode::multi)
    {
        for (int ch = 0; ch < numChannels; ++ch)
            wet[ch] = lanes[static_cast<size_t>(ch)].process(input[ch][sampleIndex], voicing);
        return;
    }

    float source = input[0][sampleIndex];
    if (monoSource == MonoSource::downmix)
    {
        float sum = 0.0f;
        for (int ch = 0; ch < numChannels; ++ch)
            sum += input[ch][sampleIndex];
        source = sum / static_cast<float>(numChannels);
    }

    const float filtered = monoLane.process(source, voicing);
    for (int ch = 0; ch < numChannels; ++ch)
        wet[ch] = filtered;
}

int ChannelProcessor::getNumChannels() const
{
    return numChannels;
}

int ChannelProcessor::getNumActiveLanes() const
{
    if (numChannels == 0)
        return 0;
    return mode == ProcessingMode::mono ? 1 : numChannels;
}

ProcessingMode ChannelProcessor::getMode() const
{
    return mode;
}

MonoSource ChannelProcessor::getMonoSource() const
{
    return monoSource;
}

Voicing ChannelProcessor::getVoicing() const
{
    return voicing;
}

const BiquadState& ChannelProcessor::getLaneState(int lane) const
{
    if (mode == ProcessingMode::mono || lanes.empty())
        return monoLane.peak.getState();
    return lanes[static_cast<size_t>(juce::jlimit(0, numChannels - 1, lane))].peak.getState();
}
} // namespace colourdsp
