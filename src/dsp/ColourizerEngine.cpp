#include "ColourizerEngine.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace
{
constexpr double kSmoothingSeconds = 0.02;
constexpr int kSnapshotReadAttempts = 2;
} // namespace

namespace colourdsp
{
ColourizerEngine::ColourizerEngine()
{
    snapshots[0] = latest;
    snapshots[1] = latest;
    current = latest;
    applied = latest;
}

Status ColourizerEngine::configure(double sampleRate, int numChannels)
{
    return configure(sampleRate, numChannels, getParameters());
}

Status ColourizerEngine::configure(double sampleRate, int numChannels, const ColourizerParameters& params)
{
    if (! std::isfinite(sampleRate) || sampleRate <= 0.0)
    {
        juce::Logger::writeToLog("Colourizer: configure rejected, sample rate " + juce::String(sampleRate));
        return Status::invalidParameter;
    }
    if (numChannels < 1)
    {
        juce::Logger::writeToLog("Colourizer: configure rejected, " + juce::String(numChannels) + " channels");
        return Status::unsupportedChannelCount;
    }

    // Design everything before touching live state so a failure leaves it intact.
    FilterCoefficients newPeak;
    NoteBankDesign newBank;
    auto status = validateParameters(params, sampleRate);
    if (status == Status::ok)
        status = makePeakCoefficients(sampleRate, params.frequencyHz, params.q, params.peakGainDb, newPeak);
    if (status == Status::ok)
        status = designNoteBank(sampleRate, params.q, params.peakGainDb, newBank);
    if (status != Status::ok)
    {
        juce::Logger::writeToLog("Colourizer: configure rejected at " + juce::String(sampleRate)
                                 + " Hz, frequency " + juce::String(params.frequencyHz) + " Hz ("
                                 + toString(status) + ")");
        return status;
    }

    {
        const juce::ScopedLock lock(writeLock);
        publish(params);
    }

    configured.store(false);
    channelProcessor.prepare(numChannels);
    wetScratch.assign(static_cast<size_t>(numChannels), 0.0f);
    channelProcessor.setTopology(params.mode, params.monoSource, params.voicing);
    peakCoefficients = newPeak;
    noteBankDesign = newBank;
    noteBankQ = params.q;
    noteBankGainDb = params.peakGainDb;
    channelProcessor.setPeakCoefficients(peakCoefficients);
    channelProcessor.setNoteBankDesign(noteBankDesign);
    channelProcessor.setNoteGains(params.noteGains);
    channelProcessor.reset();

    current = params;
    applied = params;
    gainSmoothed.reset(sampleRate, kSmoothingSeconds);
    gainSmoothed.setCurrentAndTargetValue(params.gain);
    mixSmoothed.reset(sampleRate, kSmoothingSeconds);
    mixSmoothed.setCurrentAndTargetValue(params.mix);

    sampleRateHz.store(sampleRate);
    configuredChannels.store(numChannels);
    configured.store(true);

    const auto activeSections = std::count(noteBankDesign.active.begin(), noteBankDesign.active.end(), true);
    juce::Logger::writeToLog("Colourizer: configured " + juce::String(sampleRate, 0) + " Hz, "
                             + juce::String(numChannels) + " channels, "
                             + juce::String(static_cast<int>(activeSections)) + " bank sections, "
                             + juce::String(channelProcessor.getNumActiveLanes()) + " active lanes");
    return Status::ok;
}

void ColourizerEngine::reset()
{
    channelProcessor.reset();
    gainSmoothed.setCurrentAndTargetValue(current.gain);
    mixSmoothed.setCurrentAndTargetValue(current.mix);
}

bool ColourizerEngine::isConfigured() const
{
    return configured.load();
}

double ColourizerEngine::getSampleRate() const
{
    return sampleRateHz.load();
}

int ColourizerEngine::getNumChannels() const
{
    return configuredChannels.load();
}

Status ColourizerEngine::setParameter(juce::StringRef nameOrId, float value)
{
    const int index = findParameter(nameOrId);
    if (index < 0)
        return rejectParameter(nameOrId, "unknown parameter");

    const juce::ScopedLock lock(writeLock);
    auto candidate = latest;
    const auto status = applyValue(candidate, index, value, sampleRateHz.load());
    if (status != Status::ok)
        return rejectParameter(nameOrId, "value " + juce::String(value) + " out of range");

    publish(candidate);
    return Status::ok;
}

Status ColourizerEngine::setParameterText(juce::StringRef nameOrId, juce::StringRef text)
{
    const int index = findParameter(nameOrId);
    if (index < 0)
        return rejectParameter(nameOrId, "unknown parameter");

    const int choice = findChoice(index, text);
    if (choice < 0)
        return rejectParameter(nameOrId, "unknown choice '" + juce::String(text) + "'");

    return setParameter(nameOrId, static_cast<float>(choice));
}

Status ColourizerEngine::setParameters(const ColourizerParameters& params)
{
    const juce::ScopedLock lock(writeLock);
    const auto status = validateParameters(params, sampleRateHz.load());
    if (status != Status::ok)
        return rejectParameter("snapshot", "one or more values out of range");

    publish(params);
    return Status::ok;
}

float ColourizerEngine::getParameter(juce::StringRef nameOrId) const
{
    const int index = findParameter(nameOrId);
    if (index < 0)
        return std::numeric_limits<float>::quiet_NaN();

    const juce::ScopedLock lock(writeLock);
    return readValue(latest, index);
}

ColourizerParameters ColourizerEngine::getParameters() const
{
    const juce::ScopedLock lock(writeLock);
    return latest;
}

Status ColourizerEngine::process(juce::AudioBuffer<float>& buffer)
{
    return process(buffer.getArrayOfWritePointers(), buffer.getNumChannels(), buffer.getNumSamples());
}

Status ColourizerEngine::process(float* const* channels, int numChannels, int numSamples)
{
    // Critical path: no allocation, locks or logging below this point.
    if (! configured.load())
        return Status::notConfigured;
    if (numChannels != channelProcessor.getNumChannels())
        return Status::unsupportedChannelCount;
    if (channels == nullptr)
        return Status::invalidParameter;
    if (numSamples <= 0)
        return Status::ok;

    pullSnapshot();
    applySnapshot();

    gainSmoothed.setTargetValue(current.gain);
    mixSmoothed.setTargetValue(current.mix);

    float* wet = wetScratch.data();
    for (int i = 0; i < numSamples; ++i)
    {
        channelProcessor.processFrame(channels, i, wet);
        const float gain = gainSmoothed.getNextValue();
        const float mix = mixSmoothed.getNextValue();
        for (int ch = 0; ch < numChannels; ++ch)
        {
            const float dry = channels[ch][i];
            channels[ch][i] = (1.0f - mix) * dry + mix * (gain * wet[ch]);
        }
    }

    return Status::ok;
}

const ChannelProcessor& ColourizerEngine::getChannelProcessor() const
{
    return channelProcessor;
}

const FilterCoefficients& ColourizerEngine::getPeakCoefficients() const
{
    return peakCoefficients;
}

const NoteBankDesign& ColourizerEngine::getNoteBankDesign() const
{
    return noteBankDesign;
}

void ColourizerEngine::publish(const ColourizerParameters& params)
{
    latest = params;
    const int next = 1 - activeSnapshot.load(std::memory_order_acquire);
    snapshots[next] = params;
    activeSnapshot.store(next, std::memory_order_release);
    snapshotGeneration.fetch_add(1, std::memory_order_acq_rel);
}

void ColourizerEngine::pullSnapshot()
{
    for (int attempt = 0; attempt < kSnapshotReadAttempts; ++attempt)
    {
        const auto generationBefore = snapshotGeneration.load(std::memory_order_acquire);
        const int index = activeSnapshot.load(std::memory_order_acquire);
        const ColourizerParameters candidate = snapshots[index];
        if (snapshotGeneration.load(std::memory_order_acquire) == generationBefore)
        {
            current = candidate;
            return;
        }
    }
}

void ColourizerEngine::applySnapshot()
{
    const double sampleRate = sampleRateHz.load();

    if (topologyDiffers(current, applied))
        channelProcessor.setTopology(current.mode, current.monoSource, current.voicing);

    bool shapeApplied = true;
    if (filterShapeDiffers(current, applied))
    {
        FilterCoefficients newPeak;
        if (makePeakCoefficients(sampleRate, current.frequencyHz, current.q, current.peakGainDb, newPeak)
            == Status::ok)
        {
            peakCoefficients = newPeak;
            channelProcessor.setPeakCoefficients(peakCoefficients);
        }
        else
        {
            shapeApplied = false;
        }
    }

    // The bank does not depend on the centre frequency.
    if (current.q != noteBankQ || current.peakGainDb != noteBankGainDb)
    {
        if (designNoteBank(sampleRate, current.q, current.peakGainDb, noteBankDesign) == Status::ok)
        {
            channelProcessor.setNoteBankDesign(noteBankDesign);
            noteBankQ = current.q;
            noteBankGainDb = current.peakGainDb;
        }
    }

    if (current.noteGains != applied.noteGains)
        channelProcessor.setNoteGains(current.noteGains);

    // A shape that failed to design stays pending and is retried next block.
    const auto previous = applied;
    applied = current;
    if (! shapeApplied)
    {
        applied.frequencyHz = previous.frequencyHz;
        applied.q = previous.q;
        applied.peakGainDb = previous.peakGainDb;
    }
}

Status ColourizerEngine::rejectParameter(juce::StringRef nameOrId, const juce::String& reason) const
{
    juce::Logger::writeToLog("Colourizer: rejected '" + juce::String(nameOrId) + "': " + reason);
    return Status::invalidParameter;
}
} // namespace colourdsp
