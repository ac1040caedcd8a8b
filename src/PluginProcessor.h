#pragma once

#include <JuceHeader.h>
#include "dsp/ColourizerEngine.h"
#include "dsp/ParameterSurface.h"

// Plugin wrapper: owns the parameter tree and the DSP engine.
class ColourizerAudioProcessor final : public juce::AudioProcessor,
                                       private juce::Timer
{
public:
    ColourizerAudioProcessor();
    ~ColourizerAudioProcessor() override;

    // Configure the engine for the host's format.
    void prepareToPlay(double sampleRate, int samplesPerBlock) override;
    void releaseResources() override;

    // Any equal input/output layout with at least one channel.
    bool isBusesLayoutSupported(const BusesLayout& layouts) const override;

    // Main audio processing callback.
    void processBlock(juce::AudioBuffer<float>&, juce::MidiBuffer&) override;
    using AudioProcessor::processBlock;

    juce::AudioProcessorEditor* createEditor() override;
    bool hasEditor() const override;

    const juce::String getName() const override;

    bool acceptsMidi() const override;
    bool producesMidi() const override;
    bool isMidiEffect() const override;
    // Ring-out of the sharpest peak, in seconds.
    double getTailLengthSeconds() const override;

    int getNumPrograms() override;
    int getCurrentProgram() override;
    void setCurrentProgram(int index) override;
    const juce::String getProgramName(int index) override;
    void changeProgramName(int index, const juce::String& newName) override;

    // State persistence for DAW/session.
    void getStateInformation(juce::MemoryBlock& destData) override;
    void setStateInformation(const void* data, int sizeInBytes) override;

    juce::AudioProcessorValueTreeState& getParameters();
    colourdsp::ColourizerEngine& getEngine();
    // Copy the parameter tree into the engine now instead of on the next timer tick.
    void syncParameters();
    // Helper for startup/diagnostic logging.
    void logStartup(const juce::String& message);

    // Build the parameter layout from the engine's parameter table.
    static juce::AudioProcessorValueTreeState::ParameterLayout createParameterLayout();

private:
    void initializeParamPointers();
    void timerCallback() override;
    // Copy raw parameter values into a snapshot; frequency is kept below Nyquist.
    colourdsp::ColourizerParameters buildSnapshot(double sampleRate) const;
    void initLogging();
    void shutdownLogging();

    juce::AudioProcessorValueTreeState parameters;

    std::array<std::atomic<float>*, colourdsp::ParameterIndex::count> paramPointers {};

    colourdsp::ColourizerEngine engine;
    colourdsp::ColourizerParameters lastPublished;
    bool logParameterChanges = false;

    std::atomic<int> failedBlocks { 0 };
    std::atomic<int> lastFailure { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ColourizerAudioProcessor)
};
