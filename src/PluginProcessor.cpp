#include "PluginProcessor.h"
#include <cmath>
#include "util/ParamIDs.h"
#include "util/ChannelLayoutUtils.h"
#include "util/Version.h"
#include "dsp/NoteBank.h"

// Audio processor implementation: parameters, engine hand-off, and state I/O.

namespace
{
constexpr int kSnapshotTimerHz = 30;
constexpr double kMaxTailSeconds = 30.0;

juce::File getLogDirectory()
{
    auto documentsDir = juce::File::getSpecialLocation(juce::File::userDocumentsDirectory);
    if (! documentsDir.exists())
        documentsDir = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory);

    auto dir = documentsDir.getChildFile("Colourizer").getChildFile("Logs");
    dir.createDirectory();
    return dir;
}

juce::File makeLogFile()
{
    const auto now = juce::Time::getCurrentTime();
    const juce::String name = "Colourizer_" + now.formatted("%Y-%m-%d_%H-%M-%S") + ".log";
    return getLogDirectory().getChildFile(name);
}

std::atomic<int> gLoggerUsers { 0 };
std::unique_ptr<juce::FileLogger> gSharedLogger;
juce::File gSharedLogFile;
juce::CriticalSection gLoggerLock;
std::atomic<bool> gCrashHandlerInstalled { false };

void crashHandler(void*)
{
    if (auto* logger = juce::Logger::getCurrentLogger())
        logger->writeToLog("CRASH: " + juce::SystemStats::getStackBacktrace());
}

void startSharedLogger()
{
    const juce::ScopedLock lock(gLoggerLock);
    if (gLoggerUsers.fetch_add(1) == 0)
    {
        gSharedLogFile = makeLogFile();
        gSharedLogger = std::make_unique<juce::FileLogger>(gSharedLogFile, "Colourizer log", 0);
        juce::Logger::setCurrentLogger(gSharedLogger.get());
        juce::Logger::writeToLog("Log file: " + gSharedLogFile.getFullPathName());
        juce::Logger::writeToLog("Version: " + Version::displayString());
        if (! gCrashHandlerInstalled.exchange(true))
            juce::SystemStats::setApplicationCrashHandler(crashHandler);
    }
}

void stopSharedLogger()
{
    const juce::ScopedLock lock(gLoggerLock);
    if (gLoggerUsers.fetch_sub(1) == 1)
    {
        juce::Logger::writeToLog("Log closed.");
        juce::Logger::setCurrentLogger(nullptr);
        gSharedLogger.reset();
        gSharedLogFile = juce::File();
    }
}

juce::String describeSnapshot(const colourdsp::ColourizerParameters& p)
{
    juce::String notes;
    for (const float g : p.noteGains)
        notes << juce::String(g, 2) << " ";

    return "gain=" + juce::String(p.gain, 3)
        + " mode=" + juce::String(p.mode == colourdsp::ProcessingMode::mono ? "Mono" : "Multi")
        + " mix=" + juce::String(p.mix, 3)
        + " freq=" + juce::String(p.frequencyHz, 1)
        + " q=" + juce::String(p.q, 2)
        + " peak=" + juce::String(p.peakGainDb, 1) + "dB"
        + " source=" + juce::String(static_cast<int>(p.monoSource))
        + " voicing=" + juce::String(static_cast<int>(p.voicing))
        + " notes=[" + notes.trimEnd() + "]";
}
} // namespace

ColourizerAudioProcessor::ColourizerAudioProcessor()
    : AudioProcessor(BusesProperties()
                         .withInput("Input", juce::AudioChannelSet::stereo(), true)
                         .withOutput("Output", juce::AudioChannelSet::stereo(), true)),
      parameters(*this, nullptr, "PARAMETERS", createParameterLayout())
{
    initLogging();
    logStartup("ColourizerAudioProcessor ctor");

    logParameterChanges =
        juce::SystemStats::getEnvironmentVariable("COLOURIZER_LOG_PARAMS", "0").getIntValue() != 0;

    initializeParamPointers();
    syncParameters();
    startTimerHz(kSnapshotTimerHz);
}

ColourizerAudioProcessor::~ColourizerAudioProcessor()
{
    stopTimer();
    logStartup("Processor dtor");
    shutdownLogging();
}

void ColourizerAudioProcessor::initLogging()
{
    startSharedLogger();
}

void ColourizerAudioProcessor::shutdownLogging()
{
    stopSharedLogger();
}

void ColourizerAudioProcessor::logStartup(const juce::String& message)
{
    juce::Logger::writeToLog("Startup: " + message);
}

void ColourizerAudioProcessor::prepareToPlay(double sampleRate, int samplesPerBlock)
{
    const int channelCount = getTotalNumInputChannels();
    const auto snapshot = buildSnapshot(sampleRate);
    const auto status = engine.configure(sampleRate, channelCount, snapshot);
    if (status != colourdsp::Status::ok)
    {
        juce::Logger::writeToLog("prepareToPlay: engine not configured ("
                                 + juce::String(colourdsp::toString(status)) + "), passing audio through");
        return;
    }

    lastPublished = snapshot;
    juce::Logger::writeToLog("prepareToPlay: " + juce::String(sampleRate, 0) + " Hz, block "
                             + juce::String(samplesPerBlock) + ", layout "
                             + ChannelLayoutUtils::describeLayout(getChannelLayoutOfBus(true, 0)));
}

void ColourizerAudioProcessor::releaseResources()
{
}

bool ColourizerAudioProcessor::isBusesLayoutSupported(const BusesLayout& layouts) const
{
    const auto mainInput = layouts.getMainInputChannelSet();
    const auto mainOutput = layouts.getMainOutputChannelSet();

    if (mainInput.isDisabled() || mainOutput.isDisabled())
        return false;

    if (mainInput != mainOutput)
        return false;

    return mainInput.size() >= 1;
}

void ColourizerAudioProcessor::processBlock(juce::AudioBuffer<float>& buffer,
                                            juce::MidiBuffer& midiMessages)
{
    // Critical path: process audio on the realtime thread.
    juce::ignoreUnused(midiMessages);
    juce::ScopedNoDenormals noDenormals;

    const int numInputs = getTotalNumInputChannels();
    for (int ch = numInputs; ch < getTotalNumOutputChannels(); ++ch)
        buffer.clear(ch, 0, buffer.getNumSamples());

    if (! engine.isConfigured())
        return;

    const int channels = juce::jmin(numInputs, buffer.getNumChannels());
    const auto status = engine.process(buffer.getArrayOfWritePointers(), channels, buffer.getNumSamples());
    if (status != colourdsp::Status::ok)
    {
        failedBlocks.fetch_add(1, std::memory_order_relaxed);
        lastFailure.store(static_cast<int>(status), std::memory_order_relaxed);
    }
}

juce::AudioProcessorEditor* ColourizerAudioProcessor::createEditor()
{
    return nullptr;
}

bool ColourizerAudioProcessor::hasEditor() const
{
    return false;
}

const juce::String ColourizerAudioProcessor::getName() const
{
    return JucePlugin_Name;
}

bool ColourizerAudioProcessor::acceptsMidi() const
{
    return false;
}

bool ColourizerAudioProcessor::producesMidi() const
{
    return false;
}

bool ColourizerAudioProcessor::isMidiEffect() const
{
    return false;
}

double ColourizerAudioProcessor::getTailLengthSeconds() const
{
    // T60 of a resonance is roughly 2.2 * Q / f.
    const auto& p = lastPublished;
    const double lowest = p.voicing == colourdsp::Voicing::noteBank
        ? colourdsp::noteBankSectionFrequency(0)
        : static_cast<double>(p.frequencyHz);
    if (lowest <= 0.0)
        return 0.0;

    return juce::jmin(kMaxTailSeconds, 2.2 * static_cast<double>(p.q) / lowest);
}

int ColourizerAudioProcessor::getNumPrograms()
{
    return 1;
}

int ColourizerAudioProcessor::getCurrentProgram()
{
    return 0;
}

void ColourizerAudioProcessor::setCurrentProgram(int index)
{
    juce::ignoreUnused(index);
}

const juce::String ColourizerAudioProcessor::getProgramName(int index)
{
    juce::ignoreUnused(index);
    return {};
}

void ColourizerAudioProcessor::changeProgramName(int index, const juce::String& newName)
{
    juce::ignoreUnused(index, newName);
}

void ColourizerAudioProcessor::getStateInformation(juce::MemoryBlock& destData)
{
    auto state = parameters.copyState();
    state.setProperty("version", Version::versionString(), nullptr);
    std::unique_ptr<juce::XmlElement> xml(state.createXml());
    copyXmlToBinary(*xml, destData);
}

void ColourizerAudioProcessor::setStateInformation(const void* data, int sizeInBytes)
{
    std::unique_ptr<juce::XmlElement> xml(getXmlFromBinary(data, sizeInBytes));
    if (xml == nullptr || ! xml->hasTagName(parameters.state.getType()))
    {
        juce::Logger::writeToLog("State: ignored " + juce::String(sizeInBytes) + " bytes (not a Colourizer state)");
        return;
    }

    parameters.replaceState(juce::ValueTree::fromXml(*xml));
    juce::Logger::writeToLog("State: restored (saved by "
                             + parameters.state.getProperty("version", "unknown").toString() + ")");
    syncParameters();
}

juce::AudioProcessorValueTreeState& ColourizerAudioProcessor::getParameters()
{
    return parameters;
}

colourdsp::ColourizerEngine& ColourizerAudioProcessor::getEngine()
{
    return engine;
}

void ColourizerAudioProcessor::syncParameters()
{
    const auto snapshot = buildSnapshot(engine.getSampleRate());
    if (colourdsp::sameParameters(snapshot, lastPublished))
        return;

    const auto status = engine.setParameters(snapshot);
    if (status != colourdsp::Status::ok)
    {
        juce::Logger::writeToLog("Parameters: snapshot rejected (" + juce::String(colourdsp::toString(status)) + ")");
        return;
    }

    lastPublished = snapshot;
    if (logParameterChanges)
        juce::Logger::writeToLog("Parameters: " + describeSnapshot(snapshot));
}

void ColourizerAudioProcessor::initializeParamPointers()
{
    const auto& table = colourdsp::parameterTable();
    for (size_t i = 0; i < table.size(); ++i)
    {
        paramPointers[i] = parameters.getRawParameterValue(table[i].id);
        if (paramPointers[i] == nullptr)
            juce::Logger::writeToLog("Parameters: missing '" + table[i].id + "'");
    }
}

// Defines every APVTS parameter from the engine's parameter table.
juce::AudioProcessorValueTreeState::ParameterLayout ColourizerAudioProcessor::createParameterLayout()
{
    std::vector<std::unique_ptr<juce::RangedAudioParameter>> params;
    const auto& table = colourdsp::parameterTable();
    params.reserve(table.size());

    for (size_t i = 0; i < table.size(); ++i)
    {
        const auto& info = table[i];
        if (info.kind == colourdsp::ParameterKind::choice)
        {
            params.push_back(std::make_unique<juce::AudioParameterChoice>(
                info.id, info.name, info.choices, static_cast<int>(info.defaultValue)));
            continue;
        }

        juce::NormalisableRange<float> range(info.hostMin, info.hostMax, 0.0f);
        if (static_cast<int>(i) == colourdsp::ParameterIndex::frequency)
            range.setSkewForCentre(1000.0f);
        else if (static_cast<int>(i) == colourdsp::ParameterIndex::q)
            range.setSkewForCentre(10.0f);
        else if (static_cast<int>(i) == colourdsp::ParameterIndex::gain)
            range.setSkewForCentre(1.0f);

        params.push_back(std::make_unique<juce::AudioParameterFloat>(
            info.id, info.name, range, info.defaultValue));
    }

    return { params.begin(), params.end() };
}

juce::AudioProcessor* JUCE_CALLTYPE createPluginFilter()
{
    return new ColourizerAudioProcessor();
}

void ColourizerAudioProcessor::timerCallback()
{
    // Report audio-thread failures here, where logging is allowed.
    const int failures = failedBlocks.exchange(0, std::memory_order_relaxed);
    if (failures > 0)
    {
        const auto status = static_cast<colourdsp::Status>(lastFailure.load(std::memory_order_relaxed));
        juce::Logger::writeToLog("processBlock: " + juce::String(failures) + " block(s) passed through ("
                                 + juce::String(colourdsp::toString(status)) + ")");
    }

    syncParameters();
}

colourdsp::ColourizerParameters ColourizerAudioProcessor::buildSnapshot(double sampleRate) const
{
    // Critical path: copy current APVTS values into a snapshot for the engine.
    namespace Index = colourdsp::ParameterIndex;
    const auto& table = colourdsp::parameterTable();
    auto raw = [this, &table](int index)
    {
        const auto* ptr = paramPointers[static_cast<size_t>(index)];
        return ptr != nullptr ? ptr->load() : table[static_cast<size_t>(index)].defaultValue;
    };

    colourdsp::ColourizerParameters snapshot;
    snapshot.gain = juce::jmax(0.0f, raw(Index::gain));
    snapshot.mode = static_cast<colourdsp::ProcessingMode>(juce::jlimit(0, 1, juce::roundToInt(raw(Index::mode))));
    snapshot.mix = juce::jlimit(0.0f, 1.0f, raw(Index::dryWet));
    snapshot.frequencyHz = raw(Index::frequency);
    snapshot.q = raw(Index::q);
    snapshot.peakGainDb = raw(Index::peakGain);
    snapshot.monoSource =
        static_cast<colourdsp::MonoSource>(juce::jlimit(0, 1, juce::roundToInt(raw(Index::monoSource))));
    snapshot.voicing = static_cast<colourdsp::Voicing>(juce::jlimit(0, 1, juce::roundToInt(raw(Index::voicing))));
    for (int note = 0; note < ParamIDs::kNumNotes; ++note)
        snapshot.noteGains[static_cast<size_t>(note)] = juce::jlimit(0.0f, 1.0f, raw(Index::firstNote + note));

    if (sampleRate > 0.0)
        snapshot.frequencyHz = juce::jmin(snapshot.frequencyHz, static_cast<float>(sampleRate * 0.5 * 0.99));

    return snapshot;
}
