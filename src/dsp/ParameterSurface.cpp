#include "ParameterSurface.h"
#include <cmath>
#include <limits>

namespace
{
using colourdsp::ParameterInfo;
using colourdsp::ParameterKind;

constexpr float kUnbounded = std::numeric_limits<float>::infinity();
constexpr float kMaxPeakGainDb = 60.0f;

ParameterInfo makeContinuous(const juce::String& id, const juce::String& name,
                             float minValue, float maxValue, bool minInclusive,
                             float hostMin, float hostMax, float defaultValue)
{
    ParameterInfo info;
    info.id = id;
    info.name = name;
    info.kind = ParameterKind::continuous;
    info.minValue = minValue;
    info.maxValue = maxValue;
    info.minInclusive = minInclusive;
    info.hostMin = hostMin;
    info.hostMax = hostMax;
    info.defaultValue = defaultValue;
    return info;
}

ParameterInfo makeChoice(const juce::String& id, const juce::String& name,
                         const juce::StringArray& choices, int defaultIndex)
{
    ParameterInfo info;
    info.id = id;
    info.name = name;
    info.kind = ParameterKind::choice;
    info.minValue = 0.0f;
    info.maxValue = static_cast<float>(choices.size() - 1);
    info.hostMin = info.minValue;
    info.hostMax = info.maxValue;
    info.defaultValue = static_cast<float>(defaultIndex);
    info.choices = choices;
    return info;
}

std::array<ParameterInfo, colourdsp::ParameterIndex::count> buildTable()
{
    namespace Index = colourdsp::ParameterIndex;
    std::array<ParameterInfo, Index::count> table;

    table[Index::gain] = makeContinuous(ParamIDs::gain, "Gain",
                                     0.0f, kUnbounded, true, 0.0f, 4.0f, 1.0f);
    table[Index::mode] = makeChoice(ParamIDs::mode, "Processing Mode",
                                 juce::StringArray("Mono", "Multi"), 1);
    table[Index::dryWet] = makeContinuous(ParamIDs::dryWet, "Dry/Wet",
                                       0.0f, 1.0f, true, 0.0f, 1.0f, 1.0f);
    table[Index::frequency] = makeContinuous(ParamIDs::frequency, "Frequency",
                                          0.0f, kUnbounded, false, 20.0f, 20000.0f, 440.0f);
    table[Index::q] = makeContinuous(ParamIDs::q, "Q",
                                  0.0f, kUnbounded, false, 0.1f, 300.0f, 100.0f);
    table[Index::peakGain] = makeContinuous(ParamIDs::peakGain, "Peak Gain",
                                         -kMaxPeakGainDb, kMaxPeakGainDb, true, -30.0f, 40.0f, 20.0f);
    table[Index::monoSource] = makeChoice(ParamIDs::monoSource, "Mono Source",
                                       juce::StringArray("First Channel", "Downmix"), 0);
    table[Index::voicing] = makeChoice(ParamIDs::voicing, "Voicing",
                                    juce::StringArray("Peak", "Note Bank"), 0);

    for (int note = 0; note < ParamIDs::kNumNotes; ++note)
    {
        table[static_cast<size_t>(Index::firstNote + note)] =
            makeContinuous(ParamIDs::noteParamId(note), ParamIDs::noteParamName(note),
                           0.0f, 1.0f, true, 0.0f, 1.0f,
                           colourdsp::kDefaultNoteGains[static_cast<size_t>(note)]);
    }

    return table;
}
} // namespace

namespace colourdsp
{
const std::array<ParameterInfo, ParameterIndex::count>& parameterTable()
{
    static const auto table = buildTable();
    return table;
}

int findParameter(juce::StringRef nameOrId)
{
    const auto& table = parameterTable();
    for (int i = 0; i < ParameterIndex::count; ++i)
    {
        const auto& info = table[static_cast<size_t>(i)];
        if (info.name == nameOrId || info.id == nameOrId)
            return i;
    }

    const int note = ParamIDs::noteIndexFromName(nameOrId);
    if (note >= 0)
        return ParameterIndex::firstNote + note;

    return -1;
}

int findChoice(int parameterIndex, juce::StringRef text)
{
    if (parameterIndex < 0 || parameterIndex >= ParameterIndex::count)
        return -1;

    const auto& info = parameterTable()[static_cast<size_t>(parameterIndex)];
    if (info.kind != ParameterKind::choice)
        return -1;

    for (int i = 0; i < info.choices.size(); ++i)
        if (info.choices[i].equalsIgnoreCase(juce::String(text).trim()))
            return i;

    return -1;
}

Status validateValue(int parameterIndex, float value, double sampleRate)
{
    if (parameterIndex < 0 || parameterIndex >= ParameterIndex::count)
        return Status::invalidParameter;
    if (! std::isfinite(value))
        return Status::invalidParameter;

    const auto& info = parameterTable()[static_cast<size_t>(parameterIndex)];
    if (info.minInclusive ? value < info.minValue : value <= info.minValue)
        return Status::invalidParameter;
    if (value > info.maxValue)
        return Status::invalidParameter;

    if (info.kind == ParameterKind::choice && value != std::floor(value))
        return Status::invalidParameter;

    if (parameterIndex == ParameterIndex::frequency && sampleRate > 0.0
        && static_cast<double>(value) >= sampleRate * 0.5)
        return Status::invalidParameter;

    return Status::ok;
}

Status validateParameters(const ColourizerParameters& params, double sampleRate)
{
    for (int i = 0; i < ParameterIndex::count; ++i)
    {
        const auto status = validateValue(i, readValue(params, i), sampleRate);
        if (status != Status::ok)
            return status;
    }

    return Status::ok;
}

Status applyValue(ColourizerParameters& params, int parameterIndex, float value, double sampleRate)
{
    const auto status = validateValue(parameterIndex, value, sampleRate);
    if (status != Status::ok)
        return status;

    switch (parameterIndex)
    {
        case ParameterIndex::gain: params.gain = value; break;
        case ParameterIndex::mode: params.mode = static_cast<ProcessingMode>(static_cast<int>(value)); break;
        case ParameterIndex::dryWet: params.mix = value; break;
        case ParameterIndex::frequency: params.frequencyHz = value; break;
        case ParameterIndex::q: params.q = value; break;
        case ParameterIndex::peakGain: params.peakGainDb = value; break;
        case ParameterIndex::monoSource: params.monoSource = static_cast<MonoSource>(static_cast<int>(value)); break;
        case ParameterIndex::voicing: params.voicing = static_cast<Voicing>(static_cast<int>(value)); break;
        default:
            params.noteGains[static_cast<size_t>(parameterIndex - ParameterIndex::firstNote)] = value;
            break;
    }

    return Status::ok;
}

float readValue(const ColourizerParameters& params, int parameterIndex)
{
    switch (parameterIndex)
    {
        case ParameterIndex::gain: return params.gain;
        case ParameterIndex::mode: return static_cast<float>(params.mode);
        case ParameterIndex::dryWet: return params.mix;
        case ParameterIndex::frequency: return params.frequencyHz;
        case ParameterIndex::q: return params.q;
        case ParameterIndex::peakGain: return params.peakGainDb;
        case ParameterIndex::monoSource: return static_cast<float>(params.monoSource);
        case ParameterIndex::voicing: return static_cast<float>(params.voicing);
        default: break;
    }

    if (parameterIndex >= ParameterIndex::firstNote && parameterIndex < ParameterIndex::count)
        return params.noteGains[static_cast<size_t>(parameterIndex - ParameterIndex::firstNote)];

    return 0.0f;
}
} // namespace colourdsp
