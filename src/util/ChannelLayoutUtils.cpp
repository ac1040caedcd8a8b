#include "ChannelLayoutUtils.h"

namespace
{
juce::String labelForChannelType(juce::AudioChannelSet::ChannelType type)
{
    switch (type)
    {
        case juce::AudioChannelSet::left: return "L";
        case juce::AudioChannelSet::right: return "R";
        case juce::AudioChannelSet::centre: return "C";
        case juce::AudioChannelSet::LFE: return "LFE";
        case juce::AudioChannelSet::leftSurround: return "Ls";
        case juce::AudioChannelSet::rightSurround: return "Rs";
        case juce::AudioChannelSet::leftSurroundRear: return "Lrs";
        case juce::AudioChannelSet::rightSurroundRear: return "Rrs";
        case juce::AudioChannelSet::topFrontLeft: return "Ltf";
        case juce::AudioChannelSet::topFrontRight: return "Rtf";
        case juce::AudioChannelSet::topRearLeft: return "Ltr";
        case juce::AudioChannelSet::topRearRight: return "Rtr";
        default: break;
    }

    return {};
}
} // namespace

namespace ChannelLayoutUtils
{
std::vector<juce::String> getChannelNames(const juce::AudioChannelSet& layout)
{
    std::vector<juce::String> names;
    const int total = layout.size();
    names.reserve(static_cast<size_t>(total));

    const auto types = layout.getChannelTypes();
    for (int i = 0; i < total; ++i)
    {
        auto label = i < types.size() ? labelForChannelType(types[i]) : juce::String();
        if (label.isEmpty())
            label = "Ch " + juce::String(i + 1);
        names.push_back(label);
    }

    return names;
}

juce::String describeLayout(const juce::AudioChannelSet& layout)
{
    if (layout.isDisabled())
        return "disabled";

    juce::StringArray labels;
    for (const auto& name : getChannelNames(layout))
        labels.add(name);

    auto description = layout.getDescription();
    if (description.isEmpty())
        description = juce::String(layout.size()) + " channels";

    return description + " (" + labels.joinIntoString(" ") + ")";
}
} // namespace ChannelLayoutUtils
