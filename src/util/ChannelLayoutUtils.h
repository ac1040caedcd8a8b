#pragma once

#include <JuceHeader.h>

namespace ChannelLayoutUtils
{
// Short speaker labels, falling back to "Ch N" for discrete channels.
std::vector<juce::String> getChannelNames(const juce::AudioChannelSet& layout);
// e.g. "Stereo (L R)" for log lines.
juce::String describeLayout(const juce::AudioChannelSet& layout);
} // namespace ChannelLayoutUtils
