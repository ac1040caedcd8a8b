#pragma once

#include <JuceHeader.h>

namespace Version
{
inline juce::String versionString()
{
#if defined(COLOURIZER_VERSION)
    return COLOURIZER_VERSION;
#else
    return "0.0.0";
#endif
}

inline juce::String displayString()
{
    return "Colourizer v" + versionString();
}
} // namespace Version
