#pragma once

#include "FilterDesign.h"

namespace colourdsp
{
// Two most recent input and output samples of one section.
struct BiquadState
{
    double x1 = 0.0;
    double x2 = 0.0;
    double y1 = 0.0;
    double y2 = 0.0;
};

// Direct form I biquad. Owns its history; coefficients are swapped without touching it.
class Biquad
{
public:
    // Zero the history.
    void reset();
    // Replace the active taps, history kept.
    void setCoefficients(const FilterCoefficients& newCoefficients);
    const FilterCoefficients& getCoefficients() const;

    // Process a single sample or a block in place.
    float processSample(float x);
    void processBlock(float* data, int numSamples);

    const BiquadState& getState() const;

private:
    FilterCoefficients coeffs;
    BiquadState state;
};
} // namespace colourdsp
