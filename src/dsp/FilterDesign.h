#pragma once

#include "Status.h"

namespace colourdsp
{
// Normalised (a0 = 1) second-order section taps.
struct FilterCoefficients
{
    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    double a1 = 0.0;
    double a2 = 0.0;
};

// Cookbook peaking-EQ design. Leaves `out` untouched and returns invalidParameter
// unless sampleRate > 0, 0 < frequencyHz < sampleRate / 2, q > 0 and all inputs are finite.
Status makePeakCoefficients(double sampleRate,
                            double frequencyHz,
                            double q,
                            double gainDb,
                            FilterCoefficients& out);

// Magnitude response |H(e^jw)| at frequencyHz.
double magnitudeAt(const FilterCoefficients& c, double frequencyHz, double sampleRate);

// Poles strictly inside the unit circle.
bool isStable(const FilterCoefficients& c);
} // namespace colourdsp
