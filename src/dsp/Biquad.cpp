#include "Biquad.h"

namespace colourdsp
{
void Biquad::reset()
{
    state = {};
}

void Biquad::setCoefficients(const FilterCoefficients& newCoefficients)
{
    coeffs = newCoefficients;
}

const FilterCoefficients& Biquad::getCoefficients() const
{
    return coeffs;
}

float Biquad::processSample(float x)
{
    const double in = x;
    const double y = coeffs.b0 * in + coeffs.b1 * state.x1 + coeffs.b2 * state.x2
        - coeffs.a1 * state.y1 - coeffs.a2 * state.y2;
    state.x2 = state.x1;
    state.x1 = in;
    state.y2 = state.y1;
    state.y1 = y;
    return static_cast<float>(y);
}

void Biquad::processBlock(float* data, int numSamples)
{
    if (data == nullptr || numSamples <= 0)
        return;

    const double b0 = coeffs.b0;
    const double b1 = coeffs.b1;
    const double b2 = coeffs.b2;
    const double a1 = coeffs.a1;
    const double a2 = coeffs.a2;
    double x1 = state.x1;
    double x2 = state.x2;
    double y1 = state.y1;
    double y2 = state.y2;

    for (int i = 0; i < numSamples; ++i)
    {
        const double x = data[i];
        const double y = b0 * x + b1 * x1 + b2 * x2 - a1 * y1 - a2 * y2;
        x2 = x1;
        x1 = x;
        y2 = y1;
        y1 = y;
        data[i] = static_cast<float>(y);
    }

    state.x1 = x1;
    state.x2 = x2;
    state.y1 = y1;
    state.y2 = y2;
}

const BiquadState& Biquad::getState() const
{
    return state;
}
} // namespace colourdsp
