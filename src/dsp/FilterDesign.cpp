#include "FilterDesign.h"
#include <cmath>
#include <complex>

namespace colourdsp
{
Status makePeakCoefficients(double sampleRate,
                            double frequencyHz,
                            double q,
                            double gainDb,
                            FilterCoefficients& out)
{
    if (! std::isfinite(sampleRate) || ! std::isfinite(frequencyHz)
        || ! std::isfinite(q) || ! std::isfinite(gainDb))
        return Status::invalidParameter;
    if (sampleRate <= 0.0 || frequencyHz <= 0.0 || q <= 0.0)
        return Status::invalidParameter;
    if (frequencyHz >= sampleRate * 0.5)
        return Status::invalidParameter;

    constexpr double kPi = 3.14159265358979323846;
    const double omega = 2.0 * kPi * frequencyHz / sampleRate;
    const double sinW = std::sin(omega);
    const double cosW = std::cos(omega);
    const double alpha = sinW / (2.0 * q);
    const double a = std::pow(10.0, gainDb / 40.0);

    const double a0 = 1.0 + alpha / a;
    const double invA0 = 1.0 / a0;

    out.b0 = (1.0 + alpha * a) * invA0;
    out.b1 = (-2.0 * cosW) * invA0;
    out.b2 = (1.0 - alpha * a) * invA0;
    out.a1 = (-2.0 * cosW) * invA0;
    out.a2 = (1.0 - alpha / a) * invA0;
    return Status::ok;
}

double magnitudeAt(const FilterCoefficients& c, double frequencyHz, double sampleRate)
{
    constexpr double kPi = 3.14159265358979323846;
    const double w = 2.0 * kPi * frequencyHz / sampleRate;
    const std::complex<double> z = std::exp(std::complex<double>(0.0, -w));
    const std::complex<double> z2 = z * z;
    const std::complex<double> numerator = c.b0 + c.b1 * z + c.b2 * z2;
    const std::complex<double> denominator = 1.0 + c.a1 * z + c.a2 * z2;
    return std::abs(numerator / denominator);
}

bool isStable(const FilterCoefficients& c)
{
    // Stability triangle for z^2 + a1 z + a2.
    return std::abs(c.a2) < 1.0 && std::abs(c.a1) < 1.0 + c.a2;
}
} // namespace colourdsp
