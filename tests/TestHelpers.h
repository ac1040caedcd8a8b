#pragma once

#include <cmath>
#include <vector>

namespace testutil
{
constexpr double kTwoPi = 6.283185307179586;

// Unit-amplitude sine.
inline std::vector<float> makeSine(double frequencyHz, double sampleRate, int numSamples)
{
    std::vector<float> out(static_cast<size_t>(numSamples));
    for (int i = 0; i < numSamples; ++i)
        out[static_cast<size_t>(i)] = static_cast<float>(std::sin(kTwoPi * frequencyHz * i / sampleRate));
    return out;
}

// Deterministic pseudo-noise in [-1, 1).
inline std::vector<float> makeNoise(int numSamples, unsigned int seed = 1u)
{
    std::vector<float> out(static_cast<size_t>(numSamples));
    unsigned int state = seed;
    for (auto& s : out)
    {
        state = state * 1664525u + 1013904223u;
        s = static_cast<float>(state >> 8) / static_cast<float>(1u << 23) - 1.0f;
    }
    return out;
}

inline double meanAbs(const std::vector<float>& data, size_t start = 0)
{
    if (start >= data.size())
        return 0.0;
    double sum = 0.0;
    for (size_t i = start; i < data.size(); ++i)
        sum += std::abs(static_cast<double>(data[i]));
    return sum / static_cast<double>(data.size() - start);
}

inline double meanAbsDifference(const std::vector<float>& a, const std::vector<float>& b, size_t start = 0)
{
    const size_t n = a.size() < b.size() ? a.size() : b.size();
    if (start >= n)
        return 0.0;
    double sum = 0.0;
    for (size_t i = start; i < n; ++i)
        sum += std::abs(static_cast<double>(a[i]) - static_cast<double>(b[i]));
    return sum / static_cast<double>(n - start);
}

inline float maxAbsDifference(const std::vector<float>& a, const std::vector<float>& b)
{
    float worst = 0.0f;
    const size_t n = a.size() < b.size() ? a.size() : b.size();
    for (size_t i = 0; i < n; ++i)
        worst = std::fmax(worst, std::abs(a[i] - b[i]));
    return worst;
}
} // namespace testutil
