#include "NoteBank.h"
#include <cmath>

namespace colourdsp
{
double noteBankSectionFrequency(int section)
{
    const int midiNote = kNoteBankFirstMidiNote + section;
    return 440.0 * std::pow(2.0, (midiNote - 69) / 12.0);
}

int noteBankSectionPitchClass(int section)
{
    return (kNoteBankFirstMidiNote + section) % ParamIDs::kNumNotes;
}

Status designNoteBank(double sampleRate, double q, double gainDb, NoteBankDesign& out)
{
    if (! std::isfinite(sampleRate) || sampleRate <= 0.0)
        return Status::invalidParameter;

    NoteBankDesign design;
    const double limit = sampleRate * 0.5 * 0.99;
    for (int section = 0; section < kNoteBankSections; ++section)
    {
        const double frequency = noteBankSectionFrequency(section);
        if (frequency >= limit)
            continue;

        const auto status = makePeakCoefficients(sampleRate, frequency, q, gainDb,
                                                 design.coefficients[static_cast<size_t>(section)]);
        if (status != Status::ok)
            return status;
        design.active[static_cast<size_t>(section)] = true;
    }

    out = design;
    return Status::ok;
}

void NoteBank::reset()
{
    for (auto& section : sections)
        section.reset();
}

void NoteBank::setDesign(const NoteBankDesign& design)
{
    for (size_t i = 0; i < sections.size(); ++i)
        sections[i].setCoefficients(design.coefficients[i]);
    active = design.active;
}

void NoteBank::setNoteGains(const std::array<float, ParamIDs::kNumNotes>& gains)
{
    noteGains = gains;
}

float NoteBank::processSample(float x)
{
    double sum = 0.0;
    double gainSum = 0.0;
    for (int section = 0; section < kNoteBankSections; ++section)
    {
        const auto index = static_cast<size_t>(section);
        if (! active[index])
            continue;

        // Silent notes keep running so re-enabling them is continuous.
        const double y = sections[index].processSample(x);
        const double g = noteGains[static_cast<size_t>(noteBankSectionPitchClass(section))];
        sum += y * g;
        gainSum += g;
    }

    return static_cast<float>(sum - gainSum * x);
}

int NoteBank::getNumActiveSections() const
{
    int count = 0;
    for (const bool isActive : active)
        if (isActive)
            ++count;
    return count;
}
} // namespace colourdsp
