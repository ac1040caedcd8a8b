#pragma once

#include <array>
#include "Biquad.h"
#include "../util/ParamIDs.h"

namespace colourdsp
{
// One peaking section per semitone from C0 (MIDI 12) to B8 (MIDI 119).
constexpr int kNoteBankFirstMidiNote = 12;
constexpr int kNoteBankLastMidiNote = 119;
constexpr int kNoteBankSections = kNoteBankLastMidiNote - kNoteBankFirstMidiNote + 1;

// Taps shared by every bank at one sample rate.
struct NoteBankDesign
{
    std::array<FilterCoefficients, kNoteBankSections> coefficients {};
    // Sections too close to Nyquist for this sample rate stay inactive.
    std::array<bool, kNoteBankSections> active {};
};

// Equal-tempered centre frequency of a section (A4 = 440 Hz).
double noteBankSectionFrequency(int section);
// Pitch class 0..11 (C..B) of a section.
int noteBankSectionPitchClass(int section);
// Designs every section with the shared q and gain. Fails if q/gain/sample rate are invalid.
Status designNoteBank(double sampleRate, double q, double gainDb, NoteBankDesign& out);

// Scale-gated resonator bank: output is the summed resonance of the enabled notes,
// with the direct signal removed.
class NoteBank
{
public:
    void reset();
    void setDesign(const NoteBankDesign& design);
    void setNoteGains(const std::array<float, ParamIDs::kNumNotes>& gains);

    float processSample(float x);

    int getNumActiveSections() const;

private:
    std::array<Biquad, kNoteBankSections> sections {};
    std::array<bool, kNoteBankSections> active {};
    std::array<float, ParamIDs::kNumNotes> noteGains {};
};
} // namespace colourdsp
