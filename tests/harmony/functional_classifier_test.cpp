// Tests for harmony/functional_classifier.h -- roman numerals, functions and
// chromatic chord detection.

#include "harmony/functional_classifier.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace satb {
namespace {

using test_helpers::analyze;
using test_helpers::key;

// ---------------------------------------------------------------------------
// Diatonic chords
// ---------------------------------------------------------------------------

TEST(FunctionalClassifierTest, DominantTriad) {
  ChordAnalysis analysis = analyze("G4 D4 B3 G2");
  EXPECT_EQ(analysis.numeral, "V");
  EXPECT_EQ(analysis.cipher, "");
  EXPECT_EQ(analysis.degree, 5);
  EXPECT_EQ(analysis.function, HarmonicFunction::Dominant);
  EXPECT_TRUE(analysis.is_diatonic);
  EXPECT_FALSE(analysis.uncertain);
  EXPECT_FALSE(analysis.chromatic.has_value());
}

TEST(FunctionalClassifierTest, DominantSeventhInRootPosition) {
  ChordAnalysis analysis = analyze("F4 D4 B3 G2");
  EXPECT_EQ(analysis.numeral, "V");
  EXPECT_EQ(analysis.cipher, "7,+");
  EXPECT_TRUE(analysis.has_seventh);
  EXPECT_EQ(analysis.displayLabel(), "V7,+");
}

TEST(FunctionalClassifierTest, SupertonicIsSubdominant) {
  ChordAnalysis analysis = analyze("F4 D4 A3 D3");
  EXPECT_EQ(analysis.numeral, "ii");
  EXPECT_EQ(analysis.function, HarmonicFunction::Subdominant);
}

TEST(FunctionalClassifierTest, TonicInMinorKey) {
  ChordAnalysis analysis = analyze("E5 C5 A4 A3", key("a_minor"));
  EXPECT_EQ(analysis.numeral, "i");
  EXPECT_EQ(analysis.degree, 1);
  EXPECT_EQ(analysis.function, HarmonicFunction::Tonic);
}

TEST(FunctionalClassifierTest, RaisedLeadingToneInMinorIsConventional) {
  ChordAnalysis analysis = analyze("D5 B4 G4 G3", key("c_minor"));
  EXPECT_EQ(analysis.numeral, "V");
  EXPECT_FALSE(analysis.is_diatonic);
  EXPECT_FALSE(analysis.uncertain);
  EXPECT_FALSE(analysis.chromatic.has_value());
}

TEST(FunctionalClassifierTest, LeadingToneDiminishedSeventhInMajor) {
  ChordAnalysis analysis = analyze("Ab4 F4 D4 B2");
  EXPECT_EQ(analysis.numeral, "vii°");
  EXPECT_EQ(analysis.displayLabel(), "vii°7t");
  EXPECT_FALSE(analysis.uncertain);
}

// ---------------------------------------------------------------------------
// Chromatic chords
// ---------------------------------------------------------------------------

TEST(FunctionalClassifierTest, SecondaryDominant) {
  ChordAnalysis analysis = analyze("D5 A4 F#4 D3");
  EXPECT_EQ(analysis.numeral, "V");
  EXPECT_EQ(analysis.target, "V");
  EXPECT_EQ(analysis.label(), "V/V");
  EXPECT_EQ(analysis.function, HarmonicFunction::Dominant);
  ASSERT_TRUE(analysis.chromatic.has_value());
  EXPECT_EQ(*analysis.chromatic, ChromaticKind::SecondaryDominant);
}

TEST(FunctionalClassifierTest, SecondarySeventhCipherPrecedesSlash) {
  EXPECT_EQ(analyze("C5 A4 F#4 D3").displayLabel(), "V7,+/V");
  EXPECT_EQ(analyze("Eb5 C5 A4 F#3").displayLabel(), "vii°7t/V");
}

TEST(FunctionalClassifierTest, Neapolitan) {
  ChordAnalysis analysis = analyze("Db5 Ab4 F4 F3");
  EXPECT_EQ(analysis.numeral, "N");
  EXPECT_EQ(analysis.cipher, "6");
  EXPECT_EQ(analysis.displayLabel(), "N6");
  EXPECT_EQ(analysis.function, HarmonicFunction::Subdominant);
  ASSERT_TRUE(analysis.chromatic.has_value());
  EXPECT_EQ(*analysis.chromatic, ChromaticKind::Neapolitan);
}

TEST(FunctionalClassifierTest, AugmentedSixthTypes) {
  ChordAnalysis german = analyze("C5 Gb4 Eb4 Ab2");
  EXPECT_EQ(german.numeral, "+6al");
  EXPECT_EQ(german.cipher, "");
  EXPECT_EQ(german.quality(), ChordQuality::Dominant7);
  EXPECT_EQ(german.rootPitchClass(), 8);
  EXPECT_FALSE(german.has_seventh);
  EXPECT_EQ(german.function, HarmonicFunction::Subdominant);
  ASSERT_TRUE(german.augmented_sixth.has_value());
  EXPECT_EQ(*german.augmented_sixth, AugmentedSixthType::German);

  EXPECT_EQ(analyze("C5 F#4 C4 Ab2").numeral, "+6it");

  ChordAnalysis french = analyze("F#5 D5 C5 Ab3");
  EXPECT_EQ(french.numeral, "+6fr");
  EXPECT_EQ(french.quality(), ChordQuality::AugmentedSixth);
  ASSERT_TRUE(french.chromatic.has_value());
  EXPECT_EQ(*french.chromatic, ChromaticKind::AugmentedSixth);
}

TEST(FunctionalClassifierTest, BorrowedChords) {
  ChordAnalysis minor_four = analyze("C5 Ab4 F4 F3");
  EXPECT_EQ(minor_four.numeral, "iv");
  EXPECT_EQ(minor_four.function, HarmonicFunction::Subdominant);
  ASSERT_TRUE(minor_four.chromatic.has_value());
  EXPECT_EQ(*minor_four.chromatic, ChromaticKind::Borrowed);

  ChordAnalysis flat_six = analyze("C5 Eb4 Ab3 Ab2");
  EXPECT_EQ(flat_six.numeral, "bVI");
  EXPECT_EQ(flat_six.function, HarmonicFunction::Subdominant);
}

TEST(FunctionalClassifierTest, UnrecognizedAlterationIsUncertain) {
  ChordAnalysis analysis = analyze("G#4 E4 C#4 C#3");
  EXPECT_EQ(analysis.numeral, "#i");
  EXPECT_TRUE(analysis.uncertain);
  EXPECT_EQ(analysis.label(), "#i?");
}

TEST(FunctionalClassifierTest, IndeterminateChord) {
  ChordAnalysis analysis = analyze("- - - C4");
  EXPECT_EQ(analysis.numeral, "?");
  EXPECT_EQ(analysis.degree, 0);
  EXPECT_EQ(analysis.function, HarmonicFunction::Tonic);
  EXPECT_FALSE(analysis.chromatic.has_value());
}

// ---------------------------------------------------------------------------
// romanNumeral
// ---------------------------------------------------------------------------

TEST(RomanNumeralTest, CaseAndGlyph) {
  EXPECT_EQ(romanNumeral(1, ChordQuality::Major), "I");
  EXPECT_EQ(romanNumeral(6, ChordQuality::Minor), "vi");
  EXPECT_EQ(romanNumeral(5, ChordQuality::Dominant7), "V");
  EXPECT_EQ(romanNumeral(7, ChordQuality::Diminished), "vii°");
  EXPECT_EQ(romanNumeral(2, ChordQuality::HalfDiminished7), "iiø");
  EXPECT_EQ(romanNumeral(3, ChordQuality::Augmented), "III+");
  EXPECT_EQ(romanNumeral(0, ChordQuality::Major), "?");
}

}  // namespace
}  // namespace satb
