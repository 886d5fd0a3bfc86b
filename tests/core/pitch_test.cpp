// Tests for core/pitch.h -- spelled pitch model and note-name parsing.

#include "core/pitch.h"

#include <gtest/gtest.h>

namespace satb {
namespace {

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

TEST(PitchFromStringTest, ParsesNaturalNote) {
  auto pitch = pitchFromString("C4");
  ASSERT_TRUE(pitch.has_value());
  EXPECT_EQ(pitch->letter, Letter::C);
  EXPECT_EQ(pitch->accidental, 0);
  EXPECT_EQ(pitch->octave, 4);
  EXPECT_EQ(pitch->value(), 60);
}

TEST(PitchFromStringTest, ParsesSharpsAndFlats) {
  auto sharp = pitchFromString("F#4");
  ASSERT_TRUE(sharp.has_value());
  EXPECT_EQ(sharp->accidental, 1);
  EXPECT_EQ(sharp->pitchClass(), 6);

  auto flat = pitchFromString("Bb3");
  ASSERT_TRUE(flat.has_value());
  EXPECT_EQ(flat->letter, Letter::B);
  EXPECT_EQ(flat->accidental, -1);
  EXPECT_EQ(flat->value(), 58);

  auto double_flat = pitchFromString("Ebb4");
  ASSERT_TRUE(double_flat.has_value());
  EXPECT_EQ(double_flat->accidental, -2);
  EXPECT_EQ(double_flat->pitchClass(), 2);
}

TEST(PitchFromStringTest, AcceptsLowercaseLetter) {
  auto pitch = pitchFromString("g2");
  ASSERT_TRUE(pitch.has_value());
  EXPECT_EQ(pitch->letter, Letter::G);
  EXPECT_EQ(pitch->value(), 43);
}

TEST(PitchFromStringTest, CrossesOctaveBoundaryBySpelling) {
  // Cb4 sounds as B3 but keeps its letter and octave.
  auto pitch = pitchFromString("Cb4");
  ASSERT_TRUE(pitch.has_value());
  EXPECT_EQ(pitch->value(), 59);
  EXPECT_EQ(pitch->pitchClass(), 11);
  EXPECT_EQ(pitchToString(*pitch), "Cb4");
}

TEST(PitchFromStringTest, RejectsMalformedNames) {
  EXPECT_FALSE(pitchFromString("").has_value());
  EXPECT_FALSE(pitchFromString("H4").has_value());
  EXPECT_FALSE(pitchFromString("C").has_value());
  EXPECT_FALSE(pitchFromString("C#b4").has_value());
  EXPECT_FALSE(pitchFromString("C4x").has_value());
  EXPECT_FALSE(pitchFromString("C###4").has_value());
  EXPECT_FALSE(pitchFromString("C123").has_value());
}

TEST(PitchFromStringTest, RejectsOutOfRange) {
  EXPECT_FALSE(pitchFromString("C10").has_value());
  EXPECT_FALSE(pitchFromString("Cb-1").has_value());
  EXPECT_TRUE(pitchFromString("C-1").has_value());
}

// ---------------------------------------------------------------------------
// Formatting and arithmetic
// ---------------------------------------------------------------------------

TEST(PitchToStringTest, FormatsAccidentals) {
  EXPECT_EQ(pitchToString(*pitchFromString("F##3")), "F##3");
  EXPECT_EQ(pitchToString(*pitchFromString("Ab5")), "Ab5");
  EXPECT_EQ(pitchNameToString(Letter::E, -1), "Eb");
  EXPECT_EQ(pitchNameToString(Letter::D, 0), "D");
}

TEST(PitchTest, SemitonesAreSigned) {
  auto c4 = *pitchFromString("C4");
  auto g4 = *pitchFromString("G4");
  EXPECT_EQ(semitones(c4, g4), 7);
  EXPECT_EQ(semitones(g4, c4), -7);
}

TEST(PitchTest, EnharmonicsShareValueButNotIdentity) {
  auto sharp = *pitchFromString("G#4");
  auto flat = *pitchFromString("Ab4");
  EXPECT_EQ(sharp.value(), flat.value());
  EXPECT_NE(sharp, flat);
  EXPECT_NE(sharp.diatonicIndex(), flat.diatonicIndex());
}

TEST(LetterTest, ShiftAndDistanceWrap) {
  EXPECT_EQ(shiftLetter(Letter::A, 2), Letter::C);
  EXPECT_EQ(shiftLetter(Letter::C, -1), Letter::B);
  EXPECT_EQ(letterDistance(Letter::G, Letter::C), 3);
  EXPECT_EQ(letterDistance(Letter::C, Letter::G), 4);
}

TEST(LetterTest, AccidentalForPitchClass) {
  EXPECT_EQ(accidentalForPitchClass(Letter::F, 6), 1);
  EXPECT_EQ(accidentalForPitchClass(Letter::C, 11), -1);
  EXPECT_EQ(accidentalForPitchClass(Letter::E, 4), 0);
  EXPECT_FALSE(accidentalForPitchClass(Letter::C, 6).has_value());
}

TEST(MakePitchTest, ValidatesComponents) {
  EXPECT_TRUE(makePitch(Letter::A, 0, 4).has_value());
  EXPECT_FALSE(makePitch(Letter::A, 3, 4).has_value());
  EXPECT_FALSE(makePitch(Letter::A, 0, 10).has_value());
  EXPECT_FALSE(makePitch(Letter::G, 1, 9).has_value());
}

}  // namespace
}  // namespace satb
