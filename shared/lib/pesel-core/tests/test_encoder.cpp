/**
 * @file test_encoder.cpp
 * @brief Unit tests for the PESEL encoder
 */

#include <gtest/gtest.h>
#include <pesel/core/encoder.h>
#include <pesel/core/checksum.h>
#include "test_helpers.h"

using namespace pesel::core;
using namespace test_helpers;

class EncoderTest : public ::testing::Test {
protected:
    const std::vector<CalendarDate> sampleDates_ = {
        CalendarDate::of(1800, 1, 1),
        CalendarDate::of(1899, 12, 31),
        CalendarDate::of(1944, 5, 14),
        CalendarDate::of(1999, 1, 1),
        CalendarDate::of(2000, 2, 29),
        CalendarDate::of(2020, 1, 1),
        CalendarDate::of(2100, 1, 1),
        CalendarDate::of(2299, 12, 31),
    };
    const std::vector<int> sampleSequentials_ = {-5, 0, 1, 2, 135, 4998, 4999, 9998, 9999, 12000};
};

// ============================================================================
// Century Month Offset
// ============================================================================

TEST_F(EncoderTest, CenturyOffsetTable) {
    EXPECT_EQ(centuryMonthOffset(1800), 80);
    EXPECT_EQ(centuryMonthOffset(1899), 80);
    EXPECT_EQ(centuryMonthOffset(1900), 0);
    EXPECT_EQ(centuryMonthOffset(1999), 0);
    EXPECT_EQ(centuryMonthOffset(2000), 20);
    EXPECT_EQ(centuryMonthOffset(2099), 20);
    EXPECT_EQ(centuryMonthOffset(2100), 40);
    EXPECT_EQ(centuryMonthOffset(2199), 40);
    EXPECT_EQ(centuryMonthOffset(2200), 60);
    EXPECT_EQ(centuryMonthOffset(2299), 60);
}

TEST_F(EncoderTest, MonthField_PerCentury) {
    EXPECT_EQ(monthField(encode(CalendarDate::of(1800, 1, 1), 0, Sex::MALE)), "81");
    EXPECT_EQ(monthField(encode(CalendarDate::of(1900, 1, 1), 0, Sex::MALE)), "01");
    EXPECT_EQ(monthField(encode(CalendarDate::of(2000, 1, 1), 0, Sex::MALE)), "21");
    EXPECT_EQ(monthField(encode(CalendarDate::of(2020, 1, 1), 0, Sex::MALE)), "21");
    EXPECT_EQ(monthField(encode(CalendarDate::of(2100, 1, 1), 0, Sex::MALE)), "41");
    EXPECT_EQ(monthField(encode(CalendarDate::of(2200, 12, 1), 0, Sex::MALE)), "72");
}

TEST_F(EncoderTest, FormatDate) {
    EXPECT_EQ(formatDateForPesel(CalendarDate::of(1800, 1, 1)), "008101");
    EXPECT_EQ(formatDateForPesel(CalendarDate::of(1944, 5, 14)), "440514");
    EXPECT_EQ(formatDateForPesel(CalendarDate::of(2020, 1, 5)), "202105");
    EXPECT_EQ(formatDateForPesel(CalendarDate::of(2299, 12, 31)), "997231");
}

// ============================================================================
// Sequential + Sex Digits
// ============================================================================

TEST_F(EncoderTest, Normalize_MatchingParityUnchanged) {
    EXPECT_EQ(normalizeSequentialNumber(135, Sex::MALE), 135);
    EXPECT_EQ(normalizeSequentialNumber(362, Sex::FEMALE), 362);
}

TEST_F(EncoderTest, Normalize_AdjustsTowardRequestedSex) {
    EXPECT_EQ(normalizeSequentialNumber(362, Sex::MALE), 363);
    EXPECT_EQ(normalizeSequentialNumber(135, Sex::FEMALE), 134);
}

TEST_F(EncoderTest, Normalize_Boundaries) {
    EXPECT_EQ(normalizeSequentialNumber(9999, Sex::FEMALE), 9998);
    EXPECT_EQ(normalizeSequentialNumber(9999, Sex::MALE), 9999);
    EXPECT_EQ(normalizeSequentialNumber(0, Sex::MALE), 1);
    EXPECT_EQ(normalizeSequentialNumber(0, Sex::FEMALE), 0);
}

TEST_F(EncoderTest, Normalize_ClampsOutOfRange) {
    EXPECT_EQ(normalizeSequentialNumber(-7, Sex::FEMALE), 0);
    EXPECT_EQ(normalizeSequentialNumber(-7, Sex::MALE), 1);
    EXPECT_EQ(normalizeSequentialNumber(20000, Sex::MALE), 9999);
    EXPECT_EQ(normalizeSequentialNumber(20000, Sex::FEMALE), 9998);
}

TEST_F(EncoderTest, FormatSequential_ZeroPadded) {
    EXPECT_EQ(formatSequentialAndSex(7, Sex::MALE), "0007");
    EXPECT_EQ(formatSequentialAndSex(7, Sex::FEMALE), "0006");
    EXPECT_EQ(formatSequentialAndSex(9999, Sex::FEMALE), "9998");
}

// ============================================================================
// Full Encoding
// ============================================================================

TEST_F(EncoderTest, Encode_KnownValues) {
    EXPECT_EQ(encode(CalendarDate::of(1944, 5, 14), 135, Sex::MALE).getValue(), "44051401359");
    EXPECT_EQ(encode(CalendarDate::of(1902, 7, 8), 362, Sex::FEMALE).getValue(), "02070803628");
}

TEST_F(EncoderTest, Encode_AlwaysElevenDigitsWithValidChecksum) {
    for (const auto& date : sampleDates_) {
        for (int seq : sampleSequentials_) {
            for (Sex sex : {Sex::MALE, Sex::FEMALE}) {
                const std::string& value = encode(date, seq, sex).getValue();
                ASSERT_TRUE(isElevenDigits(value)) << value;
                EXPECT_EQ(value[10] - '0', referenceCheckDigit(value)) << value;
                EXPECT_TRUE(isChecksumValid(value)) << value;
            }
        }
    }
}

TEST_F(EncoderTest, Encode_ParityMatchesSex) {
    for (const auto& date : sampleDates_) {
        for (int seq : sampleSequentials_) {
            EXPECT_EQ(blockParity(encode(date, seq, Sex::MALE).getValue()), 1) << seq;
            EXPECT_EQ(blockParity(encode(date, seq, Sex::FEMALE).getValue()), 0) << seq;
        }
    }
}

TEST_F(EncoderTest, Encode_Deterministic) {
    auto date = CalendarDate::of(1987, 6, 21);
    auto first = encode(date, 4321, Sex::MALE);
    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(encode(date, 4321, Sex::MALE), first) << "Changed at iteration " << i;
    }
}

// ============================================================================
// Single Generation
// ============================================================================

TEST_F(EncoderTest, GenerateSingle_DefaultsToZeroFemale) {
    auto id = generateSingle(CalendarDate::of(1999, 1, 1));
    EXPECT_EQ(id.sequentialBlock(), 0);
    EXPECT_EQ(id.sex(), Sex::FEMALE);
}

TEST_F(EncoderTest, GenerateSingle_SexFromParityWhenOmitted) {
    auto id = generateSingle(CalendarDate::of(1999, 1, 1), 4321);
    EXPECT_EQ(id.sequentialBlock(), 4321);
    EXPECT_EQ(id.sex(), Sex::MALE);
}

TEST_F(EncoderTest, GenerateSingle_ExplicitSexAdjusts) {
    auto id = generateSingle(CalendarDate::of(1999, 1, 1), 9999, Sex::FEMALE);
    EXPECT_EQ(id.sequentialBlock(), 9998);
}

TEST_F(EncoderTest, GenerateSingle_ClampsBeforeDerivingSex) {
    auto id = generateSingle(CalendarDate::of(1999, 1, 1), 10001);
    EXPECT_EQ(id.sequentialBlock(), 9999);
    EXPECT_EQ(id.sex(), Sex::MALE);
}
