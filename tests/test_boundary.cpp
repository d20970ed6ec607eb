/**
 * Boundary Tests
 *
 * Edge values for lengths, dates and check characters across every
 * supported format.
 */

#include <gtest/gtest.h>
#include "idcard/validator.h"
#include "idcard/identity.h"
#include "idcard/checksum.h"
#include "idcard/cn_id.h"
#include "idcard/fake.h"
#include <string>

using namespace idcard;

class BoundaryTest : public ::testing::Test {
protected:
    IdentityValidator validator;

    std::string withCheck(const std::string& body) {
        char symbol = '\0';
        EXPECT_TRUE(checksum::cnCheckSymbol(body, symbol));
        return body + symbol;
    }
};

// =============================================================================
// Lengths
// =============================================================================

TEST_F(BoundaryTest, EmptyAndWhitespace) {
    EXPECT_FALSE(validator.validate("").valid);
    EXPECT_FALSE(validator.validate(" ").valid);
    EXPECT_FALSE(validator.validate("\t\r\n").valid);
    EXPECT_FALSE(Identity("   ").isValid());
}

TEST_F(BoundaryTest, MainlandLengthsOffByOne) {
    const std::string number = "230127197908177456";
    EXPECT_FALSE(validator.validate(number.substr(0, 17)).valid);
    EXPECT_FALSE(validator.validate(number + "0").valid);
    EXPECT_FALSE(validator.validate("63212382092705").valid);
    EXPECT_FALSE(validator.validate("6321238209270510").valid);
}

TEST_F(BoundaryTest, EveryLengthUpToTwenty) {
    for (size_t length = 0; length <= 20; length++) {
        std::string digits(length, '1');
        auto result = validator.validate(digits);
        if (length != cn::V1_LENGTH && length != cn::V2_LENGTH && length != 8) {
            EXPECT_FALSE(result.valid) << length;
            EXPECT_EQ(result.jurisdiction, Jurisdiction::UNKNOWN) << length;
        }
    }
}

// =============================================================================
// Dates
// =============================================================================

TEST_F(BoundaryTest, FirstAndLastDayOfYear) {
    EXPECT_TRUE(validator.validate(withCheck("11010519900101001")).valid);
    EXPECT_TRUE(validator.validate(withCheck("11010519901231001")).valid);
    EXPECT_FALSE(validator.validate(withCheck("11010519900001001")).valid);
    EXPECT_FALSE(validator.validate(withCheck("11010519901232001")).valid);
    EXPECT_FALSE(validator.validate(withCheck("11010519900100001")).valid);
}

TEST_F(BoundaryTest, LeapDays) {
    EXPECT_TRUE(validator.validate(withCheck("11010520000229001")).valid);
    EXPECT_TRUE(validator.validate(withCheck("44030520240229001")).valid);
    EXPECT_FALSE(validator.validate(withCheck("11010519000229001")).valid);
    EXPECT_FALSE(validator.validate(withCheck("11010521000229001")).valid);
    EXPECT_FALSE(validator.validate(withCheck("11010520230229001")).valid);
}

TEST_F(BoundaryTest, YearZeroRejected) {
    EXPECT_FALSE(validator.validate(withCheck("11010500000101001")).valid);
    EXPECT_TRUE(validator.validate(withCheck("11010500010101001")).valid);
    EXPECT_TRUE(validator.validate(withCheck("11010599991231001")).valid);
}

TEST_F(BoundaryTest, LegacyCenturyIsFixed) {
    // YY=00 means 1900, which has no Feb 29
    EXPECT_FALSE(validator.validate("110105000229001").valid);
    EXPECT_TRUE(validator.validate("110105000228001").valid);

    Identity id("110105000228001");
    ASSERT_TRUE(id.isValid());
    EXPECT_EQ(id.year(), 1900);
}

// =============================================================================
// Check characters
// =============================================================================

TEST_F(BoundaryTest, EveryWrongCheckSymbolRejected) {
    const std::string body = "23012719790817745";
    const std::string symbols = "0123456789X";
    for (char c : symbols) {
        bool expected = (c == '6');
        EXPECT_EQ(validator.validate(body + c).valid, expected) << c;
    }
}

TEST_F(BoundaryTest, HongKongCheckA) {
    EXPECT_TRUE(validator.validate("G123456(A)").valid);
    EXPECT_TRUE(validator.validate("G123456A").valid);
    for (char c = '0'; c <= '9'; c++) {
        std::string number = std::string("G123456(") + c + ")";
        EXPECT_FALSE(validator.validate(number).valid) << number;
    }
}

TEST_F(BoundaryTest, HongKongMaximumLength) {
    EXPECT_TRUE(validator.validate("AB987654(3)").valid);
    EXPECT_FALSE(validator.validate("AB987654(3))").valid);
    EXPECT_FALSE(validator.validate("AB987654((3)").valid);
}

TEST_F(BoundaryTest, TaiwanGenderMarkers) {
    for (char marker = '0'; marker <= '9'; marker++) {
        std::string number = std::string("A") + marker + "23456789";
        auto result = validator.validate(number);
        if (marker != '1' && marker != '2') {
            EXPECT_EQ(result.code, ValidationError::INVALID_GENDER_MARKER) << number;
        }
    }
}

// =============================================================================
// Generation
// =============================================================================

TEST_F(BoundaryTest, GenerateFirstDayOfYear) {
    FakeGenerator generator;
    utils::CalendarDate new_year = utils::makeDate(2024, 1, 1);

    for (int i = 0; i < 20; i++) {
        auto result = generator.generate(FakeOptions().withMinYear(2024), new_year);
        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.number.substr(6, 8), "20240101");
    }
}

TEST_F(BoundaryTest, GenerateYearOne) {
    FakeGenerator generator;
    auto result = generator.generate(FakeOptions().withMinYear(1).withMaxYear(1),
                                     utils::makeDate(2024, 6, 1));
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.number.substr(6, 4), "0001");
    EXPECT_TRUE(validator.validate(result.number).valid);
}
