#include <gtest/gtest.h>
#include "idcard/hk_id.h"

using namespace idcard;
using namespace idcard::hk;

class HKIdTest : public ::testing::Test {
protected:
    HKValidator validator;
};

TEST_F(HKIdTest, LetterValues) {
    EXPECT_EQ(letterValue('A'), 10u);
    EXPECT_EQ(letterValue('G'), 16u);
    EXPECT_EQ(letterValue('Z'), 35u);
    EXPECT_EQ(letterValue('a'), 0u);
    EXPECT_EQ(letterValue('1'), 0u);
}

TEST_F(HKIdTest, SingleLetterValid) {
    EXPECT_TRUE(validator.validate("G123456(A)").valid);
    EXPECT_TRUE(validator.validate("G123456A").valid);
    EXPECT_TRUE(validator.validate("L555555(0)").valid);
    EXPECT_TRUE(validator.validate("C123456(9)").valid);
    EXPECT_TRUE(validator.validate("A123456(3)").valid);
}

TEST_F(HKIdTest, DoubleLetterValid) {
    EXPECT_TRUE(validator.validate("AB987654(3)").valid);
    EXPECT_TRUE(validator.validate("AB9876543").valid);
    EXPECT_TRUE(validator.validate("WX123456(9)").valid);
}

TEST_F(HKIdTest, SurroundingWhitespace) {
    EXPECT_TRUE(validator.validate("  G123456(A)\t").valid);
}

TEST_F(HKIdTest, ChecksumMismatch) {
    auto result = validator.validate("AY987654(A)");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.code, ValidationError::CHECKSUM_MISMATCH);
    EXPECT_EQ(result.jurisdiction, Jurisdiction::HK);

    EXPECT_FALSE(validator.validate("G123456(B)").valid);
    EXPECT_FALSE(validator.validate("G123456(0)").valid);
    EXPECT_FALSE(validator.validate("Z683365(5)").valid);
}

TEST_F(HKIdTest, LowerCaseIsNotAccepted) {
    auto result = validator.validate("G123456(a)");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.code, ValidationError::UNRECOGNIZED_FORMAT);

    EXPECT_FALSE(validator.validate("g123456(A)").valid);
    EXPECT_FALSE(validator.matches("g123456(A)"));
}

TEST_F(HKIdTest, MalformedPatterns) {
    EXPECT_FALSE(validator.validate("").valid);
    EXPECT_FALSE(validator.validate("G12345(A)").valid);      // five digits
    EXPECT_FALSE(validator.validate("G1234567(A)").valid);    // seven digits
    EXPECT_FALSE(validator.validate("ABC123456(7)").valid);   // three letters
    EXPECT_FALSE(validator.validate("G123456(B)X").valid);
    EXPECT_FALSE(validator.validate("G123456(AA)").valid);
    EXPECT_FALSE(validator.validate("G123456[A]").valid);
    EXPECT_FALSE(validator.validate("G123456(A)(A)(A)").valid);
}

TEST_F(HKIdTest, Matches) {
    EXPECT_TRUE(validator.matches("G123456(A)"));
    EXPECT_TRUE(validator.matches("AB987654(3)"));
    EXPECT_FALSE(validator.matches("A123456789"));
    EXPECT_FALSE(validator.matches("1123456(A)"));
    EXPECT_FALSE(validator.matches("230127197908177456"));
}
