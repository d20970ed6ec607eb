#include <gtest/gtest.h>
#include "idcard/tw_id.h"
#include <cstring>

using namespace idcard;
using namespace idcard::tw;

class TWIdTest : public ::testing::Test {
protected:
    TWValidator validator;
};

TEST_F(TWIdTest, ValidNumbers) {
    EXPECT_TRUE(validator.validate("A123456789").valid);
    EXPECT_TRUE(validator.validate("B142610160").valid);
    EXPECT_TRUE(validator.validate("Q155304682").valid);
    EXPECT_TRUE(validator.validate("A225376624").valid);
    EXPECT_TRUE(validator.validate("a123456789").valid);
}

TEST_F(TWIdTest, LateLetters) {
    // I, O, W and Z are coded out of alphabetical order
    EXPECT_TRUE(validator.validate("Z100000002").valid);
    EXPECT_TRUE(validator.validate("I100000003").valid);
    EXPECT_TRUE(validator.validate("O200000006").valid);
}

TEST_F(TWIdTest, ChecksumMismatch) {
    auto result = validator.validate("Q155304680");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.code, ValidationError::CHECKSUM_MISMATCH);
    EXPECT_EQ(result.jurisdiction, Jurisdiction::TW);
}

TEST_F(TWIdTest, GenderMarker) {
    auto result = validator.validate("A323456789");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.code, ValidationError::INVALID_GENDER_MARKER);

    EXPECT_EQ(validator.validate("A023456789").code, ValidationError::INVALID_GENDER_MARKER);
}

TEST_F(TWIdTest, Malformed) {
    EXPECT_EQ(validator.validate("A12345678").code, ValidationError::UNRECOGNIZED_FORMAT);
    EXPECT_EQ(validator.validate("A1234567890").code, ValidationError::UNRECOGNIZED_FORMAT);
    EXPECT_EQ(validator.validate("1123456789").code, ValidationError::INVALID_PREFIX);
    EXPECT_EQ(validator.validate("A12345678X").code, ValidationError::NON_DIGIT_CHARACTER);
    EXPECT_FALSE(validator.validate("").valid);
}

TEST_F(TWIdTest, PrefixTable) {
    const PrefixInfo* info = findPrefix('A');
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->code, 10u);

    info = findPrefix('W');
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->code, 32u);

    info = findPrefix('O');
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->code, 35u);

    EXPECT_EQ(findPrefix('a'), nullptr);
    EXPECT_EQ(findPrefix('1'), nullptr);

    for (char c = 'A'; c <= 'Z'; c++) {
        EXPECT_NE(findPrefix(c), nullptr) << c;
    }
}

TEST_F(TWIdTest, GenderAndRegion) {
    EXPECT_EQ(gender("A123456789"), Gender::MALE);
    EXPECT_EQ(gender("A225376624"), Gender::FEMALE);
    EXPECT_EQ(gender("Q155304680"), Gender::UNKNOWN);

    ASSERT_NE(region("A123456789"), nullptr);
    EXPECT_STREQ(region("A123456789"), "台北市");
    EXPECT_STREQ(region("Q155304682"), "嘉义县");
    EXPECT_STREQ(region("B142610160"), "台中市");
    EXPECT_EQ(region("Q155304680"), nullptr);
}

TEST_F(TWIdTest, Matches) {
    EXPECT_TRUE(validator.matches("A123456789"));
    EXPECT_TRUE(validator.matches("A12345678"));
    EXPECT_FALSE(validator.matches("1123456789"));
    EXPECT_FALSE(validator.matches("G123456(A)"));
}
