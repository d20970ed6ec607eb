#include <gtest/gtest.h>
#include "idcard/identity.h"
#include "idcard/region.h"
#include "idcard/calendar.h"

using namespace idcard;

TEST(IdentityTest, UpgradesLegacyNumber) {
    Identity id("632123820927051");
    EXPECT_TRUE(id.isValid());
    EXPECT_EQ(id.number(), "632123198209270518");
    EXPECT_EQ(id.length(), 18u);
}

TEST(IdentityTest, ValidNumberIsUnchanged) {
    Identity id("230127197908177456");
    EXPECT_TRUE(id.isValid());
    EXPECT_EQ(id.number(), "230127197908177456");

    Identity padded("  21021119810503545x ");
    EXPECT_TRUE(padded.isValid());
    EXPECT_EQ(padded.number(), "21021119810503545X");
}

TEST(IdentityTest, DecodedFields) {
    Identity id("511702800222130");
    ASSERT_TRUE(id.isValid());

    EXPECT_EQ(id.number(), "511702198002221308");
    EXPECT_EQ(id.year(), 1980);
    EXPECT_EQ(id.month(), 2);
    EXPECT_EQ(id.day(), 22);
    EXPECT_EQ(id.birthDateString(), "1980-02-22");
    EXPECT_TRUE(id.birthDate().valid);
    EXPECT_EQ(id.gender(), Gender::FEMALE);
    ASSERT_NE(id.province(), nullptr);
    EXPECT_STREQ(id.province(), "四川");
    ASSERT_NE(id.region(), nullptr);
    EXPECT_EQ(*id.region(), "四川省达州市通川区");
}

TEST(IdentityTest, InvalidHasNoFields) {
    Identity id("230127197908177457");
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.number(), "230127197908177457");
    EXPECT_EQ(id.year(), 0);
    EXPECT_EQ(id.month(), 0);
    EXPECT_EQ(id.day(), 0);
    EXPECT_FALSE(id.birthDate().valid);
    EXPECT_EQ(id.birthDateString(), "");
    EXPECT_EQ(id.gender(), Gender::UNKNOWN);
    EXPECT_EQ(id.province(), nullptr);
    EXPECT_EQ(id.region(), nullptr);
    EXPECT_EQ(id.constellation(), "");
    EXPECT_EQ(id.chineseEra(), "");
    EXPECT_EQ(id.chineseZodiac(), "");

    int age = -1;
    EXPECT_FALSE(id.age(age));
    EXPECT_EQ(age, -1);
}

TEST(IdentityTest, OtherLengthsAreInvalid) {
    EXPECT_FALSE(Identity("").isValid());
    EXPECT_TRUE(Identity("").empty());
    EXPECT_FALSE(Identity("A123456789").isValid());
    EXPECT_FALSE(Identity("G123456(A)").isValid());
}

TEST(IdentityTest, LegacyWithUnknownProvinceIsInvalid) {
    Identity id("001702800222130");
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.number(), "001702800222130");
}

TEST(IdentityTest, UnknownRegionStillValid) {
    // Check symbol is correct; 999999 is not in the registry
    Identity id("999999199001010016");
    ASSERT_TRUE(id.isValid());
    EXPECT_EQ(id.region(), nullptr);
    EXPECT_EQ(id.province(), nullptr);
    EXPECT_EQ(id.year(), 1990);
}

TEST(IdentityTest, AgeInYear) {
    Identity id("230127197908177456");
    int age = 0;

    ASSERT_TRUE(id.ageInYear(2000, age));
    EXPECT_EQ(age, 21);

    ASSERT_TRUE(id.ageInYear(1979, age));
    EXPECT_EQ(age, 0);

    age = 99;
    EXPECT_FALSE(id.ageInYear(1978, age));
    EXPECT_EQ(age, 99);
}

TEST(IdentityTest, AgeUsesCurrentYear) {
    Identity id("230127197908177456");
    int age = 0;
    ASSERT_TRUE(id.age(age));
    EXPECT_EQ(age, utils::today().year - 1979);
}

TEST(IdentityTest, Equality) {
    EXPECT_EQ(Identity("632123820927051"), Identity("632123198209270518"));
    EXPECT_EQ(Identity("21021119810503545X"), Identity("21021119810503545x"));
    EXPECT_NE(Identity("330421197402080974"), Identity("130133197909136078"));
}

TEST(IdentityTest, ChineseCalendar) {
    Identity id("632123198209270518");
    EXPECT_EQ(id.chineseEra(), "壬戌");
    EXPECT_EQ(id.chineseZodiac(), "狗");

    Identity id2("230127197908177456");
    EXPECT_EQ(id2.chineseEra(), "己未");
    EXPECT_EQ(id2.chineseZodiac(), "羊");
}

// Stem nine is 壬, not the homophone 任
TEST(IdentityTest, ChineseEraStemSpelling) {
    EXPECT_EQ(Identity("632123198209270518").chineseEra(), "壬戌");
    EXPECT_NE(Identity("632123198209270518").chineseEra(), "任戌");
}

TEST(IdentityTest, Constellation) {
    EXPECT_EQ(Identity("632123198209270518").constellation(), "天秤座");   // Sep 27
    EXPECT_EQ(Identity("230127197908177456").constellation(), "狮子座");   // Aug 17
    EXPECT_EQ(Identity("511702198002221308").constellation(), "双鱼座");   // Feb 22
    EXPECT_EQ(Identity("21021119810503545X").constellation(), "金牛座");   // May 3
}

// Capricorn spans the year boundary and is spelled 摩羯座
TEST(IdentityTest, CapricornSpelling) {
    EXPECT_EQ(Identity("33010619921225002X").constellation(), "摩羯座");   // Dec 25
    EXPECT_EQ(Identity("33010619930105002X").constellation(), "摩羯座");   // Jan 5
    EXPECT_NE(Identity("33010619921225002X").constellation(), "魔羯座");
}

TEST(IdentityTest, InjectedRegistry) {
    RegionRegistry registry(std::vector<RegionEntry>{{"230127", "测试区"}});
    Identity id("230127197908177456", registry);
    ASSERT_NE(id.region(), nullptr);
    EXPECT_EQ(*id.region(), "测试区");

    Identity other("632123198209270518", registry);
    EXPECT_EQ(other.region(), nullptr);
}
