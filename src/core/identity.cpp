#include "idcard/identity.h"
#include "idcard/digit_array.h"
#include "idcard/region.h"

namespace idcard {

namespace {

const char* CHINESE_ZODIAC[12] = {
    "猪", "鼠", "牛", "虎", "兔", "龙", "蛇", "马", "羊", "猴", "鸡", "狗"
};

const char* CELESTIAL_STEM[10] = {
    "癸", "甲", "乙", "丙", "丁", "戊", "己", "庚", "辛", "壬"
};

const char* TERRESTRIAL_BRANCH[12] = {
    "亥", "子", "丑", "寅", "卯", "辰", "巳", "午", "未", "申", "酉", "戌"
};

// First day of each sign, indexed by the month it starts in
struct SignStart {
    int month;
    int day;
    const char* name;
};

const SignStart CONSTELLATIONS[] = {
    {1, 20, "水瓶座"},
    {2, 19, "双鱼座"},
    {3, 21, "白羊座"},
    {4, 20, "金牛座"},
    {5, 21, "双子座"},
    {6, 22, "巨蟹座"},
    {7, 23, "狮子座"},
    {8, 23, "处女座"},
    {9, 23, "天秤座"},
    {10, 24, "天蝎座"},
    {11, 23, "射手座"},
    {12, 22, "摩羯座"}
};

int positiveMod(int value, int divisor) {
    int r = value % divisor;
    return r < 0 ? r + divisor : r;
}

} // namespace

Identity::Identity(const std::string& number)
    : registry_(&RegionRegistry::builtin()) {
    init(number);
}

Identity::Identity(const std::string& number, const RegionRegistry& registry)
    : registry_(&registry) {
    init(number);
}

void Identity::init(const std::string& number) {
    number_ = utils::trimUpper(number);

    if (number_.size() == cn::V1_LENGTH) {
        if (!cn::CN15Validator().validate(number_).valid) {
            return;
        }
        UpgradeResult upgraded = cn::upgrade(number_);
        if (!upgraded.success) {
            return;
        }
        number_ = upgraded.number;
        valid_ = cn::decompose(number_, fields_);
    } else if (number_.size() == cn::V2_LENGTH) {
        if (!cn::CN18Validator().validate(number_).valid) {
            return;
        }
        valid_ = cn::decompose(number_, fields_);
    }
}

utils::CalendarDate Identity::birthDate() const {
    return valid_ ? fields_.birth : utils::CalendarDate{};
}

std::string Identity::birthDateString() const {
    return valid_ ? utils::formatIsoDate(fields_.birth) : std::string();
}

int Identity::year() const {
    return valid_ ? fields_.birth.year : 0;
}

int Identity::month() const {
    return valid_ ? fields_.birth.month : 0;
}

int Identity::day() const {
    return valid_ ? fields_.birth.day : 0;
}

bool Identity::age(int& out) const {
    return ageInYear(utils::today().year, out);
}

bool Identity::ageInYear(int reference_year, int& out) const {
    if (!valid_ || reference_year < fields_.birth.year) {
        return false;
    }
    out = reference_year - fields_.birth.year;
    return true;
}

Gender Identity::gender() const {
    return valid_ ? fields_.gender : Gender::UNKNOWN;
}

const char* Identity::province() const {
    if (!valid_) {
        return nullptr;
    }
    return provinceName(number_.substr(0, 2));
}

const std::string* Identity::region() const {
    if (!valid_) {
        return nullptr;
    }
    return registry_->lookup(fields_.region_code);
}

std::string Identity::constellation() const {
    if (!valid_) {
        return "";
    }

    int month = fields_.birth.month;
    int day = fields_.birth.day;

    // Before the start date of this month's sign: previous sign
    int index = month - 1;
    if (day < CONSTELLATIONS[index].day) {
        index = positiveMod(index - 1, 12);
    }
    return CONSTELLATIONS[index].name;
}

std::string Identity::chineseEra() const {
    if (!valid_) {
        return "";
    }

    int year = fields_.birth.year;
    return std::string(CELESTIAL_STEM[positiveMod(year - 3, 10)]) +
           TERRESTRIAL_BRANCH[positiveMod(year - 3, 12)];
}

std::string Identity::chineseZodiac() const {
    if (!valid_) {
        return "";
    }
    return CHINESE_ZODIAC[positiveMod(fields_.birth.year - 3, 12)];
}

} // namespace idcard
