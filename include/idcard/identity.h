#ifndef IDCARD_IDENTITY_H
#define IDCARD_IDENTITY_H

#include "idcard/types.h"
#include "idcard/calendar.h"
#include "idcard/cn_id.h"
#include <string>

namespace idcard {

class RegionRegistry;

/**
 * Decoded Mainland China identity number
 *
 * Holds the canonical (trimmed, upper-cased) number and a validity flag.
 * A valid 15-digit input is stored in its upgraded 18-digit form.
 * Every derived field is absent when the number is invalid.
 *
 * Immutable after construction. The registry must outlive the Identity.
 */
class Identity {
public:
    explicit Identity(const std::string& number);
    Identity(const std::string& number, const RegionRegistry& registry);

    const std::string& number() const { return number_; }
    bool isValid() const { return valid_; }
    bool empty() const { return number_.empty(); }
    size_t length() const { return number_.size(); }

    // Birth date (valid flag cleared when absent)
    utils::CalendarDate birthDate() const;

    // "YYYY-MM-DD", empty when absent
    std::string birthDateString() const;

    // Birth date components, 0 when absent
    int year() const;
    int month() const;
    int day() const;

    /**
     * Age in whole calendar years: current year - birth year
     * @return false if invalid or born after the current year
     */
    bool age(int& out) const;

    // Same as age() against a given reference year
    bool ageInYear(int reference_year, int& out) const;

    Gender gender() const;

    // Two-digit province name (nullptr if absent or unknown)
    const char* province() const;

    // Full administrative division name (nullptr if absent or unknown)
    const std::string* region() const;

    // Western zodiac sign, empty when absent
    std::string constellation() const;

    // Sexagenary cycle name of the birth year, e.g. "甲子"
    std::string chineseEra() const;

    // Chinese zodiac animal of the birth year
    std::string chineseZodiac() const;

    bool operator==(const Identity& other) const {
        return number_ == other.number_ && valid_ == other.valid_;
    }
    bool operator!=(const Identity& other) const { return !(*this == other); }

private:
    void init(const std::string& number);

    std::string number_;
    bool valid_ = false;
    cn::CNFields fields_;
    const RegionRegistry* registry_;
};

} // namespace idcard

#endif // IDCARD_IDENTITY_H
