#ifndef IDCARD_CN_ID_H
#define IDCARD_CN_ID_H

#include "idcard/types.h"
#include "idcard/calendar.h"
#include "idcard/jurisdiction.h"
#include <string>

namespace idcard {
namespace cn {

constexpr size_t V1_LENGTH = 15;
constexpr size_t V2_LENGTH = 18;

// Field offsets in the 18-digit form
constexpr size_t REGION_OFFSET = 0;
constexpr size_t REGION_LENGTH = 6;
constexpr size_t BIRTH_OFFSET = 6;
constexpr size_t BIRTH_LENGTH = 8;
constexpr size_t SEQUENCE_OFFSET = 14;
constexpr size_t SEQUENCE_LENGTH = 3;
constexpr size_t CHECK_OFFSET = 17;

// Century assumed by the 15-digit form
constexpr const char* V1_CENTURY = "19";

// Semantic fields of an 18-digit number
struct CNFields {
    bool valid = false;
    std::string region_code;        // 6-digit administrative division
    utils::CalendarDate birth;
    std::string sequence;           // 3 digits, parity encodes gender
    char check = '\0';              // '0'-'9' or 'X'
    Gender gender = Gender::UNKNOWN;
};

/**
 * Slice an 18-character number into its fixed fields
 *
 * Requires the embedded birth date to be a real calendar date and the
 * sequence to be numeric. Does not verify the check symbol.
 */
bool decompose(const std::string& number18, CNFields& fields);

// Gender from the parity of the sequence's last digit
Gender genderFromSequence(char digit);

/**
 * Convert a 15-digit number to the 18-digit form
 *
 * Inserts the "19" century and appends the recomputed check symbol.
 * Does not consult the province table.
 */
UpgradeResult upgrade(const std::string& number);

/**
 * Mainland China legacy 15-digit format
 * All digits, known province, "19" + YYMMDD forms a real date.
 */
class CN15Validator : public JurisdictionValidator {
public:
    CN15Validator() = default;

    Jurisdiction jurisdiction() const override { return Jurisdiction::CN15; }
    bool matches(const std::string& input) const override;
    ValidationResult validate(const std::string& input) const override;
};

/**
 * Mainland China 18-digit format
 * Real birth date, 17 digits, check symbol per GB 11643.
 */
class CN18Validator : public JurisdictionValidator {
public:
    CN18Validator() = default;

    Jurisdiction jurisdiction() const override { return Jurisdiction::CN18; }
    bool matches(const std::string& input) const override;
    ValidationResult validate(const std::string& input) const override;
};

} // namespace cn
} // namespace idcard

#endif // IDCARD_CN_ID_H
