#ifndef IDCARD_TW_ID_H
#define IDCARD_TW_ID_H

#include "idcard/jurisdiction.h"
#include <cstdint>
#include <string>

namespace idcard {
namespace tw {

constexpr size_t CARD_LENGTH = 10;

// Issuing area for an initial letter
struct PrefixInfo {
    char letter;
    uint32_t code;          // 10-35
    const char* area;
};

/**
 * Look up the initial letter
 * @return nullptr if the letter is not assigned
 */
const PrefixInfo* findPrefix(char letter);

/**
 * Taiwan National Identification Card
 *
 * Format: one letter followed by nine digits, e.g. "A123456789".
 * The second character is the gender marker (1 male, 2 female).
 *
 * Checksum: the letter code (10-35) splits into tens (weight 1) and
 * units (weight 9); digits 2-9 are weighted 8 down to 1; the last digit
 * must equal (10 - sum % 10) % 10.
 */
class TWValidator : public JurisdictionValidator {
public:
    TWValidator() = default;

    Jurisdiction jurisdiction() const override { return Jurisdiction::TW; }
    bool matches(const std::string& input) const override;
    ValidationResult validate(const std::string& input) const override;
};

// Gender marker of a valid number (UNKNOWN if the number is invalid)
Gender gender(const std::string& number);

// Issuing area of a valid number (nullptr if the number is invalid)
const char* region(const std::string& number);

} // namespace tw
} // namespace idcard

#endif // IDCARD_TW_ID_H
