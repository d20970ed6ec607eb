#ifndef IDCARD_HK_ID_H
#define IDCARD_HK_ID_H

#include "idcard/jurisdiction.h"
#include <cstdint>
#include <string>

namespace idcard {
namespace hk {

// Fixed contribution of the implicit leading blank in one-letter numbers
constexpr uint32_t SINGLE_LETTER_OFFSET = 522;

// Value of the check character 'A'
constexpr uint32_t CHECK_A_VALUE = 10;

/**
 * Numeric value of a prefix letter: A=10 ... Z=35
 * @return 0 if c is not an upper-case letter
 */
uint32_t letterValue(char c);

/**
 * Hong Kong Identity Card
 *
 * Format: one or two letters, six digits, check character 0-9 or A,
 * optionally in parentheses, e.g. "G123456(A)" or "AB987654(3)".
 *
 * Checksum: prefix letters weighted 9 and 8 (a single letter gets the
 * fixed 522 offset plus weight 8), digits weighted 7 down to 2, check
 * character weight 1; the total must be divisible by 11.
 *
 * The pattern is matched before upper-casing, so "G123456(a)" is rejected.
 */
class HKValidator : public JurisdictionValidator {
public:
    HKValidator() = default;

    Jurisdiction jurisdiction() const override { return Jurisdiction::HK; }
    bool matches(const std::string& input) const override;
    ValidationResult validate(const std::string& input) const override;

private:
    // Checksum over the bracket-free form (8 or 9 characters)
    bool verifyChecksum(const std::string& card) const;
};

} // namespace hk
} // namespace idcard

#endif // IDCARD_HK_ID_H
