#ifndef IDCARD_MO_ID_H
#define IDCARD_MO_ID_H

#include "idcard/jurisdiction.h"
#include <string>

namespace idcard {
namespace mo {

constexpr size_t CARD_LENGTH = 8;

/**
 * Macau Resident Identity Card
 *
 * Format: leading 1, 5 or 7, six digits, trailing digit or letter,
 * the last character optionally in parentheses, e.g. "1123456(A)".
 * Structural check only; no verification digit is computed.
 *
 * The leading character class is [157]. '|' is not accepted as a leading
 * character, and only '(' and ')' are stripped from the input.
 */
class MOValidator : public JurisdictionValidator {
public:
    MOValidator() = default;

    Jurisdiction jurisdiction() const override { return Jurisdiction::MO; }
    bool matches(const std::string& input) const override;
    ValidationResult validate(const std::string& input) const override;
};

} // namespace mo
} // namespace idcard

#endif // IDCARD_MO_ID_H
