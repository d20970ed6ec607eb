#include "idcard/mo_id.h"
#include "idcard/digit_array.h"
#include <regex>

namespace idcard {
namespace mo {

namespace {

const std::regex& cardPattern() {
    static const std::regex pattern(R"(^[157][0-9]{6}[0-9A-Z]$)");
    return pattern;
}

} // namespace

bool MOValidator::matches(const std::string& input) const {
    std::string card = utils::stripParens(utils::trim(input));
    return card.size() == CARD_LENGTH && utils::digitValue(card[0]) >= 0;
}

ValidationResult MOValidator::validate(const std::string& input) const {
    std::string card = utils::trimUpper(utils::stripParens(input));

    if (card.size() != CARD_LENGTH) {
        return reject(ValidationError::UNRECOGNIZED_FORMAT, "Length must be 8");
    }

    if (!std::regex_match(card, cardPattern())) {
        return reject(ValidationError::UNRECOGNIZED_FORMAT, "Not a Macau identity card pattern");
    }

    return accept();
}

} // namespace mo
} // namespace idcard
