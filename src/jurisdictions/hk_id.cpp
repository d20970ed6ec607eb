#include "idcard/hk_id.h"
#include "idcard/checksum.h"
#include "idcard/digit_array.h"
#include <regex>
#include <vector>

namespace idcard {
namespace hk {

namespace {

const std::regex& cardPattern() {
    static const std::regex pattern(R"(^[A-Z]{1,2}[0-9]{6}\(?[0-9A]\)?$)");
    return pattern;
}

const std::vector<uint32_t> DIGIT_WEIGHTS = {7, 6, 5, 4, 3, 2};

// "AB123456(7)"
constexpr size_t MAX_LENGTH = 11;

} // namespace

uint32_t letterValue(char c) {
    if (!utils::isUpperLetter(c)) {
        return 0;
    }
    return static_cast<uint32_t>(c - 'A') + 10;
}

bool HKValidator::matches(const std::string& input) const {
    std::string trimmed = utils::trim(input);
    if (trimmed.size() > MAX_LENGTH) {
        return false;
    }
    return std::regex_match(trimmed, cardPattern());
}

ValidationResult HKValidator::validate(const std::string& input) const {
    std::string trimmed = utils::trim(input);

    if (trimmed.size() > MAX_LENGTH || !std::regex_match(trimmed, cardPattern())) {
        return reject(ValidationError::UNRECOGNIZED_FORMAT, "Not a Hong Kong identity card pattern");
    }

    // 8 or 9 characters once the brackets are gone
    std::string card = utils::trimUpper(utils::stripParens(trimmed));

    if (!verifyChecksum(card)) {
        return reject(ValidationError::CHECKSUM_MISMATCH, "Check character mismatch");
    }

    return accept();
}

bool HKValidator::verifyChecksum(const std::string& card) const {
    uint32_t sum = 0;
    size_t pos = 0;

    if (card.size() == 9) {
        sum = letterValue(card[0]) * 9 + letterValue(card[1]) * 8;
        pos = 2;
    } else {
        sum = SINGLE_LETTER_OFFSET + letterValue(card[0]) * 8;
        pos = 1;
    }

    std::vector<uint32_t> digits;
    if (!utils::toDigits(card.substr(pos, DIGIT_WEIGHTS.size()), digits)) {
        return false;
    }
    sum += checksum::weightedSum(digits, DIGIT_WEIGHTS);

    char end = card[card.size() - 1];
    if (end == 'A') {
        sum += CHECK_A_VALUE;
    } else {
        int value = utils::digitValue(end);
        if (value < 0) {
            return false;
        }
        sum += static_cast<uint32_t>(value);
    }

    return sum % 11 == 0;
}

} // namespace hk
} // namespace idcard
