#include "idcard/tw_id.h"
#include "idcard/checksum.h"
#include "idcard/digit_array.h"
#include <vector>

namespace idcard {
namespace tw {

// Codes follow the issue order, not the alphabet: I, O and W come late
static const PrefixInfo PREFIXES[] = {
    {'A', 10, "台北市"},
    {'B', 11, "台中市"},
    {'C', 12, "基隆市"},
    {'D', 13, "台南市"},
    {'E', 14, "高雄市"},
    {'F', 15, "新北市"},
    {'G', 16, "宜兰县"},
    {'H', 17, "桃园市"},
    {'J', 18, "新竹县"},
    {'K', 19, "苗栗县"},
    {'L', 20, "台中县"},        // obsolete
    {'M', 21, "南投县"},
    {'N', 22, "彰化县"},
    {'P', 23, "云林县"},
    {'Q', 24, "嘉义县"},
    {'R', 25, "台南县"},        // obsolete
    {'S', 26, "高雄县"},        // obsolete
    {'T', 27, "屏东县"},
    {'U', 28, "花莲县"},
    {'V', 29, "台东县"},
    {'X', 30, "澎湖县"},
    {'Y', 31, "阳明山管理局"},  // obsolete
    {'W', 32, "金门县"},
    {'Z', 33, "连江县"},
    {'I', 34, "嘉义市"},
    {'O', 35, "新竹市"}
};
static const size_t PREFIX_COUNT = sizeof(PREFIXES) / sizeof(PREFIXES[0]);

static const std::vector<uint32_t> DIGIT_WEIGHTS = {8, 7, 6, 5, 4, 3, 2, 1};

const PrefixInfo* findPrefix(char letter) {
    for (size_t i = 0; i < PREFIX_COUNT; i++) {
        if (PREFIXES[i].letter == letter) {
            return &PREFIXES[i];
        }
    }
    return nullptr;
}

bool TWValidator::matches(const std::string& input) const {
    std::string card = utils::trimUpper(utils::stripParens(input));
    return (card.size() == CARD_LENGTH || card.size() == CARD_LENGTH - 1) &&
           utils::isUpperLetter(card[0]);
}

ValidationResult TWValidator::validate(const std::string& input) const {
    std::string card = utils::trimUpper(utils::stripParens(input));

    if (card.size() != CARD_LENGTH) {
        return reject(ValidationError::UNRECOGNIZED_FORMAT, "Length must be 10");
    }

    const PrefixInfo* prefix = findPrefix(card[0]);
    if (prefix == nullptr) {
        return reject(ValidationError::INVALID_PREFIX, "Initial letter must be A-Z");
    }

    std::vector<uint32_t> digits;
    if (!utils::toDigits(card.substr(1), digits)) {
        return reject(ValidationError::NON_DIGIT_CHARACTER, "Letter must be followed by 9 digits");
    }

    if (card[1] != '1' && card[1] != '2') {
        return reject(ValidationError::INVALID_GENDER_MARKER, "Gender marker must be 1 or 2");
    }

    uint32_t sum = prefix->code / 10 + (prefix->code % 10) * 9;
    std::vector<uint32_t> middle(digits.begin(), digits.begin() + DIGIT_WEIGHTS.size());
    sum += checksum::weightedSum(middle, DIGIT_WEIGHTS);

    uint32_t expected = (10 - sum % 10) % 10;
    if (expected != digits.back()) {
        return reject(ValidationError::CHECKSUM_MISMATCH, "Check digit mismatch");
    }

    return accept();
}

Gender gender(const std::string& number) {
    TWValidator validator;
    if (!validator.validate(number).valid) {
        return Gender::UNKNOWN;
    }

    std::string card = utils::trimUpper(utils::stripParens(number));
    return (card[1] == '1') ? Gender::MALE : Gender::FEMALE;
}

const char* region(const std::string& number) {
    TWValidator validator;
    if (!validator.validate(number).valid) {
        return nullptr;
    }

    std::string card = utils::trimUpper(utils::stripParens(number));
    const PrefixInfo* prefix = findPrefix(card[0]);
    return prefix ? prefix->area : nullptr;
}

} // namespace tw
} // namespace idcard
