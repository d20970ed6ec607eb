#include "idcard/cn_id.h"
#include "idcard/checksum.h"
#include "idcard/digit_array.h"
#include "idcard/region.h"

namespace idcard {
namespace cn {

bool decompose(const std::string& number18, CNFields& fields) {
    fields = CNFields{};

    if (number18.size() != V2_LENGTH) {
        return false;
    }

    utils::CalendarDate birth;
    if (!utils::parseCompactDate(number18.substr(BIRTH_OFFSET, BIRTH_LENGTH), birth)) {
        return false;
    }

    std::string sequence = number18.substr(SEQUENCE_OFFSET, SEQUENCE_LENGTH);
    if (!utils::isDigits(sequence)) {
        return false;
    }

    fields.region_code = number18.substr(REGION_OFFSET, REGION_LENGTH);
    fields.birth = birth;
    fields.sequence = sequence;
    fields.check = number18[CHECK_OFFSET];
    fields.gender = genderFromSequence(sequence[SEQUENCE_LENGTH - 1]);
    fields.valid = true;
    return true;
}

Gender genderFromSequence(char digit) {
    int value = utils::digitValue(digit);
    if (value < 0) {
        return Gender::UNKNOWN;
    }
    return (value % 2 != 0) ? Gender::MALE : Gender::FEMALE;
}

UpgradeResult upgrade(const std::string& number) {
    UpgradeResult result;
    std::string id = utils::trimUpper(number);

    if (id.size() != V1_LENGTH || !utils::isDigits(id)) {
        result.error = "Upgrade requires a 15-digit number";
        return result;
    }

    // YYMMDD at [6, 12)
    utils::CalendarDate birth;
    if (!utils::parseCompactDate(V1_CENTURY + id.substr(6, 6), birth)) {
        result.error = "Invalid date of birth";
        return result;
    }

    std::string body = id.substr(0, REGION_LENGTH) + V1_CENTURY + id.substr(REGION_LENGTH);

    char check = '\0';
    if (!checksum::cnCheckSymbol(body, check)) {
        result.error = "Invalid characters";
        return result;
    }

    result.success = true;
    result.number = body + check;
    return result;
}

// =============================================================================
// CN-15
// =============================================================================

bool CN15Validator::matches(const std::string& input) const {
    return input.size() == V1_LENGTH;
}

ValidationResult CN15Validator::validate(const std::string& input) const {
    std::string id = utils::trimUpper(input);

    if (id.size() != V1_LENGTH) {
        return reject(ValidationError::UNRECOGNIZED_FORMAT, "Length must be 15");
    }

    if (!utils::isDigits(id)) {
        return reject(ValidationError::NON_DIGIT_CHARACTER, "Number must be all digits");
    }

    if (provinceName(id.substr(0, 2)) == nullptr) {
        return reject(ValidationError::UNKNOWN_REGION_CODE, "Unknown province code");
    }

    utils::CalendarDate birth;
    if (!utils::parseCompactDate(V1_CENTURY + id.substr(6, 6), birth)) {
        return reject(ValidationError::INVALID_CALENDAR_DATE, "Invalid date of birth");
    }

    return accept();
}

// =============================================================================
// CN-18
// =============================================================================

bool CN18Validator::matches(const std::string& input) const {
    return input.size() == V2_LENGTH;
}

ValidationResult CN18Validator::validate(const std::string& input) const {
    std::string id = utils::trimUpper(input);

    if (id.size() != V2_LENGTH) {
        return reject(ValidationError::UNRECOGNIZED_FORMAT, "Length must be 18");
    }

    std::string birth_str = id.substr(BIRTH_OFFSET, BIRTH_LENGTH);
    if (!utils::isDigits(birth_str)) {
        return reject(ValidationError::NON_DIGIT_CHARACTER, "Birth date must be digits");
    }

    utils::CalendarDate birth;
    if (!utils::parseCompactDate(birth_str, birth)) {
        return reject(ValidationError::INVALID_CALENDAR_DATE, "Invalid date of birth");
    }

    std::string body = id.substr(0, checksum::CN_BODY_LENGTH);
    if (!utils::isDigits(body)) {
        return reject(ValidationError::NON_DIGIT_CHARACTER, "First 17 characters must be digits");
    }

    char actual = id[CHECK_OFFSET];
    if (utils::digitValue(actual) < 0 && actual != 'X') {
        return reject(ValidationError::NON_DIGIT_CHARACTER, "Check symbol must be a digit or X");
    }

    char expected = '\0';
    if (!checksum::cnCheckSymbol(body, expected) || expected != actual) {
        return reject(ValidationError::CHECKSUM_MISMATCH, "Check symbol mismatch");
    }

    return accept();
}

} // namespace cn
} // namespace idcard
