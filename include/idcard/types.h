#ifndef IDCARD_TYPES_H
#define IDCARD_TYPES_H

#include <cstdint>
#include <string>

namespace idcard {

// Identity card formats supported by the validator
enum class Jurisdiction : uint8_t {
    UNKNOWN = 0,
    CN15 = 1,       // Mainland China, legacy 15-digit
    CN18 = 2,       // Mainland China, 18-digit with check symbol
    HK = 3,         // Hong Kong
    MO = 4,         // Macau
    TW = 5          // Taiwan
};

enum class Gender : uint8_t {
    UNKNOWN = 0,
    MALE = 1,
    FEMALE = 2
};

// Reason a number was rejected
enum class ValidationError : uint8_t {
    NONE = 0,
    UNRECOGNIZED_FORMAT = 1,    // No jurisdiction matched the length/pattern
    NON_DIGIT_CHARACTER = 2,
    INVALID_CALENDAR_DATE = 3,
    UNKNOWN_REGION_CODE = 4,    // CN-15 province not in the province table
    CHECKSUM_MISMATCH = 5,
    INVALID_PREFIX = 6,         // Letter prefix not defined (TW)
    INVALID_GENDER_MARKER = 7   // TW second character not 1 or 2
};

// Verdict returned by every validation path
struct ValidationResult {
    bool valid = false;
    Jurisdiction jurisdiction = Jurisdiction::UNKNOWN;
    ValidationError code = ValidationError::NONE;
    std::string error;              // Error message if invalid
};

// Result of the CN-15 to CN-18 upgrade
struct UpgradeResult {
    bool success = false;
    std::string number;             // 18-digit number (valid only if success)
    std::string error;
};

// Result of fake number generation
struct GenerateResult {
    bool success = false;
    std::string number;
    std::string error;
};

const char* jurisdictionName(Jurisdiction jurisdiction);
const char* validationErrorName(ValidationError code);

} // namespace idcard

#endif // IDCARD_TYPES_H
