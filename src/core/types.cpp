#include "idcard/types.h"

namespace idcard {

const char* jurisdictionName(Jurisdiction jurisdiction) {
    switch (jurisdiction) {
        case Jurisdiction::CN15: return "CN-15";
        case Jurisdiction::CN18: return "CN-18";
        case Jurisdiction::HK:   return "HK";
        case Jurisdiction::MO:   return "MO";
        case Jurisdiction::TW:   return "TW";
        default:                 return "UNKNOWN";
    }
}

const char* validationErrorName(ValidationError code) {
    switch (code) {
        case ValidationError::NONE:                  return "NONE";
        case ValidationError::UNRECOGNIZED_FORMAT:   return "UNRECOGNIZED_FORMAT";
        case ValidationError::NON_DIGIT_CHARACTER:   return "NON_DIGIT_CHARACTER";
        case ValidationError::INVALID_CALENDAR_DATE: return "INVALID_CALENDAR_DATE";
        case ValidationError::UNKNOWN_REGION_CODE:   return "UNKNOWN_REGION_CODE";
        case ValidationError::CHECKSUM_MISMATCH:     return "CHECKSUM_MISMATCH";
        case ValidationError::INVALID_PREFIX:        return "INVALID_PREFIX";
        case ValidationError::INVALID_GENDER_MARKER: return "INVALID_GENDER_MARKER";
        default:                                     return "UNKNOWN";
    }
}

} // namespace idcard
