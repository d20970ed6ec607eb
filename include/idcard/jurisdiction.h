#ifndef IDCARD_JURISDICTION_H
#define IDCARD_JURISDICTION_H

#include "idcard/types.h"
#include <string>

namespace idcard {

/**
 * Validation capability shared by every identity card format
 *
 * Implementations are stateless apart from read-only tables and
 * may be called concurrently.
 */
class JurisdictionValidator {
public:
    virtual ~JurisdictionValidator() = default;

    virtual Jurisdiction jurisdiction() const = 0;

    /**
     * Check if the input has the shape of this format
     * @param input Trimmed input, case preserved
     */
    virtual bool matches(const std::string& input) const = 0;

    /**
     * Validate a number in this format
     * Accepts any string; never throws for malformed input.
     */
    virtual ValidationResult validate(const std::string& input) const = 0;

protected:
    ValidationResult accept() const {
        ValidationResult result;
        result.valid = true;
        result.jurisdiction = jurisdiction();
        return result;
    }

    ValidationResult reject(ValidationError code, const std::string& error) const {
        ValidationResult result;
        result.valid = false;
        result.jurisdiction = jurisdiction();
        result.code = code;
        result.error = error;
        return result;
    }
};

} // namespace idcard

#endif // IDCARD_JURISDICTION_H
