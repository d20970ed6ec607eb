#ifndef IDCARD_VALIDATOR_H
#define IDCARD_VALIDATOR_H

#include "idcard/types.h"
#include <memory>
#include <string>

namespace idcard {

class RegionRegistry;
class JurisdictionValidator;

// Configuration options for the validator
struct ValidatorConfig {
    bool enable_cn = true;          // Mainland China 15/18-digit
    bool enable_hk = true;          // Hong Kong
    bool enable_mo = true;          // Macau
    bool enable_tw = true;          // Taiwan

    // Registry used by decode(); nullptr selects the built-in table
    const RegionRegistry* registry = nullptr;
};

class Identity;

/**
 * Shape-dispatching identity card validator
 *
 * Detects the jurisdiction from the input's length and pattern and runs
 * that jurisdiction's checks. Stateless after construction; validate()
 * may be called from any number of threads.
 */
class IdentityValidator {
public:
    IdentityValidator();
    explicit IdentityValidator(const ValidatorConfig& config);
    ~IdentityValidator();

    // Non-copyable
    IdentityValidator(const IdentityValidator&) = delete;
    IdentityValidator& operator=(const IdentityValidator&) = delete;

    // Movable
    IdentityValidator(IdentityValidator&&) noexcept;
    IdentityValidator& operator=(IdentityValidator&&) noexcept;

    // Validate any string; never throws for malformed input
    ValidationResult validate(const std::string& number) const;

    // Jurisdiction whose shape the input matches (UNKNOWN if none)
    Jurisdiction detect(const std::string& number) const;

    // Decode a Mainland China number against the configured registry
    Identity decode(const std::string& number) const;

    const ValidatorConfig& config() const;

private:
    const JurisdictionValidator* select(const std::string& trimmed) const;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Validate with every jurisdiction enabled
bool validate(const std::string& number);

} // namespace idcard

#endif // IDCARD_VALIDATOR_H
