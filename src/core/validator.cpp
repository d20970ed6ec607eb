#include "idcard/validator.h"
#include "idcard/identity.h"
#include "idcard/region.h"
#include "idcard/digit_array.h"
#include "idcard/cn_id.h"
#include "idcard/hk_id.h"
#include "idcard/mo_id.h"
#include "idcard/tw_id.h"

namespace idcard {

struct IdentityValidator::Impl {
    ValidatorConfig config;
    cn::CN15Validator cn15_validator;
    cn::CN18Validator cn18_validator;
    hk::HKValidator hk_validator;
    mo::MOValidator mo_validator;
    tw::TWValidator tw_validator;

    explicit Impl(const ValidatorConfig& cfg)
        : config(cfg) {
        if (config.registry == nullptr) {
            config.registry = &RegionRegistry::builtin();
        }
    }
};

IdentityValidator::IdentityValidator()
    : IdentityValidator(ValidatorConfig{}) {}

IdentityValidator::IdentityValidator(const ValidatorConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

IdentityValidator::~IdentityValidator() = default;

IdentityValidator::IdentityValidator(IdentityValidator&&) noexcept = default;
IdentityValidator& IdentityValidator::operator=(IdentityValidator&&) noexcept = default;

const JurisdictionValidator* IdentityValidator::select(const std::string& trimmed) const {
    const ValidatorConfig& config = impl_->config;

    // Hong Kong is matched case-sensitively, before upper-casing
    if (config.enable_hk && impl_->hk_validator.matches(trimmed)) {
        return &impl_->hk_validator;
    }

    std::string upper = utils::trimUpper(trimmed);

    if (config.enable_cn) {
        if (impl_->cn15_validator.matches(upper)) {
            return &impl_->cn15_validator;
        }
        if (impl_->cn18_validator.matches(upper)) {
            return &impl_->cn18_validator;
        }
    }

    if (config.enable_mo && impl_->mo_validator.matches(upper)) {
        return &impl_->mo_validator;
    }

    if (config.enable_tw && impl_->tw_validator.matches(upper)) {
        return &impl_->tw_validator;
    }

    return nullptr;
}

ValidationResult IdentityValidator::validate(const std::string& number) const {
    std::string trimmed = utils::trim(number);

    const JurisdictionValidator* validator = select(trimmed);
    if (validator == nullptr) {
        ValidationResult result;
        result.code = ValidationError::UNRECOGNIZED_FORMAT;
        result.error = trimmed.empty() ? "Empty input" : "Unrecognized identity card format";
        return result;
    }

    return validator->validate(trimmed);
}

Jurisdiction IdentityValidator::detect(const std::string& number) const {
    const JurisdictionValidator* validator = select(utils::trim(number));
    return validator ? validator->jurisdiction() : Jurisdiction::UNKNOWN;
}

Identity IdentityValidator::decode(const std::string& number) const {
    return Identity(number, *impl_->config.registry);
}

const ValidatorConfig& IdentityValidator::config() const {
    return impl_->config;
}

bool validate(const std::string& number) {
    static const IdentityValidator validator;
    return validator.validate(number).valid;
}

} // namespace idcard
