#include "idcard/idcard_c.h"
#include "idcard/idcard.h"
#include <cstring>
#include <exception>
#include <new>

/* ============================================================================
 * Internal wrapper structure
 * ============================================================================ */

struct idcard_validator_t {
    idcard::IdentityValidator validator;

    idcard_validator_t() = default;

    explicit idcard_validator_t(const idcard::ValidatorConfig& config)
        : validator(config) {}
};

/* ============================================================================
 * Helper functions
 * ============================================================================ */

static void copy_string(char* dest, size_t dest_len, const char* src) {
    if (!dest || dest_len == 0) {
        return;
    }
    std::strncpy(dest, src ? src : "", dest_len - 1);
    dest[dest_len - 1] = '\0';
}

static idcard::ValidatorConfig convert_config_from_c(const idcard_config_t* config) {
    idcard::ValidatorConfig cfg;
    cfg.enable_cn = config->enable_cn != 0;
    cfg.enable_hk = config->enable_hk != 0;
    cfg.enable_mo = config->enable_mo != 0;
    cfg.enable_tw = config->enable_tw != 0;
    return cfg;
}

static idcard::FakeOptions convert_options_from_c(const idcard_fake_options_t* options) {
    idcard::FakeOptions opts;
    if (!options) {
        return opts;
    }

    if (options->region) {
        opts.withRegion(options->region);
    }
    if (options->has_min_year) {
        opts.withMinYear(options->min_year);
    }
    if (options->has_max_year) {
        opts.withMaxYear(options->max_year);
    }
    if (options->gender == IDCARD_GENDER_MALE) {
        opts.withGender(idcard::Gender::MALE);
    } else if (options->gender == IDCARD_GENDER_FEMALE) {
        opts.withGender(idcard::Gender::FEMALE);
    }
    return opts;
}

/* ============================================================================
 * API implementation
 * ============================================================================ */

extern "C" {

const char* idcard_version(void) {
    return idcard::VERSION;
}

idcard_config_t idcard_default_config(void) {
    idcard_config_t config;
    config.enable_cn = 1;
    config.enable_hk = 1;
    config.enable_mo = 1;
    config.enable_tw = 1;
    return config;
}

idcard_validator_t* idcard_validator_create(void) {
    try {
        return new idcard_validator_t();
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

idcard_validator_t* idcard_validator_create_with_config(const idcard_config_t* config) {
    if (!config) {
        return idcard_validator_create();
    }

    try {
        return new idcard_validator_t(convert_config_from_c(config));
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

void idcard_validator_destroy(idcard_validator_t* validator) {
    delete validator;
}

int idcard_validate(const idcard_validator_t* validator,
                    const char* number,
                    idcard_result_t* result) {
    if (!validator || !number || !result) {
        return -1;
    }

    std::memset(result, 0, sizeof(idcard_result_t));

    try {
        auto cpp_result = validator->validator.validate(number);

        result->valid = cpp_result.valid ? 1 : 0;
        result->jurisdiction = static_cast<idcard_jurisdiction_t>(cpp_result.jurisdiction);
        result->code = static_cast<idcard_error_t>(cpp_result.code);
        copy_string(result->error, sizeof(result->error), cpp_result.error.c_str());

        return 0;
    } catch (const std::exception& e) {
        copy_string(result->error, sizeof(result->error), e.what());
        return -1;
    }
}

int idcard_decode(const idcard_validator_t* validator,
                  const char* number,
                  idcard_identity_t* identity) {
    if (!validator || !number || !identity) {
        return -1;
    }

    std::memset(identity, 0, sizeof(idcard_identity_t));

    try {
        idcard::Identity id = validator->validator.decode(number);
        if (!id.isValid()) {
            return 0;
        }

        identity->valid = 1;
        copy_string(identity->number, sizeof(identity->number), id.number().c_str());
        identity->year = id.year();
        identity->month = id.month();
        identity->day = id.day();
        identity->gender = static_cast<idcard_gender_t>(id.gender());
        copy_string(identity->province, sizeof(identity->province), id.province());

        const std::string* region = id.region();
        copy_string(identity->region, sizeof(identity->region),
                    region ? region->c_str() : nullptr);

        return 0;
    } catch (const std::exception&) {
        return -1;
    }
}

int idcard_upgrade(const char* number, char* out, size_t out_len) {
    if (!number || !out || out_len <= idcard::cn::V2_LENGTH) {
        return -1;
    }

    auto result = idcard::cn::upgrade(number);
    if (!result.success) {
        out[0] = '\0';
        return -1;
    }

    copy_string(out, out_len, result.number.c_str());
    return 0;
}

int idcard_generate(const idcard_fake_options_t* options,
                    char* out, size_t out_len,
                    char* error, size_t error_len) {
    if (!out || out_len <= idcard::cn::V2_LENGTH) {
        copy_string(error, error_len, "Output buffer too small");
        return -1;
    }

    out[0] = '\0';

    try {
        auto result = idcard::fake::randWithOptions(convert_options_from_c(options));
        if (!result.success) {
            copy_string(error, error_len, result.error.c_str());
            return -1;
        }

        copy_string(out, out_len, result.number.c_str());
        copy_string(error, error_len, "");
        return 0;
    } catch (const std::exception& e) {
        copy_string(error, error_len, e.what());
        return -1;
    }
}

} /* extern "C" */
