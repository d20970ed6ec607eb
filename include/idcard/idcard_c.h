#ifndef IDCARD_C_H
#define IDCARD_C_H

/**
 * idcard C API - Pure C interface for cross-language bindings
 *
 * This header provides a C-compatible API for use with:
 * - JNI (Android/Java)
 * - Python ctypes/cffi
 * - Other FFI systems
 */

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Opaque handle types
 * ============================================================================ */

typedef struct idcard_validator_t idcard_validator_t;

/* ============================================================================
 * Enumerations
 * ============================================================================ */

typedef enum {
    IDCARD_JURISDICTION_UNKNOWN = 0,
    IDCARD_JURISDICTION_CN15 = 1,
    IDCARD_JURISDICTION_CN18 = 2,
    IDCARD_JURISDICTION_HK = 3,
    IDCARD_JURISDICTION_MO = 4,
    IDCARD_JURISDICTION_TW = 5
} idcard_jurisdiction_t;

typedef enum {
    IDCARD_GENDER_UNKNOWN = 0,
    IDCARD_GENDER_MALE = 1,
    IDCARD_GENDER_FEMALE = 2
} idcard_gender_t;

typedef enum {
    IDCARD_ERROR_NONE = 0,
    IDCARD_ERROR_UNRECOGNIZED_FORMAT = 1,
    IDCARD_ERROR_NON_DIGIT_CHARACTER = 2,
    IDCARD_ERROR_INVALID_CALENDAR_DATE = 3,
    IDCARD_ERROR_UNKNOWN_REGION_CODE = 4,
    IDCARD_ERROR_CHECKSUM_MISMATCH = 5,
    IDCARD_ERROR_INVALID_PREFIX = 6,
    IDCARD_ERROR_INVALID_GENDER_MARKER = 7
} idcard_error_t;

/* ============================================================================
 * Data structures (C-compatible, fixed-size)
 * ============================================================================ */

#define IDCARD_MAX_NUMBER_LENGTH 32
#define IDCARD_MAX_NAME_LENGTH 128
#define IDCARD_MAX_ERROR_LENGTH 128

typedef struct {
    int valid;
    idcard_jurisdiction_t jurisdiction;
    idcard_error_t code;
    char error[IDCARD_MAX_ERROR_LENGTH];
} idcard_result_t;

/* Decoded Mainland China number (UTF-8 names) */
typedef struct {
    int valid;
    char number[IDCARD_MAX_NUMBER_LENGTH];
    int year;
    int month;
    int day;
    idcard_gender_t gender;
    char province[IDCARD_MAX_NAME_LENGTH];
    char region[IDCARD_MAX_NAME_LENGTH];
} idcard_identity_t;

typedef struct {
    int enable_cn;
    int enable_hk;
    int enable_mo;
    int enable_tw;
} idcard_config_t;

/* Generation constraints; zero fields and a NULL region are unconstrained.
 * A non-NULL region must be a 2-6 digit prefix or code; "" is rejected. */
typedef struct {
    const char* region;
    int has_min_year;
    int min_year;
    int has_max_year;
    int max_year;
    idcard_gender_t gender;
} idcard_fake_options_t;

/* ============================================================================
 * Library functions
 * ============================================================================ */

/**
 * Get library version string
 */
const char* idcard_version(void);

/**
 * Get default configuration (all jurisdictions enabled)
 */
idcard_config_t idcard_default_config(void);

/**
 * Create a validator with default configuration
 * @return Validator handle, or NULL on failure
 */
idcard_validator_t* idcard_validator_create(void);

/**
 * Create a validator with custom configuration
 * @param config Configuration options
 * @return Validator handle, or NULL on failure
 */
idcard_validator_t* idcard_validator_create_with_config(const idcard_config_t* config);

/**
 * Destroy a validator instance
 */
void idcard_validator_destroy(idcard_validator_t* validator);

/**
 * Validate a number in any supported format
 * @param validator Validator handle
 * @param number NUL-terminated input
 * @param result Output result structure
 * @return 0 on success (result filled), non-zero on error
 */
int idcard_validate(const idcard_validator_t* validator,
                    const char* number,
                    idcard_result_t* result);

/**
 * Decode a Mainland China 15/18-digit number
 * @param identity Output structure; identity->valid reports validity
 * @return 0 on success, non-zero on error
 */
int idcard_decode(const idcard_validator_t* validator,
                  const char* number,
                  idcard_identity_t* identity);

/**
 * Upgrade a 15-digit number to 18 digits
 * @param out Output buffer (at least 19 bytes)
 * @param out_len Size of the output buffer
 * @return 0 on success, non-zero if the number cannot be upgraded
 */
int idcard_upgrade(const char* number, char* out, size_t out_len);

/**
 * Generate a synthetic Mainland China number
 * @param options Constraints, or NULL for none
 * @param out Output buffer (at least 19 bytes)
 * @param error Optional buffer for the failure reason
 * @return 0 on success, non-zero on constraint error
 */
int idcard_generate(const idcard_fake_options_t* options,
                    char* out, size_t out_len,
                    char* error, size_t error_len);

#ifdef __cplusplus
}
#endif

#endif /* IDCARD_C_H */
