// =============================================================================
// idcard Fuzz Target - libFuzzer entry point
// =============================================================================
// Build with: cmake -DIDCARD_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
//
// Run with: ./idcard_fuzz fuzz/corpus -max_len=64 -timeout=5
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>

#include "idcard/idcard.h"

using namespace idcard;

// Global validator instance (initialized once)
static IdentityValidator* g_validator = nullptr;

extern "C" int LLVMFuzzerInitialize(int* argc, char*** argv) {
    (void)argc;
    (void)argv;

    g_validator = new IdentityValidator();
    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size > 4096) {
        return 0;
    }

    std::string input(reinterpret_cast<const char*>(data), size);

    {
        auto result = g_validator->validate(input);
        // An accepted number always names its jurisdiction
        if (result.valid && result.jurisdiction == Jurisdiction::UNKNOWN) {
            __builtin_trap();
        }
    }

    {
        Identity id(input);
        if (id.isValid()) {
            // Decoded numbers re-validate as CN-18
            if (!cn::CN18Validator().validate(id.number()).valid) {
                __builtin_trap();
            }
            (void)id.region();
            (void)id.constellation();
            (void)id.chineseZodiac();
        }
    }

    {
        auto result = cn::upgrade(input);
        if (result.success && !g_validator->validate(result.number).valid) {
            __builtin_trap();
        }
    }

    (void)tw::gender(input);
    (void)tw::region(input);

    return 0;
}
