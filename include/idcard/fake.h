#ifndef IDCARD_FAKE_H
#define IDCARD_FAKE_H

#include "idcard/types.h"
#include "idcard/calendar.h"
#include <string>

namespace idcard {

class RegionRegistry;

// Default span of generated birth years, counted back from the current year
constexpr int DEFAULT_MAX_AGE = 100;

/**
 * Constraints for synthetic number generation
 *
 * Every field is optional and only checked when generating.
 * Years must satisfy min_year <= max_year <= current year.
 */
struct FakeOptions {
    bool has_region = false;
    std::string region;             // 2-6 digit prefix or full code
    bool has_min_year = false;
    int min_year = 0;
    bool has_max_year = false;
    int max_year = 0;
    Gender gender = Gender::UNKNOWN;    // UNKNOWN = random

    FakeOptions& withRegion(const std::string& code) {
        has_region = true;
        region = code;
        return *this;
    }

    FakeOptions& withMinYear(int year) {
        has_min_year = true;
        min_year = year;
        return *this;
    }

    FakeOptions& withMaxYear(int year) {
        has_max_year = true;
        max_year = year;
        return *this;
    }

    FakeOptions& withGender(Gender value) {
        gender = value;
        return *this;
    }
};

/**
 * Synthetic Mainland China 18-digit number generator
 *
 * Output always passes CN-18 validation. Region, birth date and gender
 * are honored exactly; only the sequence digits are random.
 */
class FakeGenerator {
public:
    FakeGenerator();
    explicit FakeGenerator(const RegionRegistry& registry);

    /**
     * Generate from explicit fields
     * @param region 6-digit administrative division code
     * @param gender UNKNOWN picks one at random
     */
    GenerateResult generate(const std::string& region, int year, int month, int day,
                            Gender gender) const;

    // Generate under constraints, relative to today's date
    GenerateResult generate(const FakeOptions& options) const;

    // Generate under constraints, relative to the given date
    GenerateResult generate(const FakeOptions& options, const utils::CalendarDate& today) const;

private:
    // Resolve the region constraint to a 6-digit code (empty on failure)
    std::string resolveRegion(const FakeOptions& options) const;

    const RegionRegistry* registry_;
};

namespace fake {

// Random number with no constraints, using the built-in registry
GenerateResult rand();

// Random number under the given constraints, using the built-in registry
GenerateResult randWithOptions(const FakeOptions& options);

} // namespace fake

} // namespace idcard

#endif // IDCARD_FAKE_H
