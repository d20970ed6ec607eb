#include "idcard/fake.h"
#include "idcard/checksum.h"
#include "idcard/cn_id.h"
#include "idcard/digit_array.h"
#include "idcard/random.h"
#include "idcard/region.h"
#include <algorithm>
#include <cstdio>

namespace idcard {

namespace {

constexpr int MAX_SEQUENCE = 998;

Gender randomGender() {
    return utils::randomInt(0, 1) == 0 ? Gender::MALE : Gender::FEMALE;
}

GenerateResult failure(const std::string& error) {
    GenerateResult result;
    result.error = error;
    return result;
}

} // namespace

FakeGenerator::FakeGenerator()
    : registry_(&RegionRegistry::builtin()) {}

FakeGenerator::FakeGenerator(const RegionRegistry& registry)
    : registry_(&registry) {}

GenerateResult FakeGenerator::generate(const std::string& region, int year, int month,
                                       int day, Gender gender) const {
    if (region.size() != cn::REGION_LENGTH) {
        return failure("The length of region code must be 6 digits");
    }
    if (!utils::isDigits(region)) {
        return failure("Region code must be digits");
    }

    utils::CalendarDate birth = utils::makeDate(year, month, day);
    if (!birth.valid) {
        return failure("Invalid date of birth");
    }

    if (gender == Gender::UNKNOWN) {
        gender = randomGender();
    }

    // Odd sequence for male, even for female
    int seq = utils::randomInt(0, MAX_SEQUENCE);
    if (gender == Gender::MALE && seq % 2 == 0) {
        seq++;
    }
    if (gender == Gender::FEMALE && seq % 2 == 1) {
        seq++;
    }

    char seq_buf[8];
    std::snprintf(seq_buf, sizeof(seq_buf), "%03d", seq);

    std::string body = region + utils::formatCompactDate(birth) + seq_buf;

    char check = '\0';
    if (!checksum::cnCheckSymbol(body, check)) {
        return failure("Invalid characters");
    }

    GenerateResult result;
    result.success = true;
    result.number = body + check;
    return result;
}

GenerateResult FakeGenerator::generate(const FakeOptions& options) const {
    return generate(options, utils::today());
}

GenerateResult FakeGenerator::generate(const FakeOptions& options,
                                       const utils::CalendarDate& today) const {
    const int current = today.year;

    if (options.has_max_year && options.max_year > current) {
        return failure("Max year must be less than or equal to " + std::to_string(current));
    }
    if (options.has_min_year && options.min_year > current) {
        return failure("Min year must be less than or equal to " + std::to_string(current));
    }
    if (options.has_min_year && options.has_max_year && options.max_year < options.min_year) {
        return failure("Max year must be greater than or equal to min year");
    }

    int max_year = options.has_max_year ? options.max_year : current;
    int min_year = options.has_min_year ? options.min_year
                                        : std::min(current - DEFAULT_MAX_AGE, max_year);
    if (min_year < utils::MIN_YEAR) {
        return failure("Min year must be greater than or equal to " +
                       std::to_string(utils::MIN_YEAR));
    }

    std::string region = resolveRegion(options);
    if (region.empty()) {
        return failure("Invalid region code");
    }

    int age = utils::randomInt(current - max_year, current - min_year);
    int birth_year = current - age;

    // Day offset within the birth year, never past today
    int last_offset = utils::daysInYear(birth_year) - 1;
    if (birth_year == current) {
        last_offset = utils::dayOfYear(today) - 1;
    }
    utils::CalendarDate birth = utils::addDays(utils::makeDate(birth_year, 1, 1),
                                               utils::randomInt(0, last_offset));

    return generate(region, birth.year, birth.month, birth.day, options.gender);
}

std::string FakeGenerator::resolveRegion(const FakeOptions& options) const {
    if (!options.has_region) {
        return registry_->randomCode();
    }

    // An explicitly empty constraint is rejected below by isDigits()
    const std::string& constraint = options.region;
    if (constraint.size() > cn::REGION_LENGTH || !utils::isDigits(constraint)) {
        return "";
    }

    if (constraint.size() == cn::REGION_LENGTH && registry_->contains(constraint)) {
        return constraint;
    }

    return registry_->randomCodeWithPrefix(constraint);
}

namespace fake {

GenerateResult rand() {
    return randWithOptions(FakeOptions{});
}

GenerateResult randWithOptions(const FakeOptions& options) {
    FakeGenerator generator;
    return generator.generate(options);
}

} // namespace fake

} // namespace idcard
