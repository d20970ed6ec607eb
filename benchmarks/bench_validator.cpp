// =============================================================================
// idcard Performance Benchmarks
// =============================================================================
// Benchmarks for the validation, decoding and generation paths using the
// Google Benchmark framework.
//
// Run with: ./idcard_benchmarks --benchmark_format=console
// =============================================================================

#include <benchmark/benchmark.h>
#include "idcard/idcard.h"
#include <string>
#include <vector>

using namespace idcard;

// =============================================================================
// Construction
// =============================================================================

static void BM_ValidatorCreation(benchmark::State& state) {
    for (auto _ : state) {
        IdentityValidator validator;
        benchmark::DoNotOptimize(validator);
    }
}
BENCHMARK(BM_ValidatorCreation);

// =============================================================================
// Validation per jurisdiction
// =============================================================================

static void BM_ValidateCN18(benchmark::State& state) {
    IdentityValidator validator;
    const std::string number = "230127197908177456";

    for (auto _ : state) {
        auto result = validator.validate(number);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateCN18);

static void BM_ValidateCN15(benchmark::State& state) {
    IdentityValidator validator;
    const std::string number = "632123820927051";

    for (auto _ : state) {
        auto result = validator.validate(number);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateCN15);

static void BM_ValidateHK(benchmark::State& state) {
    IdentityValidator validator;
    const std::string number = "AB987654(3)";

    for (auto _ : state) {
        auto result = validator.validate(number);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateHK);

static void BM_ValidateMO(benchmark::State& state) {
    IdentityValidator validator;
    const std::string number = "1123456(A)";

    for (auto _ : state) {
        auto result = validator.validate(number);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateMO);

static void BM_ValidateTW(benchmark::State& state) {
    IdentityValidator validator;
    const std::string number = "A123456789";

    for (auto _ : state) {
        auto result = validator.validate(number);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateTW);

// =============================================================================
// Rejection
// =============================================================================

static void BM_RejectEmpty(benchmark::State& state) {
    IdentityValidator validator;
    const std::string empty;

    for (auto _ : state) {
        auto result = validator.validate(empty);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RejectEmpty);

static void BM_RejectLong(benchmark::State& state) {
    IdentityValidator validator;
    const std::string input(static_cast<size_t>(state.range(0)), 'A');

    for (auto _ : state) {
        auto result = validator.validate(input);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RejectLong)->Arg(64)->Arg(1024)->Arg(16384);

// =============================================================================
// Decoding and generation
// =============================================================================

static void BM_DecodeWithUpgrade(benchmark::State& state) {
    for (auto _ : state) {
        Identity id("511702800222130");
        benchmark::DoNotOptimize(id.region());
        benchmark::DoNotOptimize(id.constellation());
    }
}
BENCHMARK(BM_DecodeWithUpgrade);

static void BM_Upgrade(benchmark::State& state) {
    for (auto _ : state) {
        auto result = cn::upgrade("632123820927051");
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Upgrade);

static void BM_GenerateUnconstrained(benchmark::State& state) {
    FakeGenerator generator;
    FakeOptions options;

    for (auto _ : state) {
        auto result = generator.generate(options);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateUnconstrained);

static void BM_GenerateWithPrefix(benchmark::State& state) {
    FakeGenerator generator;
    FakeOptions options;
    options.withRegion("3301").withMinYear(1980).withMaxYear(1999).withGender(Gender::FEMALE);

    for (auto _ : state) {
        auto result = generator.generate(options);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateWithPrefix);

// =============================================================================
// Main
// =============================================================================

BENCHMARK_MAIN();
