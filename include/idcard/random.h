#ifndef IDCARD_RANDOM_H
#define IDCARD_RANDOM_H

#include <random>

namespace idcard {
namespace utils {

// Per-thread random engine, seeded from std::random_device on first use.
// Never shared between threads.
std::mt19937& randomEngine();

// Uniform integer in [low, high]
int randomInt(int low, int high);

} // namespace utils
} // namespace idcard

#endif // IDCARD_RANDOM_H
