#include "idcard/random.h"

namespace idcard {
namespace utils {

std::mt19937& randomEngine() {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

int randomInt(int low, int high) {
    if (low >= high) {
        return low;
    }
    std::uniform_int_distribution<int> dist(low, high);
    return dist(randomEngine());
}

} // namespace utils
} // namespace idcard
