#include "idcard/checksum.h"
#include "idcard/digit_array.h"
#include <stdexcept>

namespace idcard {
namespace checksum {

const std::vector<uint32_t> CN_WEIGHTS = {
    7, 9, 10, 5, 8, 4, 2, 1, 6, 3, 7, 9, 10, 5, 8, 4, 2
};

// Indexed by sum % 11
static const char CN_CHECK_SYMBOLS[11] = {
    '1', '0', 'X', '9', '8', '7', '6', '5', '4', '3', '2'
};

uint32_t weightedSum(const std::vector<uint32_t>& digits,
                     const std::vector<uint32_t>& weights) {
    if (digits.size() != weights.size()) {
        throw std::invalid_argument("weightedSum: digit and weight lengths differ");
    }

    uint32_t sum = 0;
    for (size_t i = 0; i < digits.size(); i++) {
        sum += digits[i] * weights[i];
    }
    return sum;
}

char checkSymbol(uint32_t sum) {
    return CN_CHECK_SYMBOLS[sum % 11];
}

bool cnCheckSymbol(const std::string& body17, char& symbol) {
    if (body17.size() != CN_BODY_LENGTH) {
        return false;
    }

    std::vector<uint32_t> digits;
    if (!utils::toDigits(body17, digits)) {
        return false;
    }

    symbol = checkSymbol(weightedSum(digits, CN_WEIGHTS));
    return true;
}

} // namespace checksum
} // namespace idcard
