#ifndef IDCARD_CHECKSUM_H
#define IDCARD_CHECKSUM_H

#include <cstdint>
#include <string>
#include <vector>

namespace idcard {
namespace checksum {

// Number of significant digits covered by the CN check symbol
constexpr size_t CN_BODY_LENGTH = 17;

// GB 11643 positional weights (2^(17-i) mod 11)
extern const std::vector<uint32_t> CN_WEIGHTS;

/**
 * Weighted positional sum: sum of digits[i] * weights[i]
 * @throws std::invalid_argument if the two sequences differ in length
 */
uint32_t weightedSum(const std::vector<uint32_t>& digits,
                     const std::vector<uint32_t>& weights);

// Map sum % 11 to the CN check symbol ('0'-'9' or 'X')
char checkSymbol(uint32_t sum);

/**
 * Compute the check symbol for a 17-digit CN body
 * @return false if body17 is not exactly 17 ASCII digits
 */
bool cnCheckSymbol(const std::string& body17, char& symbol);

} // namespace checksum
} // namespace idcard

#endif // IDCARD_CHECKSUM_H
