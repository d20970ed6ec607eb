#ifndef IDCARD_DIGIT_ARRAY_H
#define IDCARD_DIGIT_ARRAY_H

#include <cstdint>
#include <string>
#include <vector>

namespace idcard {
namespace utils {

// True if s is non-empty and every character is an ASCII digit
bool isDigits(const std::string& s);

// Convert a numeric string into digit values, in input order.
// Returns false on the first non-digit character; out is left empty.
bool toDigits(const std::string& s, std::vector<uint32_t>& out);

// Digit value of a single character, or -1 if not an ASCII digit
inline int digitValue(char c) {
    return (c >= '0' && c <= '9') ? (c - '0') : -1;
}

inline bool isUpperLetter(char c) {
    return c >= 'A' && c <= 'Z';
}

// Strip leading/trailing whitespace
std::string trim(const std::string& s);

// Strip whitespace and convert ASCII letters to upper case
std::string trimUpper(const std::string& s);

// Remove every '(' and ')' character
std::string stripParens(const std::string& s);

} // namespace utils
} // namespace idcard

#endif // IDCARD_DIGIT_ARRAY_H
