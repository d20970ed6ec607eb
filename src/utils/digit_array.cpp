#include "idcard/digit_array.h"
#include <cctype>

namespace idcard {
namespace utils {

bool isDigits(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (digitValue(c) < 0) {
            return false;
        }
    }
    return true;
}

bool toDigits(const std::string& s, std::vector<uint32_t>& out) {
    out.clear();
    out.reserve(s.size());

    for (char c : s) {
        int value = digitValue(c);
        if (value < 0) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<uint32_t>(value));
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();

    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(begin, end - begin);
}

std::string trimUpper(const std::string& s) {
    std::string result = trim(s);
    for (char& c : result) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }
    return result;
}

std::string stripParens(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c != '(' && c != ')') {
            result.push_back(c);
        }
    }
    return result;
}

} // namespace utils
} // namespace idcard
