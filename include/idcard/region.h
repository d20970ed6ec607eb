#ifndef IDCARD_REGION_H
#define IDCARD_REGION_H

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace idcard {

/**
 * Province name for a two-digit Mainland China province code
 * @return nullptr if the code is not in the province table
 */
const char* provinceName(const std::string& code);

// Administrative division entry: 6-digit code and full name
using RegionEntry = std::pair<std::string, std::string>;

/**
 * Read-only registry of 6-digit administrative division codes
 *
 * Populated once at construction and never mutated afterwards,
 * so a single instance can be shared by any number of readers.
 */
class RegionRegistry {
public:
    explicit RegionRegistry(const std::vector<RegionEntry>& entries);

    // Registry backed by the bundled division table
    static const RegionRegistry& builtin();

    // Name for a 6-digit code (returns nullptr if not found)
    const std::string* lookup(const std::string& code) const;

    bool contains(const std::string& code) const;

    // Random code from the whole registry (empty if the registry is empty)
    std::string randomCode() const;

    // Random code starting with prefix (empty if nothing matches)
    std::string randomCodeWithPrefix(const std::string& prefix) const;

    size_t size() const;

private:
    std::unordered_map<std::string, std::string> names_;
    std::vector<std::string> codes_;    // Sorted, for prefix scans
};

namespace data {

// Bundled administrative division table (src/data/region_data.cpp)
const std::vector<RegionEntry>& builtinRegions();

} // namespace data

} // namespace idcard

#endif // IDCARD_REGION_H
