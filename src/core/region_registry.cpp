#include "idcard/region.h"
#include "idcard/random.h"
#include <algorithm>

namespace idcard {

// Two-digit province codes
static const char* PROVINCE_CODES[][2] = {
    {"11", "北京"},   {"12", "天津"},   {"13", "河北"},   {"14", "山西"},
    {"15", "内蒙古"}, {"21", "辽宁"},   {"22", "吉林"},   {"23", "黑龙江"},
    {"31", "上海"},   {"32", "江苏"},   {"33", "浙江"},   {"34", "安徽"},
    {"35", "福建"},   {"36", "江西"},   {"37", "山东"},   {"41", "河南"},
    {"42", "湖北"},   {"43", "湖南"},   {"44", "广东"},   {"45", "广西"},
    {"46", "海南"},   {"50", "重庆"},   {"51", "四川"},   {"52", "贵州"},
    {"53", "云南"},   {"54", "西藏"},   {"61", "陕西"},   {"62", "甘肃"},
    {"63", "青海"},   {"64", "宁夏"},   {"65", "新疆"},   {"71", "台湾"},
    {"81", "香港"},   {"82", "澳门"},   {"83", "台湾"},   {"91", "国外"}
};
static const size_t PROVINCE_COUNT = sizeof(PROVINCE_CODES) / sizeof(PROVINCE_CODES[0]);

const char* provinceName(const std::string& code) {
    if (code.size() != 2) {
        return nullptr;
    }

    for (size_t i = 0; i < PROVINCE_COUNT; i++) {
        if (code == PROVINCE_CODES[i][0]) {
            return PROVINCE_CODES[i][1];
        }
    }
    return nullptr;
}

RegionRegistry::RegionRegistry(const std::vector<RegionEntry>& entries) {
    names_.reserve(entries.size());
    codes_.reserve(entries.size());

    for (const auto& entry : entries) {
        if (names_.emplace(entry.first, entry.second).second) {
            codes_.push_back(entry.first);
        }
    }

    std::sort(codes_.begin(), codes_.end());
}

const RegionRegistry& RegionRegistry::builtin() {
    static const RegionRegistry registry(data::builtinRegions());
    return registry;
}

const std::string* RegionRegistry::lookup(const std::string& code) const {
    auto it = names_.find(code);
    return (it != names_.end()) ? &it->second : nullptr;
}

bool RegionRegistry::contains(const std::string& code) const {
    return names_.find(code) != names_.end();
}

std::string RegionRegistry::randomCode() const {
    if (codes_.empty()) {
        return "";
    }

    int index = utils::randomInt(0, static_cast<int>(codes_.size()) - 1);
    return codes_[static_cast<size_t>(index)];
}

std::string RegionRegistry::randomCodeWithPrefix(const std::string& prefix) const {
    if (prefix.empty()) {
        return "";
    }

    // Codes sharing a prefix form a contiguous run in the sorted list
    auto first = std::lower_bound(codes_.begin(), codes_.end(), prefix);
    auto last = first;
    while (last != codes_.end() && last->compare(0, prefix.size(), prefix) == 0) {
        ++last;
    }

    if (first == last) {
        return "";
    }

    int count = static_cast<int>(last - first);
    return *(first + utils::randomInt(0, count - 1));
}

size_t RegionRegistry::size() const {
    return codes_.size();
}

} // namespace idcard
