/**
 * @file TextUtils.cpp
 * @brief Implementation of TextUtils.
 */
#include "domain/TextUtils.hpp"

#include <cctype>

namespace terrascope::domain {

std::string TextUtils::Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::vector<std::string> TextUtils::NormalizeAll(const std::vector<std::string>& values) {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& value : values) {
        out.push_back(Normalize(value));
    }
    return out;
}

} // namespace terrascope::domain
