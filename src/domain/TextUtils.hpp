/**
 * @file TextUtils.hpp
 * @brief Shared text helpers for keyword matching.
 */
#pragma once

#include <string>
#include <vector>

namespace terrascope::domain {

class TextUtils {
public:
    /** @brief ASCII lower-casing used before every keyword or unit check. */
    static std::string Normalize(const std::string& input);
    static std::vector<std::string> NormalizeAll(const std::vector<std::string>& values);
};

} // namespace terrascope::domain
