/**
 * @file KeywordRules.hpp
 * @brief Ordered (predicate, result) rule lists for classifying free text.
 */

#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace terrascope::domain {

/**
 * @class KeywordRules
 * @brief First-match-wins rule list. Rules are evaluated in declaration order.
 *
 * @tparam Subject What the predicates inspect (lower-cased text, a bundle of fields, ...).
 * @tparam Result  Value produced by the first matching rule.
 */
template <typename Subject, typename Result>
class KeywordRules {
public:
    using Predicate = std::function<bool(const Subject&)>;

    struct Rule {
        std::string name; ///< Human readable label, useful in tests and logs.
        Predicate when;
        Result result;
    };

    KeywordRules() = default;
    KeywordRules(std::initializer_list<Rule> rules) : m_rules(rules) {}
    explicit KeywordRules(std::vector<Rule> rules) : m_rules(std::move(rules)) {}

    std::optional<Result> firstMatch(const Subject& subject) const {
        for (const auto& rule : m_rules) {
            if (rule.when && rule.when(subject)) {
                return rule.result;
            }
        }
        return std::nullopt;
    }

    /** @brief Name of the first matching rule, empty if none matches. */
    std::string matchingRule(const Subject& subject) const {
        for (const auto& rule : m_rules) {
            if (rule.when && rule.when(subject)) {
                return rule.name;
            }
        }
        return {};
    }

    const std::vector<Rule>& rules() const { return m_rules; }

private:
    std::vector<Rule> m_rules;
};

/** @brief True if text contains any of the needles. */
inline bool ContainsAny(const std::string& text, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (text.find(needle) != std::string::npos) return true;
    }
    return false;
}

/** @brief Predicate over plain text that fires on any needle. */
inline std::function<bool(const std::string&)> TextHasAny(std::vector<std::string> needles) {
    return [needles = std::move(needles)](const std::string& text) {
        return ContainsAny(text, needles);
    };
}

} // namespace terrascope::domain
