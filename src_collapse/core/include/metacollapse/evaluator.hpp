#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "clause_list.hpp"
#include "condition.hpp"

namespace metacollapse {

/**
 * \brief One concrete assignment of values to dimensions.
 *
 * A point only carries the dimensions relevant to the clause list under
 * consideration; every other dimension is a don't-care and simply absent.
 */
class ConfigurationPoint {
public:
    ConfigurationPoint() = default;

    void assign(const std::string& dimension, std::string value);

    /// Value of `dimension`, or nullptr when the point does not cover it.
    [[nodiscard]] const std::string* find(std::string_view dimension) const;

    /// Value of `dimension`; throws `std::logic_error` when the point does not cover it.
    [[nodiscard]] const std::string& at(std::string_view dimension) const;

    [[nodiscard]] const std::map<std::string, std::string, std::less<>>& values() const noexcept {
        return values_;
    }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ConfigurationPoint& other) const { return values_ == other.values_; }
    bool operator<(const ConfigurationPoint& other) const { return values_ < other.values_; }

private:
    std::map<std::string, std::string, std::less<>> values_;
};

/**
 * Pure predicate evaluation. The point must cover every dimension the condition
 * references; a missing dimension is a broken caller contract and raises
 * `std::logic_error`.
 */
[[nodiscard]] bool evaluate(const Condition& condition, const ConfigurationPoint& point);

/// First matching clause's outcome, else the default (possibly absent).
[[nodiscard]] Outcome evaluate(const ClauseList& list, const ConfigurationPoint& point);

}  // namespace metacollapse
