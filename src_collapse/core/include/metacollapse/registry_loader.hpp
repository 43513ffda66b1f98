#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "dimension_registry.hpp"

namespace metacollapse {

/**
 * \brief Loads a dimension registry from a line-oriented description.
 *
 * Each non-empty line is either a dimension or a constraint:
 *   - `dimension.<name> = <kind>: v1, v2, ...` where `<kind>` is `string`,
 *     `number` or `bool`. Values are comma separated and may be double quoted;
 *     `bool` dimensions take no values (their domain is `true`, `false`).
 *   - `constraint = <condition>` using the annotation condition syntax. Every
 *     valid configuration satisfies every constraint.
 *
 * Example:
 * \code{.txt}
 * # Test platforms
 * dimension.os = string: win, linux, mac
 * dimension.bits = number: 32, 64
 * dimension.debug = bool
 * constraint = os != "mac" or bits == 64
 * \endcode
 *
 * Lines starting with `#` and blank lines are ignored. Constraints may refer to
 * dimensions declared later in the file. Errors are reported as
 * `std::runtime_error` carrying `<source>:<line>`.
 */
class RegistryLoader {
public:
    RegistryLoader() = default;

    [[nodiscard]] DimensionRegistry load(const std::filesystem::path& file) const;

    [[nodiscard]] DimensionRegistry parse(std::string_view content, const std::string& source = "<registry>") const;
};

}  // namespace metacollapse
