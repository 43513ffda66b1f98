#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "condition.hpp"

namespace metacollapse {

enum class DimensionKind {
    Boolean,  ///< Domain is always {true, false}; referenced bare (`debug`, `not debug`)
    String,   ///< Compared against quoted literals (`os == "win"`)
    Number,   ///< Compared against bare numeric literals (`bits == 32`)
};

[[nodiscard]] std::string_view to_string(DimensionKind kind) noexcept;

/**
 * \brief One configuration variable and its finite, ordered domain.
 */
struct Dimension {
    std::string name;
    DimensionKind kind{DimensionKind::String};
    std::vector<std::string> values;

    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view token) const;
};

[[nodiscard]] Dimension boolean_dimension(std::string name);

/**
 * \brief Immutable set of recognised dimensions plus the constraints that carve
 *        out the valid configurations.
 *
 * A registry is built once and only read afterwards, so one instance can be shared
 * across every key and file being collapsed. Construction validates the input and
 * throws `std::invalid_argument` on duplicate dimensions, empty domains, duplicate
 * values or constraints that mention unknown dimensions.
 */
class DimensionRegistry {
public:
    DimensionRegistry() = default;

    explicit DimensionRegistry(std::vector<Dimension> dimensions,
                               std::vector<ConditionPtr> constraints = {});

    [[nodiscard]] const Dimension* find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    /// Registry order of `name`; enumeration and rendering follow this order.
    [[nodiscard]] std::optional<std::size_t> position_of(std::string_view name) const;

    [[nodiscard]] const std::vector<Dimension>& dimensions() const noexcept { return dimensions_; }

    [[nodiscard]] const std::vector<ConditionPtr>& constraints() const noexcept { return constraints_; }

private:
    std::vector<Dimension> dimensions_;
    std::vector<ConditionPtr> constraints_;
};

/**
 * \brief Built-in platform matrix (os, version, processor, bits, debug, e10s,
 *        webrender) with the platform implications encoded as constraints.
 */
[[nodiscard]] DimensionRegistry default_registry();

}  // namespace metacollapse
