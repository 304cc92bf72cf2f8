#pragma once

/**
 * @file merge_engine.hpp
 * @brief Upsert of rows into a dataset by composite merge key, with date window replace.
 */

#include "dataset.hpp"

#include <fmsave_core/time_format.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fmsave {

/// Inclusive date range. A missing bound is unbounded.
struct date_window
{
    std::optional<fmsave_core::date_t> after;
    std::optional<fmsave_core::date_t> before;

    [[nodiscard]] bool contains(fmsave_core::date_t date) const
    {
        return (!after || date >= *after) && (!before || date <= *before);
    }

    [[nodiscard]] bool is_valid() const
    {
        return !after || !before || *after <= *before;
    }

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Merges `incoming` into `existing` and returns the result. `existing` is not modified.
 *
 * With a window, existing rows whose window column lies inside it are removed first. An incoming row
 * whose merge key matches a remaining row replaces that row in place; the others are appended ordered
 * by the schema ordering columns (absent last, ties in incoming order). The index column, if the
 * schema declares one, is renumbered from 1.
 *
 * @throws fmsave::invalid_merge_window if the window start is after its end.
 * @throws fmsave::duplicate_merge_key if two incoming rows share a merge key.
 * @throws fmsave::schema_mismatch if incoming rows belong to another schema.
 */
dataset merge(const dataset& existing,
              const std::vector<fmsave_core::row>& incoming,
              const std::optional<date_window>& window = std::nullopt);

dataset merge(const dataset& existing, const dataset& incoming, const std::optional<date_window>& window = std::nullopt);

/// Rows whose window column lies inside `window`. Rows with an absent window value are dropped.
dataset keep_window(const dataset& data, const date_window& window);

/// Rows whose window column lies outside `window`. Rows with an absent window value are kept.
dataset remove_window(const dataset& data, const date_window& window);

} // namespace fmsave
