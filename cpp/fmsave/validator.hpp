#pragma once

/**
 * @file validator.hpp
 * @brief Cross-field consistency checks of flight rows.
 */

#include "dataset.hpp"
#include "finding.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace fmsave {

struct validator_options
{
    /// Maximum difference between the stored and the great-circle distance, as a fraction of the stored one.
    double distance_tolerance = 0.10;
    /// Maximum difference of the stored duration from the one implied by local times and offsets.
    std::chrono::minutes duration_tolerance{15};
};

struct validation_summary
{
    size_t checked = 0;
    size_t consistent = 0;
    size_t flagged = 0;
    size_t unvalidated = 0;

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Checks distance against the haversine distance of the airports and duration against the
 * difference of the UTC departure and arrival times. Never modifies the dataset.
 */
class validator
{
public:
    explicit validator(validator_options options = {})
        : options_(options)
    {
    }

    [[nodiscard]] std::vector<finding> validate(const dataset& data) const;

    /// Counts rows by outcome. A row with a warning or error is flagged even if it has unvalidated fields.
    [[nodiscard]] static validation_summary summarize(const std::vector<finding>& findings, size_t rows);

    [[nodiscard]] const validator_options& options() const
    {
        return options_;
    }

private:
    void check_distance(const fmsave_core::row& r, size_t index, std::vector<finding>& findings) const;

    void check_duration(const fmsave_core::row& r, size_t index, std::vector<finding>& findings) const;

private:
    validator_options options_;
};

} // namespace fmsave
