#pragma once

/**
 * @file finding.hpp
 * @brief Definition of the `finding` reported by the validator.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace fmsave {

enum class severity : uint8_t
{
    warning,
    error,
    /// The row lacks the inputs needed to check the field.
    unvalidated
};

std::string_view severity_to_str(severity s);

struct finding
{
    size_t row_index;
    std::string field;
    std::string expected;
    std::string actual;
    fmsave::severity severity;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const finding& other) const = default;
};

} // namespace fmsave
