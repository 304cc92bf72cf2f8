#include "finding.hpp"

#include <base/format.hpp>

namespace fmsave {

std::string_view severity_to_str(severity s)
{
    switch (s) {
    case severity::warning:
        return "warning";
    case severity::error:
        return "error";
    case severity::unvalidated:
        return "unvalidated";
    }
    return "unknown";
}

std::string finding::to_string() const
{
    return fmt::format("row {} {} [{}]: expected {}, actual {}", row_index, field, severity_to_str(severity), expected,
                       actual);
}

} // namespace fmsave
