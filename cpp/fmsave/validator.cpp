#include "validator.hpp"
#include "geo.hpp"
#include "side_columns.hpp"

#include <base/base.hpp>

#include <cmath>
#include <limits>
#include <set>

namespace fmsave {

namespace {

std::optional<double> stored_km(const fmsave_core::value& v, const fmsave_core::column_definition& column)
{
    auto stored = v.as_double();
    if (stored && column.unit() == fmsave_core::distance_unit::miles) {
        return miles_to_km(*stored);
    }
    return stored;
}

std::optional<fmsave_core::datetime_t> to_utc(const fmsave_core::value& local, const fmsave_core::value& offset)
{
    const auto* time = local.get_if<fmsave_core::datetime_t>();
    const auto hours = offset.as_double();
    if (time == nullptr || !hours) {
        return std::nullopt;
    }
    return *time - std::chrono::minutes(std::llround(*hours * 60.0));
}

} // namespace

std::string validation_summary::to_string() const
{
    return fmt::format("{} rows checked: {} consistent, {} flagged, {} unvalidated", checked, consistent, flagged,
                       unvalidated);
}

std::vector<finding> validator::validate(const dataset& data) const
{
    auto span = base::log_span(base::log_channel::validate, "validate dataset");
    std::vector<finding> findings;
    for (size_t i = 0; i < data.size(); ++i) {
        check_distance(data[i], i, findings);
        check_duration(data[i], i, findings);
    }
    base::log_info(base::log_channel::validate, "{}", summarize(findings, data.size()).to_string());
    return findings;
}

validation_summary validator::summarize(const std::vector<finding>& findings, size_t rows)
{
    std::set<size_t> flagged;
    std::set<size_t> unvalidated;
    for (const auto& f : findings) {
        if (f.severity == severity::unvalidated) {
            unvalidated.insert(f.row_index);
        } else {
            flagged.insert(f.row_index);
        }
    }
    for (auto row : flagged) {
        unvalidated.erase(row);
    }
    validation_summary summary;
    summary.checked = rows;
    summary.flagged = flagged.size();
    summary.unvalidated = unvalidated.size();
    summary.consistent = rows - summary.flagged - summary.unvalidated;
    return summary;
}

void validator::check_distance(const fmsave_core::row& r, size_t index, std::vector<finding>& findings) const
{
    const auto& schema = r.get_schema();
    const auto column = schema.find_by_provenance(fmsave_core::side::none, provenance_field::distance);
    if (!column) {
        return;
    }
    const auto& definition = schema.column(*column);
    const auto dep = side_columns::of(schema, fmsave_core::side::departure);
    const auto arr = side_columns::of(schema, fmsave_core::side::arrival);

    std::optional<double> lat1, lon1, lat2, lon2;
    if (dep.lat && dep.lon && arr.lat && arr.lon) {
        lat1 = r[*dep.lat].as_double();
        lon1 = r[*dep.lon].as_double();
        lat2 = r[*arr.lat].as_double();
        lon2 = r[*arr.lon].as_double();
    }
    const auto stored = stored_km(r[*column], definition);
    if (!lat1 || !lon1 || !lat2 || !lon2) {
        findings.push_back({index, definition.name(), "coordinates of both airports",
                            stored ? fmt::format("{:.0f} km", *stored) : "absent", severity::unvalidated});
        return;
    }

    const double computed = great_circle_km(*lat1, *lon1, *lat2, *lon2);
    const auto expected = fmt::format("{:.0f} km", computed);
    if (!stored) {
        findings.push_back({index, definition.name(), expected, "absent", severity::warning});
        return;
    }
    const double difference = std::abs(*stored - computed);
    double deviation = 0.0;
    if (*stored > 0.0) {
        deviation = difference / *stored;
    } else if (difference > 0.0) {
        deviation = std::numeric_limits<double>::infinity();
    }
    if (deviation > options_.distance_tolerance) {
        findings.push_back({index, definition.name(), expected, fmt::format("{:.0f} km", *stored), severity::error});
    }
}

void validator::check_duration(const fmsave_core::row& r, size_t index, std::vector<finding>& findings) const
{
    const auto& schema = r.get_schema();
    const auto column = schema.find_by_provenance(fmsave_core::side::none, provenance_field::duration);
    if (!column) {
        return;
    }
    const auto& name = schema.column(*column).name();
    const auto dep = side_columns::of(schema, fmsave_core::side::departure);
    const auto arr = side_columns::of(schema, fmsave_core::side::arrival);
    const auto& stored_value = r[*column];
    const auto* stored = stored_value.get_if<fmsave_core::timedelta_t>();
    const auto actual = stored != nullptr ? fmsave_core::timedelta_to_str(*stored) : std::string("absent");

    std::optional<fmsave_core::datetime_t> dep_utc, arr_utc;
    if (dep.time && dep.gmtoffset && arr.time && arr.gmtoffset) {
        dep_utc = to_utc(r[*dep.time], r[*dep.gmtoffset]);
        arr_utc = to_utc(r[*arr.time], r[*arr.gmtoffset]);
    }
    if (!dep_utc || !arr_utc) {
        findings.push_back({index, name, "local times and offsets of both airports", actual, severity::unvalidated});
        return;
    }

    const auto computed = std::chrono::duration_cast<std::chrono::minutes>(*arr_utc - *dep_utc);
    const auto expected = fmsave_core::timedelta_to_str(computed);
    if (computed.count() < 0) {
        findings.push_back({index, name, expected, actual, severity::error});
        return;
    }
    if (stored == nullptr) {
        findings.push_back({index, name, expected, actual, severity::warning});
        return;
    }
    if (std::chrono::abs(computed - *stored) > options_.duration_tolerance) {
        findings.push_back({index, name, expected, actual, severity::error});
    }
}

} // namespace fmsave
