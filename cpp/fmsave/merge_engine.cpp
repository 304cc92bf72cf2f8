#include "merge_engine.hpp"
#include "exceptions.hpp"

#include <base/assert.hpp>
#include <base/base.hpp>

#include <algorithm>
#include <iterator>
#include <map>

namespace fmsave {

namespace {

std::string bound_to_string(const std::optional<fmsave_core::date_t>& bound)
{
    return bound ? fmsave_core::format_date(*bound, fmsave_core::default_date_format) : std::string("*");
}

void check_window(const date_window& window)
{
    if (!window.is_valid()) {
        throw invalid_merge_window(bound_to_string(window.after), bound_to_string(window.before));
    }
}

size_t window_column(const fmsave_core::schema& schema)
{
    const auto& column = schema.merge().window_column;
    if (!column) {
        throw merge_error(fmt::format("Schema '{}' declares no merge window column.", schema.name()),
                          {{"schema", schema.name()}});
    }
    return schema.index_of(*column);
}

bool in_window(const fmsave_core::row& r, size_t column, const date_window& window)
{
    const auto* date = r[column].get_if<fmsave_core::date_t>();
    return date != nullptr && window.contains(*date);
}

/// Ascending on the ordering columns, absent values after present ones.
bool order_less(const fmsave_core::row& a, const fmsave_core::row& b, const std::vector<size_t>& columns)
{
    for (auto column : columns) {
        const auto& va = a[column];
        const auto& vb = b[column];
        if (va == vb) {
            continue;
        }
        if (va.is_absent()) {
            return false;
        }
        if (vb.is_absent()) {
            return true;
        }
        return va < vb;
    }
    return false;
}

void renumber(std::vector<fmsave_core::row>& rows, const fmsave_core::schema& schema)
{
    if (!schema.merge().index_column) {
        return;
    }
    const auto column = schema.index_of(*schema.merge().index_column);
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].set(column, fmsave_core::value(static_cast<int64_t>(i + 1)));
    }
}

} // namespace

std::string date_window::to_string() const
{
    return fmt::format("[{}, {}]", bound_to_string(after), bound_to_string(before));
}

dataset merge(const dataset& existing,
              const std::vector<fmsave_core::row>& incoming,
              const std::optional<date_window>& window)
{
    const auto& schema = existing.get_schema();
    if (window) {
        check_window(*window);
    }

    std::map<fmsave_core::key_tuple, size_t> incoming_keys;
    for (size_t i = 0; i < incoming.size(); ++i) {
        if (incoming[i].get_schema().name() != schema.name()) {
            throw schema_mismatch(schema.name(), incoming[i].get_schema().name());
        }
        auto key = incoming[i].merge_key();
        auto [it, inserted] = incoming_keys.emplace(key, i);
        if (!inserted) {
            throw duplicate_merge_key(fmsave_core::key_to_string(key), it->second, i);
        }
    }

    std::vector<fmsave_core::row> rows;
    rows.reserve(existing.size() + incoming.size());
    size_t removed = 0;
    if (window) {
        const auto column = window_column(schema);
        for (const auto& r : existing) {
            if (in_window(r, column, *window)) {
                ++removed;
            } else {
                rows.push_back(r);
            }
        }
    } else {
        rows = existing.rows();
    }

    std::map<fmsave_core::key_tuple, size_t> positions;
    for (size_t i = 0; i < rows.size(); ++i) {
        positions.emplace(rows[i].merge_key(), i);
    }

    size_t replaced = 0;
    std::vector<size_t> appended;
    for (size_t i = 0; i < incoming.size(); ++i) {
        auto it = positions.find(incoming[i].merge_key());
        if (it != positions.end()) {
            rows[it->second] = incoming[i];
            ++replaced;
        } else {
            appended.push_back(i);
        }
    }

    std::vector<size_t> order_columns;
    for (const auto& name : schema.merge().order_columns) {
        order_columns.push_back(schema.index_of(name));
    }
    std::stable_sort(appended.begin(), appended.end(), [&](size_t a, size_t b) {
        return order_less(incoming[a], incoming[b], order_columns);
    });
    for (auto i : appended) {
        rows.push_back(incoming[i]);
    }
    ASSERT(rows.size() == existing.size() - removed + appended.size());

    renumber(rows, schema);

    base::log_info(base::log_channel::merge,
                   "Merged {} incoming rows into {} existing: {} replaced, {} appended, {} removed by window {}",
                   incoming.size(), existing.size(), replaced, appended.size(), removed,
                   window ? window->to_string() : std::string("(none)"));
    return dataset(existing.shared_schema(), std::move(rows));
}

dataset merge(const dataset& existing, const dataset& incoming, const std::optional<date_window>& window)
{
    return merge(existing, incoming.rows(), window);
}

dataset keep_window(const dataset& data, const date_window& window)
{
    check_window(window);
    const auto column = window_column(data.get_schema());
    std::vector<fmsave_core::row> rows;
    std::copy_if(data.begin(), data.end(), std::back_inserter(rows), [&](const fmsave_core::row& r) {
        return in_window(r, column, window);
    });
    return dataset(data.shared_schema(), std::move(rows));
}

dataset remove_window(const dataset& data, const date_window& window)
{
    check_window(window);
    const auto column = window_column(data.get_schema());
    std::vector<fmsave_core::row> rows;
    std::copy_if(data.begin(), data.end(), std::back_inserter(rows), [&](const fmsave_core::row& r) {
        return !in_window(r, column, window);
    });
    return dataset(data.shared_schema(), std::move(rows));
}

} // namespace fmsave
