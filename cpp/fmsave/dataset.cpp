#include "dataset.hpp"
#include "exceptions.hpp"

namespace fmsave {

dataset::dataset(fmsave_core::schema_ptr schema)
    : schema_(std::move(schema))
{
}

dataset::dataset(fmsave_core::schema_ptr schema, std::vector<fmsave_core::row> rows)
    : schema_(std::move(schema))
    , rows_(std::move(rows))
{
    for (const auto& r : rows_) {
        if (r.shared_schema() != schema_ && r.get_schema().name() != schema_->name()) {
            throw schema_mismatch(schema_->name(), r.get_schema().name());
        }
    }
    rebuild_index();
}

std::optional<size_t> dataset::find(const fmsave_core::key_tuple& key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void dataset::rebuild_index()
{
    index_.clear();
    if (schema_->merge_key_indices().empty()) {
        return;
    }
    for (size_t i = 0; i < rows_.size(); ++i) {
        auto key = rows_[i].merge_key();
        auto [it, inserted] = index_.emplace(key, i);
        if (!inserted) {
            throw duplicate_merge_key(fmsave_core::key_to_string(key), it->second, i);
        }
    }
}

} // namespace fmsave
