#pragma once

/**
 * @file dataset.hpp
 * @brief Definition of the `dataset` class.
 */

#include <fmsave_core/row.hpp>
#include <fmsave_core/schema.hpp>

#include <map>
#include <optional>
#include <vector>

namespace fmsave {

/**
 * @brief Ordered sequence of rows sharing one schema, indexed by merge key.
 *
 * A dataset is a value: the merge engine and the resolver return new datasets and never modify
 * the one they were given.
 */
class dataset
{
public:
    using const_iterator = std::vector<fmsave_core::row>::const_iterator;

public:
    explicit dataset(fmsave_core::schema_ptr schema);

    /**
     * @throws fmsave::schema_mismatch if a row belongs to another schema.
     * @throws fmsave::duplicate_merge_key if two rows share a merge key.
     */
    dataset(fmsave_core::schema_ptr schema, std::vector<fmsave_core::row> rows);

    [[nodiscard]] const fmsave_core::schema& get_schema() const
    {
        return *schema_;
    }

    [[nodiscard]] const fmsave_core::schema_ptr& shared_schema() const
    {
        return schema_;
    }

    [[nodiscard]] const std::vector<fmsave_core::row>& rows() const
    {
        return rows_;
    }

    [[nodiscard]] size_t size() const
    {
        return rows_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return rows_.empty();
    }

    [[nodiscard]] const fmsave_core::row& operator[](size_t index) const
    {
        return rows_[index];
    }

    [[nodiscard]] const_iterator begin() const
    {
        return rows_.begin();
    }

    [[nodiscard]] const_iterator end() const
    {
        return rows_.end();
    }

    /// Position of the row with the given merge key.
    [[nodiscard]] std::optional<size_t> find(const fmsave_core::key_tuple& key) const;

    [[nodiscard]] bool contains(const fmsave_core::key_tuple& key) const
    {
        return find(key).has_value();
    }

    bool operator==(const dataset& other) const
    {
        return rows_ == other.rows_;
    }

private:
    void rebuild_index();

private:
    fmsave_core::schema_ptr schema_;
    std::vector<fmsave_core::row> rows_;
    std::map<fmsave_core::key_tuple, size_t> index_;
};

} // namespace fmsave
