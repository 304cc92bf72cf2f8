#pragma once

#include "storage.hpp"

#include <filesystem>
#include <string>

namespace storage {
    /**
     * Storage rooted at a local directory. Relative and absolute paths are both resolved against the root;
     * a root of "" means the current working directory.
     */
    class local_storage : public ::storage::storage {

    public:
        explicit local_storage(const std::string &path = "");

        file_ref file(const std::string &path) const override;

        std::vector<file_ref> list_files(const std::string &base_dir) const override;

        std::vector<uint8_t> get_bytes(const std::string &path) const override;

        std::string get_text(const std::string &path) const override;

        void set_bytes(const std::string &path, const std::string &data) const override;

        void remove(const std::string &path) const override;

        [[nodiscard]] const std::filesystem::path &root() const {
            return path_;
        }

    private:
        std::filesystem::path path_;

        std::filesystem::path full_path(const std::string &path) const;
    };
}
