#pragma once

#include <string>

namespace storage {
    struct file_ref {
        std::string path;
        long size;

        [[nodiscard]] bool exists() const {
            return size >= 0;
        }

        file_ref(std::string path, long size) : path(std::move(path)), size(size) {}

        bool operator < (const file_ref &other) const {
            return path < other.path;
        }
    };
}
