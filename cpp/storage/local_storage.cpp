#include "local_storage.hpp"
#include "exceptions.hpp"

#include <base/base.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace storage {

    local_storage::local_storage(const std::string &path) {
        if (!path.empty()) {
            path_ = std::filesystem::absolute(path);
            std::filesystem::create_directories(path_);
        }
    }

    std::filesystem::path local_storage::full_path(const std::string &path) const {
        if (path_.empty()) {
            return std::filesystem::path(path);
        }
        auto sub_path = path;
        if (sub_path.find('/') == 0) {
            sub_path = path.substr(1);
        }
        return path_ / std::filesystem::path(sub_path);
    }

    file_ref local_storage::file(const std::string &path) const {
        auto file_path = full_path(path);
        if (std::filesystem::exists(file_path)) {
            if (std::filesystem::is_regular_file(file_path)) {
                return file_ref(path, static_cast<long>(std::filesystem::file_size(file_path)));
            } else {
                return file_ref(path, 0);
            }
        } else {
            return file_ref(path, -1);
        }
    }

    std::vector<file_ref> local_storage::list_files(const std::string &base_dir) const {
        auto base_dir_path = full_path(base_dir);
        std::vector<file_ref> files;
        std::error_code ec;
        for (const auto &entry: std::filesystem::directory_iterator(base_dir_path, ec)) {
            if (entry.is_regular_file()) {
                files.emplace_back(entry.path().filename().string(), static_cast<long>(entry.file_size()));
            }
        }
        if (ec) {
            throw reader_error(base_dir_path.string(), ec.value(), ec.message());
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector<uint8_t> local_storage::get_bytes(const std::string &path) const {
        auto text = get_text(path);
        return {text.begin(), text.end()};
    }

    std::string local_storage::get_text(const std::string &path) const {
        auto final_path = full_path(path);

        if (!std::filesystem::exists(final_path)) {
            throw storage_key_not_found("File not found:", final_path.string());
        }

        auto file = std::ifstream(final_path, std::ios::binary);
        if (!file.is_open()) {
            throw reader_error(final_path.string(), errno, std::strerror(errno));
        }

        file.seekg(0, std::ios::end);
        std::streampos file_size = file.tellg();
        file.seekg(0, std::ios::beg);

        if (file_size <= 0) {
            return {};
        }

        std::string return_data(static_cast<size_t>(file_size), '\0');
        file.read(return_data.data(), file_size);

        if (!file) {
            throw reader_error(final_path.string(), errno, "short read");
        }

        base::log_debug(base::log_channel::storage_local, "Read {} bytes from '{}'", return_data.size(),
                        final_path.string());
        return return_data;
    }

    void local_storage::set_bytes(const std::string &path, const std::string &data) const {
        auto final_path = full_path(path);
        if (final_path.has_parent_path()) {
            std::filesystem::create_directories(final_path.parent_path());
        }

        auto temp_path = final_path;
        temp_path += ".tmp";

        {
            std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
            if (!stream.is_open()) {
                throw writer_error(temp_path.string(), errno, std::strerror(errno));
            }
            stream.write(data.data(), static_cast<std::streamsize>(data.size()));
            stream.flush();
            if (!stream) {
                auto code = errno;
                stream.close();
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                throw writer_error(temp_path.string(), code, "incomplete write");
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw writer_error(final_path.string(), ec.value(), ec.message());
        }
        base::log_debug(base::log_channel::storage_local, "Wrote {} bytes to '{}'", data.size(),
                        final_path.string());
    }

    void local_storage::remove(const std::string &path) const {
        std::error_code ec;
        std::filesystem::remove(full_path(path), ec);
        if (ec) {
            throw writer_error(full_path(path).string(), ec.value(), ec.message());
        }
    }

}
