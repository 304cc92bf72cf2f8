#pragma once

/**
 * @file csv.hpp
 * @brief RFC 4180 record reader and writer.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fmsave_core {

using csv_record = std::vector<std::string>;

/**
 * @brief Reads records from CSV text. Accepts LF and CRLF line endings, quoted fields with doubled
 * quotes and embedded line breaks. A leading UTF-8 byte order mark and empty lines are skipped.
 *
 * The reader does not own the text; it must outlive the reader.
 */
class csv_reader
{
public:
    explicit csv_reader(std::string_view text, char separator = ',');

    /**
     * @brief Reads the next record.
     * @return nullopt at the end of the text.
     * @throws fmsave_core::csv_error on an unterminated quote or text after a closing quote.
     */
    std::optional<csv_record> next();

    /// Line number (1 based) where the last returned record started.
    [[nodiscard]] size_t line() const noexcept
    {
        return record_line_;
    }

    /// Reads every remaining record.
    std::vector<csv_record> read_all();

private:
    std::string_view text_;
    size_t pos_ = 0;
    size_t current_line_ = 1;
    size_t record_line_ = 0;
    char separator_;
};

class csv_writer
{
public:
    explicit csv_writer(char separator = ',', std::string newline = "\r\n")
        : separator_(separator)
        , newline_(std::move(newline))
    {
    }

    /// Appends a record terminated by the newline sequence.
    void write(const csv_record& record);

    [[nodiscard]] const std::string& str() const noexcept
    {
        return buffer_;
    }

    [[nodiscard]] size_t records() const noexcept
    {
        return records_;
    }

private:
    [[nodiscard]] bool needs_quotes(std::string_view field) const;

private:
    char separator_;
    std::string newline_;
    std::string buffer_;
    size_t records_ = 0;
};

} // namespace fmsave_core
