#include "csv.hpp"
#include "exceptions.hpp"

namespace fmsave_core {

csv_reader::csv_reader(std::string_view text, char separator)
    : text_(text)
    , separator_(separator)
{
    constexpr std::string_view bom = "\xEF\xBB\xBF";
    if (text_.starts_with(bom)) {
        pos_ = bom.size();
    }
}

std::optional<csv_record> csv_reader::next()
{
    // Skip empty lines.
    while (pos_ < text_.size() && (text_[pos_] == '\n' || text_[pos_] == '\r')) {
        if (text_[pos_] == '\n') {
            ++current_line_;
        }
        ++pos_;
    }
    if (pos_ >= text_.size()) {
        return std::nullopt;
    }

    record_line_ = current_line_;
    csv_record record;
    std::string field;

    while (true) {
        if (pos_ < text_.size() && text_[pos_] == '"') {
            ++pos_;
            bool closed = false;
            while (pos_ < text_.size()) {
                const char c = text_[pos_++];
                if (c == '"') {
                    if (pos_ < text_.size() && text_[pos_] == '"') {
                        field.push_back('"');
                        ++pos_;
                        continue;
                    }
                    closed = true;
                    break;
                }
                if (c == '\n') {
                    ++current_line_;
                }
                field.push_back(c);
            }
            if (!closed) {
                throw csv_error(record_line_, "unterminated quoted field");
            }
            if (pos_ < text_.size() && text_[pos_] != separator_ && text_[pos_] != '\r' && text_[pos_] != '\n') {
                throw csv_error(current_line_, "unexpected character after closing quote");
            }
        } else {
            while (pos_ < text_.size() && text_[pos_] != separator_ && text_[pos_] != '\r' && text_[pos_] != '\n') {
                field.push_back(text_[pos_++]);
            }
        }

        record.push_back(std::move(field));
        field.clear();

        if (pos_ >= text_.size()) {
            break;
        }
        if (text_[pos_] == separator_) {
            ++pos_;
            continue;
        }
        if (text_[pos_] == '\r') {
            ++pos_;
        }
        if (pos_ < text_.size() && text_[pos_] == '\n') {
            ++pos_;
            ++current_line_;
        }
        break;
    }
    return record;
}

std::vector<csv_record> csv_reader::read_all()
{
    std::vector<csv_record> records;
    while (auto record = next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

bool csv_writer::needs_quotes(std::string_view field) const
{
    return field.find_first_of(std::string{separator_, '"', '\r', '\n'}) != std::string_view::npos;
}

void csv_writer::write(const csv_record& record)
{
    for (size_t i = 0; i < record.size(); ++i) {
        if (i > 0) {
            buffer_.push_back(separator_);
        }
        const auto& field = record[i];
        // A lone empty field would otherwise be read back as an empty line.
        if (!needs_quotes(field) && !(record.size() == 1 && field.empty())) {
            buffer_ += field;
            continue;
        }
        buffer_.push_back('"');
        for (const char c : field) {
            if (c == '"') {
                buffer_.push_back('"');
            }
            buffer_.push_back(c);
        }
        buffer_.push_back('"');
    }
    buffer_ += newline_;
    ++records_;
}

} // namespace fmsave_core
