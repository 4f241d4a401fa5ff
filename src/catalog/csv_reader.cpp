/**
 * SongGraph - CSV Reader Implementation
 */

#include "csv_reader.h"

namespace songgraph {

CsvReader::CsvReader(std::istream& in, char delimiter)
    : in_(in), delimiter_(delimiter) {}

bool CsvReader::read_row(std::vector<std::string>& fields) {
    fields.clear();
    unterminated_quote_ = false;

    // Skip UTF-8 byte order mark
    if (at_start_) {
        at_start_ = false;
        if (in_.peek() == 0xEF) {
            in_.get();
            if (in_.peek() == 0xBB) in_.get();
            if (in_.peek() == 0xBF) in_.get();
        }
    }

    // Skip blank lines between records
    int c = in_.get();
    while (c == '\n' || c == '\r') {
        if (c == '\n') ++current_line_;
        c = in_.get();
    }
    if (c == std::char_traits<char>::eof()) {
        return false;
    }

    record_line_ = current_line_;
    std::string field;
    bool in_quotes = false;

    while (c != std::char_traits<char>::eof()) {
        char ch = static_cast<char>(c);

        if (in_quotes) {
            if (ch == '"') {
                if (in_.peek() == '"') {
                    field += '"';
                    in_.get();
                } else {
                    in_quotes = false;
                }
            } else {
                if (ch == '\n') ++current_line_;
                field += ch;
            }
        } else if (ch == '"' && field.empty()) {
            in_quotes = true;
        } else if (ch == delimiter_) {
            fields.push_back(std::move(field));
            field.clear();
        } else if (ch == '\r') {
            if (in_.peek() == '\n') in_.get();
            ++current_line_;
            break;
        } else if (ch == '\n') {
            ++current_line_;
            break;
        } else {
            field += ch;
        }

        c = in_.get();
    }

    unterminated_quote_ = in_quotes;
    fields.push_back(std::move(field));
    return true;
}

} // namespace songgraph
