/**
 * SongGraph - CSV Reader
 */

#ifndef SONGGRAPH_CSV_READER_H
#define SONGGRAPH_CSV_READER_H

#include <istream>
#include <string>
#include <vector>

namespace songgraph {

/**
 * Streaming RFC 4180 reader.
 * Quoted fields may contain commas, doubled quotes and line breaks.
 */
class CsvReader {
public:
    explicit CsvReader(std::istream& in, char delimiter = ',');

    /**
     * Read the next record.
     * @param fields Output fields (cleared first)
     * @return false at end of input
     */
    bool read_row(std::vector<std::string>& fields);

    /**
     * Physical line on which the last record returned by read_row() started.
     */
    size_t line() const { return record_line_; }

    /**
     * Set when the last record ended inside an unterminated quoted field.
     */
    bool unterminated_quote() const { return unterminated_quote_; }

private:
    std::istream& in_;
    char delimiter_;
    size_t current_line_ = 1;
    size_t record_line_ = 0;
    bool at_start_ = true;
    bool unterminated_quote_ = false;
};

} // namespace songgraph

#endif // SONGGRAPH_CSV_READER_H
