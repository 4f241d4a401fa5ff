/**
 * SongGraph - Catalog Loader Implementation
 */

#include "catalog_loader.h"
#include "csv_reader.h"
#include "../core/utils.h"
#include <fstream>
#include <limits>
#include <unordered_map>

namespace songgraph {

namespace {

constexpr int kNoColumn = -1;

struct ColumnMap {
    int track_id = kNoColumn;
    int artists = kNoColumn;
    int album_name = kNoColumn;
    int track_name = kNoColumn;
    int popularity = kNoColumn;
    int danceability = kNoColumn;
    int energy = kNoColumn;
    int tempo = kNoColumn;
    int valence = kNoColumn;

    int duration_ms = kNoColumn;
    int explicit_flag = kNoColumn;
    int key = kNoColumn;
    int mode = kNoColumn;
    int loudness = kNoColumn;
    int speechiness = kNoColumn;
    int acousticness = kNoColumn;
    int instrumentalness = kNoColumn;
    int liveness = kNoColumn;
    int genre = kNoColumn;
};

/**
 * Field access for one record, with errors naming line and column.
 */
class RecordParser {
public:
    RecordParser(const std::vector<std::string>& fields,
                 const std::vector<std::string>& header,
                 size_t line)
        : fields_(fields), header_(header), line_(line) {}

    const std::string& error() const { return error_; }
    bool failed() const { return !error_.empty(); }

    std::string text(int column) const {
        return column == kNoColumn ? std::string() : fields_[column];
    }

    float number(int column) {
        if (failed()) return 0.0f;
        auto value = utils::parse_float(fields_[column]);
        if (!value) {
            fail(column, "expected a number");
            return 0.0f;
        }
        return *value;
    }

    // Values outside [min, max] fail instead of being narrowed
    long long integer(int column,
                      long long min = std::numeric_limits<int>::min(),
                      long long max = std::numeric_limits<int>::max()) {
        if (failed()) return 0;
        auto value = utils::parse_int(fields_[column]);
        if (!value) {
            // Integer columns are sometimes exported as "72.0"
            auto as_float = utils::parse_float(fields_[column]);
            if (!as_float || std::floor(*as_float) != *as_float) {
                fail(column, "expected an integer");
                return 0;
            }
            double whole = *as_float;
            if (whole < static_cast<double>(min) || whole > static_cast<double>(max) ||
                std::fabs(whole) >= 9.0e18) {
                fail(column, "out of range");
                return 0;
            }
            value = static_cast<long long>(whole);
        }
        if (*value < min || *value > max) {
            fail(column, "out of range");
            return 0;
        }
        return *value;
    }

    // Optional columns: absent or empty leaves the default
    template<typename T>
    void optional_number(int column, T& out) {
        if (column == kNoColumn || utils::trim(fields_[column]).empty()) return;
        out = static_cast<T>(number(column));
    }

    template<typename T>
    void optional_integer(int column, T& out) {
        if (column == kNoColumn || utils::trim(fields_[column]).empty()) return;
        out = static_cast<T>(integer(column, std::numeric_limits<T>::min(),
                                     std::numeric_limits<T>::max()));
    }

    void fail(int column, const std::string& what) {
        if (failed()) return;
        error_ = "Line " + std::to_string(line_) + ": invalid value '" + fields_[column] +
                 "' for field '" + header_[column] + "' (" + what + ")";
    }

private:
    const std::vector<std::string>& fields_;
    const std::vector<std::string>& header_;
    size_t line_;
    std::string error_;
};

Result<ColumnMap> map_columns(const std::vector<std::string>& header) {
    std::unordered_map<std::string, int> index;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = utils::trim(header[i]);
        if (!name.empty() && index.find(name) == index.end()) {
            index[name] = static_cast<int>(i);
        }
    }

    auto find = [&index](const char* name) {
        auto it = index.find(name);
        return it == index.end() ? kNoColumn : it->second;
    };

    for (const auto& name : required_columns()) {
        if (index.find(name) == index.end()) {
            return "Missing required column '" + name + "'";
        }
    }

    ColumnMap map;
    map.track_id = find("track_id");
    map.artists = find("artists");
    map.album_name = find("album_name");
    map.track_name = find("track_name");
    map.popularity = find("popularity");
    map.danceability = find("danceability");
    map.energy = find("energy");
    map.tempo = find("tempo");
    map.valence = find("valence");

    map.duration_ms = find("duration_ms");
    map.explicit_flag = find("explicit");
    map.key = find("key");
    map.mode = find("mode");
    map.loudness = find("loudness");
    map.speechiness = find("speechiness");
    map.acousticness = find("acousticness");
    map.instrumentalness = find("instrumentalness");
    map.liveness = find("liveness");
    map.genre = find("track_genre");
    return map;
}

Result<Track> parse_track(const std::vector<std::string>& fields,
                          const std::vector<std::string>& header,
                          const ColumnMap& map,
                          size_t line) {
    RecordParser record(fields, header, line);

    Track track;
    track.track_id = record.text(map.track_id);
    track.artists = record.text(map.artists);
    track.album_name = record.text(map.album_name);
    track.track_name = record.text(map.track_name);

    if (utils::trim(track.track_id).empty()) {
        return "Line " + std::to_string(line) + ": empty track_id";
    }

    long long popularity = record.integer(map.popularity);
    if (!record.failed() && popularity < 0) {
        record.fail(map.popularity, "popularity must not be negative");
    }
    track.popularity = static_cast<int>(popularity);

    track.danceability = record.number(map.danceability);
    track.energy = record.number(map.energy);
    track.tempo = record.number(map.tempo);
    track.valence = record.number(map.valence);

    record.optional_integer(map.duration_ms, track.duration_ms);
    record.optional_integer(map.key, track.key);
    record.optional_integer(map.mode, track.mode);
    record.optional_number(map.loudness, track.loudness);
    record.optional_number(map.speechiness, track.speechiness);
    record.optional_number(map.acousticness, track.acousticness);
    record.optional_number(map.instrumentalness, track.instrumentalness);
    record.optional_number(map.liveness, track.liveness);

    if (!record.failed() && map.explicit_flag != kNoColumn &&
        !utils::trim(fields[map.explicit_flag]).empty()) {
        auto flag = utils::parse_bool_token(fields[map.explicit_flag]);
        if (flag) {
            track.explicit_content = *flag;
        } else {
            record.fail(map.explicit_flag, "expected true/false, yes/no or 1/0");
        }
    }

    if (map.genre != kNoColumn && !fields[map.genre].empty()) {
        track.genre = fields[map.genre];
    }

    if (record.failed()) {
        return record.error();
    }
    return track;
}

} // namespace

const std::vector<std::string>& required_columns() {
    static const std::vector<std::string> columns = {
        "track_id", "artists", "album_name", "track_name", "popularity",
        "danceability", "energy", "tempo", "valence"
    };
    return columns;
}

Result<Catalog> parse_catalog_csv(std::istream& in) {
    CsvReader reader(in);

    std::vector<std::string> header;
    if (!reader.read_row(header)) {
        return "Catalog is empty (no header row)";
    }

    auto map_result = map_columns(header);
    if (map_result.failed()) {
        return map_result.error();
    }
    const ColumnMap& map = map_result.value();

    Catalog catalog;
    std::vector<std::string> fields;

    while (reader.read_row(fields)) {
        size_t line = reader.line();

        if (reader.unterminated_quote()) {
            return "Line " + std::to_string(line) + ": unterminated quoted field";
        }
        if (fields.size() != header.size()) {
            return "Line " + std::to_string(line) + ": expected " +
                   std::to_string(header.size()) + " fields, found " +
                   std::to_string(fields.size());
        }

        auto track = parse_track(fields, header, map, line);
        if (track.failed()) {
            return track.error();
        }
        catalog.push_back(std::move(track.value()));
    }

    if (in.bad()) {
        return "Read error while parsing catalog";
    }

    return catalog;
}

Result<Catalog> load_catalog_csv(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "Failed to open catalog: " + path;
    }

    auto result = parse_catalog_csv(file);
    if (result.failed()) {
        return path + ": " + result.error();
    }
    return result;
}

} // namespace songgraph
