/**
 * SongGraph - Catalog Store Implementation
 */

#include "store.h"

namespace songgraph {

namespace {

const char* kSelectColumns =
    "SELECT track_id, artists, album_name, track_name, popularity, "
    "danceability, energy, tempo, valence, duration_ms, explicit, key, mode, "
    "loudness, speechiness, acousticness, instrumentalness, liveness, genre "
    "FROM tracks ";

std::string column_string(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

} // namespace

Store::Store(const std::string& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : "Out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

Store::~Store() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Store::Store(Store&& other) noexcept
    : db_(other.db_), last_error_(std::move(other.last_error_)) {
    other.db_ = nullptr;
}

Store& Store::operator=(Store&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close(db_);
        db_ = other.db_;
        last_error_ = std::move(other.last_error_);
        other.db_ = nullptr;
    }
    return *this;
}

void Store::init_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS tracks (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            track_id TEXT UNIQUE NOT NULL,
            artists TEXT NOT NULL DEFAULT '',
            album_name TEXT NOT NULL DEFAULT '',
            track_name TEXT NOT NULL DEFAULT '',
            popularity INTEGER DEFAULT 0,
            danceability REAL DEFAULT 0,
            energy REAL DEFAULT 0,
            tempo REAL DEFAULT 0,
            valence REAL DEFAULT 0,
            duration_ms INTEGER DEFAULT 0,
            explicit INTEGER,
            key INTEGER DEFAULT -1,
            mode INTEGER DEFAULT 0,
            loudness REAL DEFAULT 0,
            speechiness REAL DEFAULT 0,
            acousticness REAL DEFAULT 0,
            instrumentalness REAL DEFAULT 0,
            liveness REAL DEFAULT 0,
            genre TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_tracks_name ON tracks(track_name COLLATE NOCASE);
        CREATE INDEX IF NOT EXISTS idx_tracks_popularity ON tracks(popularity);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "Failed to create schema";
        sqlite3_free(err_msg);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Store::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

Track Store::read_track(sqlite3_stmt* stmt) const {
    Track track;
    track.track_id = column_string(stmt, 0);
    track.artists = column_string(stmt, 1);
    track.album_name = column_string(stmt, 2);
    track.track_name = column_string(stmt, 3);
    track.popularity = sqlite3_column_int(stmt, 4);
    track.danceability = static_cast<float>(sqlite3_column_double(stmt, 5));
    track.energy = static_cast<float>(sqlite3_column_double(stmt, 6));
    track.tempo = static_cast<float>(sqlite3_column_double(stmt, 7));
    track.valence = static_cast<float>(sqlite3_column_double(stmt, 8));
    track.duration_ms = sqlite3_column_int64(stmt, 9);
    if (sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
        track.explicit_content = sqlite3_column_int(stmt, 10) != 0;
    }
    track.key = sqlite3_column_int(stmt, 11);
    track.mode = sqlite3_column_int(stmt, 12);
    track.loudness = static_cast<float>(sqlite3_column_double(stmt, 13));
    track.speechiness = static_cast<float>(sqlite3_column_double(stmt, 14));
    track.acousticness = static_cast<float>(sqlite3_column_double(stmt, 15));
    track.instrumentalness = static_cast<float>(sqlite3_column_double(stmt, 16));
    track.liveness = static_cast<float>(sqlite3_column_double(stmt, 17));
    if (sqlite3_column_type(stmt, 18) != SQLITE_NULL) {
        track.genre = column_string(stmt, 18);
    }
    return track;
}

Result<int64_t> Store::upsert_track(const Track& track) {
    if (!db_) return "Database not open";

    // Floats go through double so that the stored value reads back bit-exact
    const char* sql = R"(
        INSERT INTO tracks (track_id, artists, album_name, track_name, popularity,
                            danceability, energy, tempo, valence, duration_ms, explicit,
                            key, mode, loudness, speechiness, acousticness,
                            instrumentalness, liveness, genre)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(track_id) DO UPDATE SET
            artists = excluded.artists,
            album_name = excluded.album_name,
            track_name = excluded.track_name,
            popularity = excluded.popularity,
            danceability = excluded.danceability,
            energy = excluded.energy,
            tempo = excluded.tempo,
            valence = excluded.valence,
            duration_ms = excluded.duration_ms,
            explicit = excluded.explicit,
            key = excluded.key,
            mode = excluded.mode,
            loudness = excluded.loudness,
            speechiness = excluded.speechiness,
            acousticness = excluded.acousticness,
            instrumentalness = excluded.instrumentalness,
            liveness = excluded.liveness,
            genre = excluded.genre
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::string("Prepare failed: ") + sqlite3_errmsg(db_);
    }

    sqlite3_bind_text(stmt, 1, track.track_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, track.artists.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, track.album_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, track.track_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, track.popularity);
    sqlite3_bind_double(stmt, 6, track.danceability);
    sqlite3_bind_double(stmt, 7, track.energy);
    sqlite3_bind_double(stmt, 8, track.tempo);
    sqlite3_bind_double(stmt, 9, track.valence);
    sqlite3_bind_int64(stmt, 10, track.duration_ms);
    if (track.explicit_content) {
        sqlite3_bind_int(stmt, 11, *track.explicit_content ? 1 : 0);
    } else {
        sqlite3_bind_null(stmt, 11);
    }
    sqlite3_bind_int(stmt, 12, track.key);
    sqlite3_bind_int(stmt, 13, track.mode);
    sqlite3_bind_double(stmt, 14, track.loudness);
    sqlite3_bind_double(stmt, 15, track.speechiness);
    sqlite3_bind_double(stmt, 16, track.acousticness);
    sqlite3_bind_double(stmt, 17, track.instrumentalness);
    sqlite3_bind_double(stmt, 18, track.liveness);
    if (track.genre) {
        sqlite3_bind_text(stmt, 19, track.genre->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 19);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::string("Insert failed: ") + sqlite3_errmsg(db_);
    }

    // Look up the sequence number (either new or existing)
    const char* seq_sql = "SELECT seq FROM tracks WHERE track_id = ?";
    if (sqlite3_prepare_v2(db_, seq_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::string("Prepare failed: ") + sqlite3_errmsg(db_);
    }
    sqlite3_bind_text(stmt, 1, track.track_id.c_str(), -1, SQLITE_TRANSIENT);

    int64_t seq = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        seq = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return seq;
}

Result<int> Store::import_tracks(const Catalog& tracks) {
    if (!db_) return "Database not open";

    if (!exec("BEGIN TRANSACTION;")) {
        return "Begin transaction failed: " + last_error_;
    }

    int written = 0;
    for (const auto& track : tracks) {
        auto result = upsert_track(track);
        if (result.failed()) {
            std::string message = "Import failed at track '" + track.track_id + "': " + result.error();
            exec("ROLLBACK;");
            return message;
        }
        ++written;
    }

    if (!exec("COMMIT;")) {
        std::string message = "Commit failed: " + last_error_;
        exec("ROLLBACK;");
        return message;
    }
    return written;
}

std::optional<Track> Store::get_track(const std::string& track_id) {
    if (!db_) return std::nullopt;

    std::string sql = std::string(kSelectColumns) + "WHERE track_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, track_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Track> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_track(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

Result<Catalog> Store::get_all_tracks() {
    if (!db_) return "Database not open";

    std::string sql = std::string(kSelectColumns) + "ORDER BY seq";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::string("Prepare failed: ") + sqlite3_errmsg(db_);
    }

    Catalog tracks;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        tracks.push_back(read_track(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::string("Read failed: ") + sqlite3_errmsg(db_);
    }
    return tracks;
}

std::vector<Track> Store::find_by_name(const std::string& name) {
    std::vector<Track> tracks;
    if (!db_) return tracks;

    // NOCASE folds ASCII only, matching the in-memory resolver
    std::string sql = std::string(kSelectColumns) +
                      "WHERE track_name = ? COLLATE NOCASE ORDER BY seq";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return tracks;
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        tracks.push_back(read_track(stmt));
    }

    sqlite3_finalize(stmt);
    return tracks;
}

int Store::get_track_count() {
    if (!db_) return 0;

    const char* sql = "SELECT COUNT(*) FROM tracks";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

bool Store::delete_track(const std::string& track_id) {
    if (!db_) return false;

    const char* sql = "DELETE FROM tracks WHERE track_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, track_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool Store::clear() {
    if (!db_) return false;
    return exec("DELETE FROM tracks;");
}

} // namespace songgraph
