/**
 * SongGraph - Catalog Store
 */

#ifndef SONGGRAPH_STORE_H
#define SONGGRAPH_STORE_H

#include "songgraph/types.h"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace songgraph {

/**
 * SQLite-based persistence for a track catalog.
 * Rows keep the order in which they were first inserted.
 */
class Store {
public:
    explicit Store(const std::string& db_path);
    ~Store();

    // Non-copyable
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Move constructible
    Store(Store&&) noexcept;
    Store& operator=(Store&&) noexcept;

    bool is_open() const { return db_ != nullptr; }
    const std::string& error() const { return last_error_; }

    /* ========================================================================
     * Track Operations
     * ======================================================================== */

    /**
     * Insert or update a track, keyed by track_id.
     * @return Row sequence number of the track
     */
    Result<int64_t> upsert_track(const Track& track);

    /**
     * Insert or update a whole catalog inside one transaction.
     * @return Number of records written
     */
    Result<int> import_tracks(const Catalog& tracks);

    /**
     * Get track by track_id.
     */
    std::optional<Track> get_track(const std::string& track_id);

    /**
     * Get all tracks in insertion order.
     */
    Result<Catalog> get_all_tracks();

    /**
     * Get tracks whose name matches (ASCII case-insensitive), in insertion order.
     */
    std::vector<Track> find_by_name(const std::string& name);

    /**
     * Get track count.
     */
    int get_track_count();

    /**
     * Delete a track by track_id.
     */
    bool delete_track(const std::string& track_id);

    /**
     * Remove every track.
     */
    bool clear();

private:
    void init_schema();
    bool exec(const char* sql);
    Track read_track(sqlite3_stmt* stmt) const;

    sqlite3* db_ = nullptr;
    std::string last_error_;
};

} // namespace songgraph

#endif // SONGGRAPH_STORE_H
