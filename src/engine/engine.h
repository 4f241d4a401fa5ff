/**
 * SongGraph - Main Engine Class
 */

#ifndef SONGGRAPH_ENGINE_H
#define SONGGRAPH_ENGINE_H

#include "songgraph/types.h"
#include "../matcher/resolver.h"
#include "../matcher/similarity.h"
#include "../graph/subgraph.h"
#include "../graph/dot_exporter.h"
#include <memory>
#include <string>

namespace songgraph {

/**
 * Outcome of a full similarity query for one resolved track.
 */
struct QueryResult {
    Track reference;
    std::vector<Track> similar;         // Ranked and truncated to top_k_similar
    Subgraph graph;
};

/**
 * Main SongGraph engine.
 * Holds the current catalog snapshot and runs the
 * resolve -> filter -> build -> export pipeline against it.
 */
class Engine {
public:
    explicit Engine(const QueryConfig& config = QueryConfig::defaults());
    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * Get last error message.
     */
    const std::string& error() const { return last_error_; }

    /* ========================================================================
     * Catalog Management
     * ======================================================================== */

    /**
     * Replace the catalog with the contents of a CSV file.
     * On failure the previous catalog is kept.
     * @return Number of tracks loaded
     */
    Result<int> load_csv(const std::string& path);

    /**
     * Replace the catalog with the tracks stored in an SQLite database.
     * @return Number of tracks loaded
     */
    Result<int> load_database(const std::string& db_path);

    /**
     * Write the current catalog to an SQLite database.
     * @return Number of tracks written
     */
    Result<int> save_database(const std::string& db_path) const;

    /**
     * Replace the catalog with an in-memory track list.
     */
    void set_catalog(Catalog tracks);

    /**
     * Current catalog snapshot. Stays valid after a reload.
     */
    CatalogSnapshot catalog() const { return catalog_; }

    int track_count() const;

    /**
     * Get track by track_id.
     */
    std::optional<Track> get_track(const std::string& track_id) const;

    /* ========================================================================
     * Query Pipeline
     * ======================================================================== */

    /**
     * Resolve a track name. Ambiguous results list up to
     * top_k_disambiguation candidates.
     */
    Resolution resolve(const std::string& name) const;

    /**
     * Apply a disambiguation choice to an Ambiguous resolution.
     */
    Resolution select(const Resolution& ambiguous, const std::string& selection) const;

    /**
     * Similar tracks for a reference, truncated to top_k_similar.
     */
    std::vector<Track> find_similar(const Track& reference) const;

    /**
     * Run filter and builder for a resolved track.
     */
    QueryResult query(const Track& reference) const;

    /**
     * Render a subgraph as DOT text.
     */
    std::string render_graph(const Subgraph& graph) const;

    /**
     * Write a subgraph to a DOT file.
     * @param path Output path, or empty for the configured output_path
     * @return Number of bytes written
     */
    Result<size_t> export_graph(const Subgraph& graph, const std::string& path = "");

    /* ========================================================================
     * Configuration
     * ======================================================================== */

    /**
     * Replace the query configuration.
     * @return false (and error() set) if the configuration is invalid
     */
    bool set_config(const QueryConfig& config);
    const QueryConfig& config() const { return config_; }

private:
    QueryConfig config_;
    CatalogSnapshot catalog_;
    NameResolver resolver_;
    SimilarityFilter filter_;
    SubgraphBuilder builder_;
    std::string last_error_;

    DotExporter make_exporter() const;
};

} // namespace songgraph

#endif // SONGGRAPH_ENGINE_H
