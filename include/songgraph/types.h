/**
 * SongGraph - Internal Types
 */

#ifndef SONGGRAPH_TYPES_H
#define SONGGRAPH_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <memory>
#include <cstdint>

namespace songgraph {

/* ============================================================================
 * Result Type
 * ============================================================================ */

// Error wrapper type to avoid variant<T, T> when T = std::string
struct ResultError {
    std::string message;
    ResultError() = default;
    ResultError(std::string m) : message(std::move(m)) {}
    ResultError(const char* m) : message(m) {}
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ResultError error) : data_(std::move(error)) {}
    Result(const char* error) : data_(ResultError{error}) {}

    // Only enable this constructor when T is not std::string to avoid ambiguity
    template<typename U = T, typename = std::enable_if_t<!std::is_same_v<U, std::string>>>
    Result(std::string error) : data_(ResultError{std::move(error)}) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool failed() const { return !ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }

    const std::string& error() const { return std::get<ResultError>(data_).message; }

    T value_or(T default_value) const {
        return ok() ? value() : default_value;
    }

private:
    std::variant<T, ResultError> data_;
};

/* ============================================================================
 * Track Record
 * ============================================================================ */

struct Track {
    std::string track_id;
    std::string artists;
    std::string album_name;
    std::string track_name;
    int popularity = 0;

    // Similarity attributes
    float danceability = 0.0f;
    float energy = 0.0f;
    float tempo = 0.0f;                 // BPM
    float valence = 0.0f;

    // Descriptive attributes, carried but not compared
    int64_t duration_ms = 0;
    std::optional<bool> explicit_content;
    int key = -1;                       // Pitch class, -1 = unknown
    int mode = 0;                       // 1 = major, 0 = minor
    float loudness = 0.0f;              // dB
    float speechiness = 0.0f;
    float acousticness = 0.0f;
    float instrumentalness = 0.0f;
    float liveness = 0.0f;
    std::optional<std::string> genre;
};

/**
 * Tracks in load order. Shared between queries as an immutable snapshot.
 */
using Catalog = std::vector<Track>;
using CatalogSnapshot = std::shared_ptr<const Catalog>;

/* ============================================================================
 * Name Resolution
 * ============================================================================ */

enum class ResolveStatus {
    Resolved,           // Exactly one track selected
    Ambiguous,          // Several matches, caller must select one
    NotFound,           // No track has the queried name
    InvalidSelection    // Selection token out of range or not a number
};

struct Resolution {
    ResolveStatus status = ResolveStatus::NotFound;
    std::string query;                  // Name that was looked up
    std::optional<Track> track;         // Set when Resolved
    std::vector<Track> candidates;      // Ranked, truncated list when Ambiguous
    std::string selection;              // Offending token when InvalidSelection

    bool resolved() const { return status == ResolveStatus::Resolved && track.has_value(); }
};

/* ============================================================================
 * Similarity Thresholds
 * ============================================================================ */

struct SimilarityThresholds {
    float danceability_tol = 0.05f;
    float energy_tol = 0.05f;
    float tempo_tol = 50.0f;
    float valence_tol = 0.1f;
    int popularity_min = 70;            // Strict: popularity must exceed this

    static SimilarityThresholds defaults() {
        return SimilarityThresholds{};
    }
};

/* ============================================================================
 * Similarity Graph
 * ============================================================================ */

struct FeatureSnapshot {
    float danceability = 0.0f;
    float energy = 0.0f;
    float tempo = 0.0f;
    float valence = 0.0f;
    int popularity = 0;
};

struct GraphNode {
    std::string track_id;               // Unique key
    std::string name;                   // Display name
    FeatureSnapshot features;
};

struct GraphEdge {
    std::string from_id;
    GraphNode to;
};

/**
 * One-hop star: a center node with one outgoing edge per similar track.
 */
struct Subgraph {
    GraphNode center;
    std::vector<GraphEdge> edges;

    size_t size() const { return edges.size(); }
    bool empty() const { return edges.empty(); }
};

/* ============================================================================
 * Query Configuration
 * ============================================================================ */

struct QueryConfig {
    SimilarityThresholds thresholds;
    int top_k_similar = 5;              // Neighbors kept in the graph
    int top_k_disambiguation = 3;       // Candidates offered on name collision
    std::string output_path = "graph.dot";
    bool key_by_id = false;             // Use track ids as DOT identifiers

    static QueryConfig defaults() {
        return QueryConfig{};
    }

    /**
     * Check the configuration for out-of-range values.
     * @return Empty string if valid, otherwise a description of the problem
     */
    std::string validate() const {
        if (thresholds.danceability_tol < 0.0f) return "danceability tolerance must not be negative";
        if (thresholds.energy_tol < 0.0f) return "energy tolerance must not be negative";
        if (thresholds.tempo_tol < 0.0f) return "tempo tolerance must not be negative";
        if (thresholds.valence_tol < 0.0f) return "valence tolerance must not be negative";
        if (top_k_similar <= 0) return "top_k_similar must be positive";
        if (top_k_disambiguation <= 0) return "top_k_disambiguation must be positive";
        if (output_path.empty()) return "output path must not be empty";
        return {};
    }
};

} // namespace songgraph

#endif // SONGGRAPH_TYPES_H
