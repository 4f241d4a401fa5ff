/**
 * SongGraph - Public C API
 *
 * A library for finding tracks similar to a named song in an audio-feature
 * catalog and exporting the result as a Graphviz graph.
 */

#ifndef SONGGRAPH_H
#define SONGGRAPH_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Types
 * ============================================================================ */

typedef struct SongGraphEngine SongGraphEngine;
typedef struct SongGraphQueryImpl* SongGraphQuery;

typedef enum {
    SONGGRAPH_OK = 0,
    SONGGRAPH_ERROR_INVALID_ARGUMENT = -1,
    SONGGRAPH_ERROR_LOAD_FAILED = -2,
    SONGGRAPH_ERROR_NOT_FOUND = -3,
    SONGGRAPH_ERROR_INVALID_SELECTION = -4,
    SONGGRAPH_ERROR_EXPORT_FAILED = -5,
    SONGGRAPH_ERROR_DATABASE_ERROR = -6,
    SONGGRAPH_ERROR_NOT_RESOLVED = -7,
} SongGraphError;

typedef enum {
    SONGGRAPH_QUERY_RESOLVED = 0,
    SONGGRAPH_QUERY_AMBIGUOUS = 1,
    SONGGRAPH_QUERY_NOT_FOUND = 2,
    SONGGRAPH_QUERY_INVALID_SELECTION = 3,
} SongGraphQueryStatus;

/* Track information. Strings are owned by the handle that returned them. */
typedef struct {
    const char* track_id;
    const char* artists;
    const char* album_name;
    const char* track_name;
    int popularity;
    float danceability;
    float energy;
    float tempo;
    float valence;
} SongGraphTrackInfo;

/* Query configuration */
typedef struct {
    float danceability_tol;     /* Max |delta| (default: 0.05) */
    float energy_tol;           /* Max |delta| (default: 0.05) */
    float tempo_tol;            /* Max |delta| in BPM (default: 50.0) */
    float valence_tol;          /* Max |delta| (default: 0.1) */
    int popularity_min;         /* Popularity must exceed this (default: 70) */
    int top_k_similar;          /* Neighbors kept (default: 5) */
    int top_k_disambiguation;   /* Candidates offered on name collision (default: 3) */
    int key_by_id;              /* Use track ids as DOT node identifiers */
} SongGraphConfig;

/**
 * Fill a configuration with the default values.
 */
void songgraph_default_config(SongGraphConfig* config);

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

/**
 * Create a new engine with an empty catalog.
 *
 * @param config Query configuration (NULL for defaults)
 * @return Engine instance, or NULL if the configuration is invalid
 */
SongGraphEngine* songgraph_create(const SongGraphConfig* config);

/**
 * Destroy an engine instance and free all resources.
 */
void songgraph_destroy(SongGraphEngine* engine);

/**
 * Get the last error message.
 */
const char* songgraph_get_error(SongGraphEngine* engine);

/* ============================================================================
 * Catalog
 * ============================================================================ */

/**
 * Load the catalog from a CSV file with a header row.
 *
 * @return Number of tracks loaded, or negative error code
 */
int songgraph_load_csv(SongGraphEngine* engine, const char* csv_path);

/**
 * Load the catalog from an SQLite database written by songgraph_save_database.
 *
 * @return Number of tracks loaded, or negative error code
 */
int songgraph_load_database(SongGraphEngine* engine, const char* db_path);

/**
 * Write the current catalog into an SQLite database (insert or update).
 *
 * @return Number of tracks written, or negative error code
 */
int songgraph_save_database(SongGraphEngine* engine, const char* db_path);

/**
 * Get the number of tracks in the catalog.
 */
int songgraph_get_track_count(SongGraphEngine* engine);

/* ============================================================================
 * Queries
 * ============================================================================ */

/**
 * Look up a track by name (case-insensitive, exact).
 *
 * @return Query handle (check songgraph_query_status), or NULL on invalid argument
 */
SongGraphQuery songgraph_query(SongGraphEngine* engine, const char* track_name);

/**
 * Get the resolution state of a query.
 */
SongGraphQueryStatus songgraph_query_status(SongGraphQuery query);

/**
 * Number of ranked candidates of an ambiguous query.
 */
int songgraph_query_candidate_count(SongGraphQuery query);

/**
 * Get a ranked candidate (0-based index).
 */
SongGraphError songgraph_query_get_candidate(
    SongGraphQuery query,
    int index,
    SongGraphTrackInfo* info
);

/**
 * Numbered candidate listing, one line per candidate:
 *   1: "Name" by Artists (Album: X, Popularity: N)
 * Valid until the query is freed.
 */
const char* songgraph_query_candidates_text(SongGraphQuery query);

/**
 * Choose one candidate of an ambiguous query.
 *
 * @param selection 1-based index as typed by the user
 * @return SONGGRAPH_OK, SONGGRAPH_ERROR_INVALID_SELECTION, or
 *         SONGGRAPH_ERROR_INVALID_ARGUMENT if the query is not ambiguous
 *         (the query is left unchanged)
 */
SongGraphError songgraph_query_select(
    SongGraphEngine* engine,
    SongGraphQuery query,
    const char* selection
);

/**
 * Get the resolved track.
 *
 * @return SONGGRAPH_OK, SONGGRAPH_ERROR_NOT_FOUND, or SONGGRAPH_ERROR_NOT_RESOLVED
 */
SongGraphError songgraph_query_get_track(SongGraphQuery query, SongGraphTrackInfo* info);

/**
 * Compute the similar tracks of a resolved query.
 *
 * @return Number of similar tracks, or negative error code
 */
int songgraph_query_find_similar(SongGraphEngine* engine, SongGraphQuery query);

/**
 * Get a similar track (0-based index) after songgraph_query_find_similar.
 */
SongGraphError songgraph_query_get_similar(
    SongGraphQuery query,
    int index,
    SongGraphTrackInfo* info
);

/**
 * Human-readable summary of the similar tracks.
 * Valid until the query is freed.
 */
const char* songgraph_query_summary(SongGraphQuery query);

/**
 * Write the similarity graph of a query to a DOT file.
 *
 * @param path Output path (NULL for the default "graph.dot")
 */
SongGraphError songgraph_query_export_dot(
    SongGraphEngine* engine,
    SongGraphQuery query,
    const char* path
);

/**
 * Free a query handle.
 */
void songgraph_query_free(SongGraphQuery query);

#ifdef __cplusplus
}
#endif

#endif /* SONGGRAPH_H */
