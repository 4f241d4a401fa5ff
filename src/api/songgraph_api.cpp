/**
 * SongGraph - C API Implementation
 */

#include "songgraph/songgraph.h"
#include "../engine/engine.h"
#include "../graph/report.h"

using namespace songgraph;

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct SongGraphEngine {
    std::unique_ptr<Engine> engine;
    std::string last_error;
};

struct SongGraphQueryImpl {
    Resolution resolution;
    std::optional<QueryResult> result;
    std::string candidates_text;
    std::string summary;
};

namespace {

void fill_info(const Track& track, SongGraphTrackInfo* info) {
    info->track_id = track.track_id.c_str();
    info->artists = track.artists.c_str();
    info->album_name = track.album_name.c_str();
    info->track_name = track.track_name.c_str();
    info->popularity = track.popularity;
    info->danceability = track.danceability;
    info->energy = track.energy;
    info->tempo = track.tempo;
    info->valence = track.valence;
}

QueryConfig to_query_config(const SongGraphConfig& config) {
    QueryConfig cpp_config;
    cpp_config.thresholds.danceability_tol = config.danceability_tol;
    cpp_config.thresholds.energy_tol = config.energy_tol;
    cpp_config.thresholds.tempo_tol = config.tempo_tol;
    cpp_config.thresholds.valence_tol = config.valence_tol;
    cpp_config.thresholds.popularity_min = config.popularity_min;
    cpp_config.top_k_similar = config.top_k_similar;
    cpp_config.top_k_disambiguation = config.top_k_disambiguation;
    cpp_config.key_by_id = config.key_by_id != 0;
    return cpp_config;
}

} // namespace

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

void songgraph_default_config(SongGraphConfig* config) {
    if (!config) return;

    QueryConfig defaults = QueryConfig::defaults();
    config->danceability_tol = defaults.thresholds.danceability_tol;
    config->energy_tol = defaults.thresholds.energy_tol;
    config->tempo_tol = defaults.thresholds.tempo_tol;
    config->valence_tol = defaults.thresholds.valence_tol;
    config->popularity_min = defaults.thresholds.popularity_min;
    config->top_k_similar = defaults.top_k_similar;
    config->top_k_disambiguation = defaults.top_k_disambiguation;
    config->key_by_id = defaults.key_by_id ? 1 : 0;
}

SongGraphEngine* songgraph_create(const SongGraphConfig* config) {
    QueryConfig cpp_config = config ? to_query_config(*config) : QueryConfig::defaults();
    if (!cpp_config.validate().empty()) {
        return nullptr;
    }

    auto handle = new SongGraphEngine();
    handle->engine = std::make_unique<Engine>(cpp_config);
    return handle;
}

void songgraph_destroy(SongGraphEngine* engine) {
    delete engine;
}

const char* songgraph_get_error(SongGraphEngine* engine) {
    if (!engine) return "Invalid engine";
    return engine->last_error.c_str();
}

/* ============================================================================
 * Catalog
 * ============================================================================ */

int songgraph_load_csv(SongGraphEngine* engine, const char* csv_path) {
    if (!engine || !engine->engine || !csv_path) return SONGGRAPH_ERROR_INVALID_ARGUMENT;

    auto result = engine->engine->load_csv(csv_path);
    if (result.failed()) {
        engine->last_error = result.error();
        return SONGGRAPH_ERROR_LOAD_FAILED;
    }
    return result.value();
}

int songgraph_load_database(SongGraphEngine* engine, const char* db_path) {
    if (!engine || !engine->engine || !db_path) return SONGGRAPH_ERROR_INVALID_ARGUMENT;

    auto result = engine->engine->load_database(db_path);
    if (result.failed()) {
        engine->last_error = result.error();
        return SONGGRAPH_ERROR_DATABASE_ERROR;
    }
    return result.value();
}

int songgraph_save_database(SongGraphEngine* engine, const char* db_path) {
    if (!engine || !engine->engine || !db_path) return SONGGRAPH_ERROR_INVALID_ARGUMENT;

    auto result = engine->engine->save_database(db_path);
    if (result.failed()) {
        engine->last_error = result.error();
        return SONGGRAPH_ERROR_DATABASE_ERROR;
    }
    return result.value();
}

int songgraph_get_track_count(SongGraphEngine* engine) {
    if (!engine || !engine->engine) return 0;
    return engine->engine->track_count();
}

/* ============================================================================
 * Queries
 * ============================================================================ */

SongGraphQuery songgraph_query(SongGraphEngine* engine, const char* track_name) {
    if (!engine || !engine->engine || !track_name) return nullptr;

    auto handle = new SongGraphQueryImpl();
    handle->resolution = engine->engine->resolve(track_name);

    if (handle->resolution.status == ResolveStatus::NotFound) {
        engine->last_error = "No song found with the name '" + std::string(track_name) + "'";
    }
    handle->candidates_text = format_candidates(handle->resolution.candidates);
    return handle;
}

SongGraphQueryStatus songgraph_query_status(SongGraphQuery query) {
    if (!query) return SONGGRAPH_QUERY_NOT_FOUND;

    switch (query->resolution.status) {
        case ResolveStatus::Resolved: return SONGGRAPH_QUERY_RESOLVED;
        case ResolveStatus::Ambiguous: return SONGGRAPH_QUERY_AMBIGUOUS;
        case ResolveStatus::InvalidSelection: return SONGGRAPH_QUERY_INVALID_SELECTION;
        case ResolveStatus::NotFound: break;
    }
    return SONGGRAPH_QUERY_NOT_FOUND;
}

int songgraph_query_candidate_count(SongGraphQuery query) {
    if (!query) return 0;
    return static_cast<int>(query->resolution.candidates.size());
}

SongGraphError songgraph_query_get_candidate(
    SongGraphQuery query,
    int index,
    SongGraphTrackInfo* info
) {
    if (!query || !info || index < 0 ||
        index >= static_cast<int>(query->resolution.candidates.size())) {
        return SONGGRAPH_ERROR_INVALID_ARGUMENT;
    }

    fill_info(query->resolution.candidates[index], info);
    return SONGGRAPH_OK;
}

const char* songgraph_query_candidates_text(SongGraphQuery query) {
    if (!query) return "";
    return query->candidates_text.c_str();
}

SongGraphError songgraph_query_select(
    SongGraphEngine* engine,
    SongGraphQuery query,
    const char* selection
) {
    if (!engine || !engine->engine || !query || !selection) return SONGGRAPH_ERROR_INVALID_ARGUMENT;

    // Only an ambiguous query has candidates to choose from
    if (query->resolution.status != ResolveStatus::Ambiguous) {
        engine->last_error = "Query is not awaiting a selection";
        return SONGGRAPH_ERROR_INVALID_ARGUMENT;
    }

    query->resolution = engine->engine->select(query->resolution, selection);
    query->result.reset();
    query->summary.clear();

    if (!query->resolution.resolved()) {
        engine->last_error = "Invalid selection '" + std::string(selection) + "'";
        return SONGGRAPH_ERROR_INVALID_SELECTION;
    }
    return SONGGRAPH_OK;
}

SongGraphError songgraph_query_get_track(SongGraphQuery query, SongGraphTrackInfo* info) {
    if (!query || !info) return SONGGRAPH_ERROR_INVALID_ARGUMENT;
    if (query->resolution.status == ResolveStatus::NotFound) return SONGGRAPH_ERROR_NOT_FOUND;
    if (!query->resolution.resolved()) return SONGGRAPH_ERROR_NOT_RESOLVED;

    fill_info(*query->resolution.track, info);
    return SONGGRAPH_OK;
}

int songgraph_query_find_similar(SongGraphEngine* engine, SongGraphQuery query) {
    if (!engine || !engine->engine || !query) return SONGGRAPH_ERROR_INVALID_ARGUMENT;

    if (!query->resolution.resolved()) {
        engine->last_error = "Query is not resolved to a single track";
        return SONGGRAPH_ERROR_NOT_RESOLVED;
    }

    query->result = engine->engine->query(*query->resolution.track);
    query->summary = format_summary(query->result->reference, query->result->similar);
    return static_cast<int>(query->result->similar.size());
}

SongGraphError songgraph_query_get_similar(
    SongGraphQuery query,
    int index,
    SongGraphTrackInfo* info
) {
    if (!query || !info || !query->result || index < 0 ||
        index >= static_cast<int>(query->result->similar.size())) {
        return SONGGRAPH_ERROR_INVALID_ARGUMENT;
    }

    fill_info(query->result->similar[index], info);
    return SONGGRAPH_OK;
}

const char* songgraph_query_summary(SongGraphQuery query) {
    if (!query) return "";
    return query->summary.c_str();
}

SongGraphError songgraph_query_export_dot(
    SongGraphEngine* engine,
    SongGraphQuery query,
    const char* path
) {
    if (!engine || !engine->engine || !query) return SONGGRAPH_ERROR_INVALID_ARGUMENT;

    if (!query->result) {
        engine->last_error = "No similarity result to export";
        return SONGGRAPH_ERROR_NOT_RESOLVED;
    }

    auto result = engine->engine->export_graph(query->result->graph, path ? path : "");
    if (result.failed()) {
        engine->last_error = result.error();
        return SONGGRAPH_ERROR_EXPORT_FAILED;
    }
    return SONGGRAPH_OK;
}

void songgraph_query_free(SongGraphQuery query) {
    delete query;
}
