/**
 * SongGraph - Main Engine Implementation
 */

#include "engine.h"
#include "../catalog/catalog_loader.h"
#include "../core/store.h"

namespace songgraph {

Engine::Engine(const QueryConfig& config)
    : catalog_(std::make_shared<const Catalog>()) {
    set_config(config);
}

Engine::~Engine() = default;

bool Engine::set_config(const QueryConfig& config) {
    std::string problem = config.validate();
    if (!problem.empty()) {
        last_error_ = "Invalid configuration: " + problem;
        return false;
    }

    config_ = config;
    resolver_.set_max_candidates(config_.top_k_disambiguation);
    filter_.set_thresholds(config_.thresholds);
    return true;
}

Result<int> Engine::load_csv(const std::string& path) {
    auto result = load_catalog_csv(path);
    if (result.failed()) {
        last_error_ = result.error();
        return result.error();
    }

    int count = static_cast<int>(result.value().size());
    set_catalog(std::move(result.value()));
    return count;
}

Result<int> Engine::load_database(const std::string& db_path) {
    Store store(db_path);
    if (!store.is_open()) {
        last_error_ = "Failed to open database: " + store.error();
        return last_error_;
    }

    auto result = store.get_all_tracks();
    if (result.failed()) {
        last_error_ = "Failed to read database: " + result.error();
        return last_error_;
    }

    int count = static_cast<int>(result.value().size());
    set_catalog(std::move(result.value()));
    return count;
}

Result<int> Engine::save_database(const std::string& db_path) const {
    Store store(db_path);
    if (!store.is_open()) {
        return "Failed to open database: " + store.error();
    }
    return store.import_tracks(*catalog_);
}

void Engine::set_catalog(Catalog tracks) {
    // Readers holding the previous snapshot keep it alive
    catalog_ = std::make_shared<const Catalog>(std::move(tracks));
}

int Engine::track_count() const {
    return static_cast<int>(catalog_->size());
}

std::optional<Track> Engine::get_track(const std::string& track_id) const {
    for (const auto& track : *catalog_) {
        if (track.track_id == track_id) return track;
    }
    return std::nullopt;
}

Resolution Engine::resolve(const std::string& name) const {
    return resolver_.resolve(*catalog_, name);
}

Resolution Engine::select(const Resolution& ambiguous, const std::string& selection) const {
    return resolver_.select(ambiguous, selection);
}

std::vector<Track> Engine::find_similar(const Track& reference) const {
    return filter_.find_top_similar(*catalog_, reference, config_.top_k_similar);
}

QueryResult Engine::query(const Track& reference) const {
    QueryResult result;
    result.reference = reference;
    result.similar = find_similar(reference);
    result.graph = builder_.build(reference, result.similar);
    return result;
}

DotExporter Engine::make_exporter() const {
    DotOptions options;
    options.key_by_id = config_.key_by_id;
    return DotExporter(options);
}

std::string Engine::render_graph(const Subgraph& graph) const {
    return make_exporter().render(graph);
}

Result<size_t> Engine::export_graph(const Subgraph& graph, const std::string& path) {
    const std::string& target = path.empty() ? config_.output_path : path;

    auto result = make_exporter().write_file(graph, target);
    if (result.failed()) {
        last_error_ = result.error();
    }
    return result;
}

} // namespace songgraph
