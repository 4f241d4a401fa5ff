/**
 * SongGraph - Subgraph Builder Implementation
 */

#include "subgraph.h"
#include "../core/utils.h"

namespace songgraph {

FeatureSnapshot snapshot_of(const Track& track) {
    FeatureSnapshot features;
    features.danceability = track.danceability;
    features.energy = track.energy;
    features.tempo = track.tempo;
    features.valence = track.valence;
    features.popularity = track.popularity;
    return features;
}

std::string format_features(const FeatureSnapshot& features) {
    return "Danceability: " + utils::format_fixed2(features.danceability) +
           ", Energy: " + utils::format_fixed2(features.energy) +
           ", Tempo: " + utils::format_fixed2(features.tempo) +
           ", Valence: " + utils::format_fixed2(features.valence) +
           ", Popularity: " + std::to_string(features.popularity);
}

Subgraph SubgraphBuilder::build(const Track& reference, const std::vector<Track>& neighbors) const {
    Subgraph graph;
    graph.center.track_id = reference.track_id;
    graph.center.name = reference.track_name;
    graph.center.features = snapshot_of(reference);

    graph.edges.reserve(neighbors.size());
    for (const auto& neighbor : neighbors) {
        GraphEdge edge;
        edge.from_id = reference.track_id;
        edge.to.track_id = neighbor.track_id;
        edge.to.name = neighbor.track_name;
        edge.to.features = snapshot_of(neighbor);
        graph.edges.push_back(std::move(edge));
    }

    return graph;
}

} // namespace songgraph
