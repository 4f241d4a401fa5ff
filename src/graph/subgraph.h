/**
 * SongGraph - Subgraph Builder
 */

#ifndef SONGGRAPH_SUBGRAPH_H
#define SONGGRAPH_SUBGRAPH_H

#include "songgraph/types.h"
#include <string>
#include <vector>

namespace songgraph {

/**
 * Feature values shown for a track in graph labels.
 */
FeatureSnapshot snapshot_of(const Track& track);

/**
 * Render a snapshot as "Danceability: 0.80, Energy: 0.90, Tempo: 120.00,
 * Valence: 0.70, Popularity: 85". Field order is fixed.
 */
std::string format_features(const FeatureSnapshot& features);

/**
 * Build a one-hop star graph around a reference track.
 */
class SubgraphBuilder {
public:
    /**
     * @param reference Center of the star
     * @param neighbors Similar tracks, in the order edges should appear
     * @return Center node plus one outgoing edge per neighbor
     */
    Subgraph build(const Track& reference, const std::vector<Track>& neighbors) const;
};

} // namespace songgraph

#endif // SONGGRAPH_SUBGRAPH_H
