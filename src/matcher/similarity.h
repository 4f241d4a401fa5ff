/**
 * SongGraph - Similarity Filter
 */

#ifndef SONGGRAPH_SIMILARITY_H
#define SONGGRAPH_SIMILARITY_H

#include "songgraph/types.h"
#include <vector>

namespace songgraph {

/**
 * Select tracks that sit within fixed tolerances of a reference track.
 * All five predicates must hold; there is no partial scoring.
 */
class SimilarityFilter {
public:
    explicit SimilarityFilter(const SimilarityThresholds& thresholds = SimilarityThresholds::defaults());

    /**
     * Check a single candidate against the reference.
     * A track is never similar to itself (same track_id).
     */
    bool is_similar(const Track& reference, const Track& candidate) const;

    /**
     * Find all tracks similar to the reference.
     * Only the first qualifying track per exact track_name is kept, then the
     * result is stably sorted by popularity, highest first.
     * @param catalog Tracks in load order
     * @param reference Reference track
     * @return Deduplicated, popularity-ranked tracks (possibly empty)
     */
    std::vector<Track> find_similar(const Catalog& catalog, const Track& reference) const;

    /**
     * find_similar() truncated to the first count entries.
     */
    std::vector<Track> find_top_similar(const Catalog& catalog, const Track& reference, int count) const;

    void set_thresholds(const SimilarityThresholds& thresholds) { thresholds_ = thresholds; }
    const SimilarityThresholds& thresholds() const { return thresholds_; }

private:
    SimilarityThresholds thresholds_;

    static bool within(float a, float b, float tolerance);
};

} // namespace songgraph

#endif // SONGGRAPH_SIMILARITY_H
