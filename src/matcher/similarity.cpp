/**
 * SongGraph - Similarity Filter Implementation
 */

#include "similarity.h"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace songgraph {

SimilarityFilter::SimilarityFilter(const SimilarityThresholds& thresholds)
    : thresholds_(thresholds) {}

bool SimilarityFilter::within(float a, float b, float tolerance) {
    return std::abs(a - b) <= tolerance;
}

bool SimilarityFilter::is_similar(const Track& reference, const Track& candidate) const {
    if (candidate.track_id == reference.track_id) {
        return false;
    }

    return within(candidate.danceability, reference.danceability, thresholds_.danceability_tol)
        && within(candidate.energy, reference.energy, thresholds_.energy_tol)
        && within(candidate.tempo, reference.tempo, thresholds_.tempo_tol)
        && within(candidate.valence, reference.valence, thresholds_.valence_tol)
        && candidate.popularity > thresholds_.popularity_min;
}

std::vector<Track> SimilarityFilter::find_similar(const Catalog& catalog, const Track& reference) const {
    std::vector<Track> results;
    std::unordered_set<std::string> seen_names;

    for (const auto& candidate : catalog) {
        if (!is_similar(reference, candidate)) continue;

        // First occurrence of a name wins
        if (seen_names.insert(candidate.track_name).second) {
            results.push_back(candidate);
        }
    }

    std::stable_sort(results.begin(), results.end(),
        [](const Track& a, const Track& b) { return a.popularity > b.popularity; });

    return results;
}

std::vector<Track> SimilarityFilter::find_top_similar(
    const Catalog& catalog,
    const Track& reference,
    int count
) const {
    auto results = find_similar(catalog, reference);

    if (count >= 0 && static_cast<int>(results.size()) > count) {
        results.resize(count);
    }

    return results;
}

} // namespace songgraph
