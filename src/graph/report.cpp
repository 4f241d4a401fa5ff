/**
 * SongGraph - Text Reports Implementation
 */

#include "report.h"
#include "subgraph.h"
#include <sstream>

namespace songgraph {

std::string format_candidates(const std::vector<Track>& candidates) {
    std::ostringstream out;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& track = candidates[i];
        out << (i + 1) << ": \"" << track.track_name << "\" by " << track.artists
            << " (Album: " << track.album_name << ", Popularity: " << track.popularity << ")\n";
    }
    return out.str();
}

std::string format_summary(const Track& reference, const std::vector<Track>& similar) {
    std::ostringstream out;

    out << "Top " << similar.size() << " similar songs to \"" << reference.track_name
        << "\" by " << reference.artists
        << " [" << format_features(snapshot_of(reference)) << "]:\n";

    for (const auto& song : similar) {
        out << "  -> \"" << song.track_name << "\" by " << song.artists
            << " [" << format_features(snapshot_of(song)) << "]\n";
    }

    return out.str();
}

} // namespace songgraph
