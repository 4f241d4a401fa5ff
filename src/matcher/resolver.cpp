/**
 * SongGraph - Name Resolver Implementation
 */

#include "resolver.h"
#include "../core/utils.h"
#include <algorithm>

namespace songgraph {

NameResolver::NameResolver(int max_candidates)
    : max_candidates_(max_candidates) {}

std::vector<Track> NameResolver::find_matches(const Catalog& catalog, const std::string& name) const {
    std::vector<Track> matches;
    for (const auto& track : catalog) {
        if (utils::iequals(track.track_name, name)) {
            matches.push_back(track);
        }
    }
    return matches;
}

std::vector<Track> NameResolver::rank_candidates(std::vector<Track> matches) const {
    std::stable_sort(matches.begin(), matches.end(),
        [](const Track& a, const Track& b) { return a.popularity > b.popularity; });

    size_t limit = static_cast<size_t>(std::max(max_candidates_, 1));
    if (matches.size() > limit) {
        matches.resize(limit);
    }
    return matches;
}

Resolution NameResolver::resolve(const Catalog& catalog, const std::string& name) const {
    Resolution result;
    result.query = name;

    auto matches = find_matches(catalog, name);

    if (matches.empty()) {
        result.status = ResolveStatus::NotFound;
        return result;
    }

    if (matches.size() == 1) {
        result.status = ResolveStatus::Resolved;
        result.track = std::move(matches.front());
        return result;
    }

    result.status = ResolveStatus::Ambiguous;
    result.candidates = rank_candidates(std::move(matches));
    return result;
}

Resolution NameResolver::select(const Resolution& ambiguous, const std::string& selection) const {
    auto index = utils::parse_index(selection);
    if (!index || *index == 0 || *index > ambiguous.candidates.size()) {
        Resolution result;
        result.status = ResolveStatus::InvalidSelection;
        result.query = ambiguous.query;
        result.candidates = ambiguous.candidates;
        result.selection = selection;
        return result;
    }
    return select(ambiguous, static_cast<int>(*index));
}

Resolution NameResolver::select(const Resolution& ambiguous, int index) const {
    Resolution result;
    result.query = ambiguous.query;
    result.candidates = ambiguous.candidates;

    // Bounds are checked against the truncated, ranked list
    if (ambiguous.status != ResolveStatus::Ambiguous ||
        index < 1 || static_cast<size_t>(index) > ambiguous.candidates.size()) {
        result.status = ResolveStatus::InvalidSelection;
        result.selection = std::to_string(index);
        return result;
    }

    result.status = ResolveStatus::Resolved;
    result.track = ambiguous.candidates[index - 1];
    return result;
}

} // namespace songgraph
