/**
 * SongGraph - Name Resolver
 */

#ifndef SONGGRAPH_RESOLVER_H
#define SONGGRAPH_RESOLVER_H

#include "songgraph/types.h"
#include <string>
#include <vector>

namespace songgraph {

/**
 * Resolve a user-supplied track name to one catalog record.
 *
 * Resolution is a two-step exchange: resolve() either settles on a track or
 * returns the ranked candidates, and select() takes the caller's choice.
 */
class NameResolver {
public:
    explicit NameResolver(int max_candidates = 3);

    /**
     * All tracks whose name equals the query (ASCII case-insensitive),
     * in catalog order.
     */
    std::vector<Track> find_matches(const Catalog& catalog, const std::string& name) const;

    /**
     * Resolve a name against the catalog.
     * @return Resolved, Ambiguous (ranked candidates) or NotFound
     */
    Resolution resolve(const Catalog& catalog, const std::string& name) const;

    /**
     * Pick one of the ambiguous candidates.
     * @param ambiguous Result of resolve() with status Ambiguous
     * @param selection 1-based index as typed by the user
     * @return Resolved, or InvalidSelection carrying the token
     */
    Resolution select(const Resolution& ambiguous, const std::string& selection) const;

    /**
     * Pick one of the ambiguous candidates by 1-based index.
     */
    Resolution select(const Resolution& ambiguous, int index) const;

    /**
     * Order matches by popularity (descending, stable) and keep the top entries.
     */
    std::vector<Track> rank_candidates(std::vector<Track> matches) const;

    void set_max_candidates(int count) { max_candidates_ = count; }
    int max_candidates() const { return max_candidates_; }

private:
    int max_candidates_;
};

} // namespace songgraph

#endif // SONGGRAPH_RESOLVER_H
