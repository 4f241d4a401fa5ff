/**
 * SongGraph - Text Reports
 */

#ifndef SONGGRAPH_REPORT_H
#define SONGGRAPH_REPORT_H

#include "songgraph/types.h"
#include <string>
#include <vector>

namespace songgraph {

/**
 * Numbered candidate list shown when a name is ambiguous:
 *   1: "Name" by Artists (Album: X, Popularity: N)
 */
std::string format_candidates(const std::vector<Track>& candidates);

/**
 * Similar-track summary: a header line for the reference track followed by
 * one "  -> ..." line per neighbor.
 */
std::string format_summary(const Track& reference, const std::vector<Track>& similar);

} // namespace songgraph

#endif // SONGGRAPH_REPORT_H
