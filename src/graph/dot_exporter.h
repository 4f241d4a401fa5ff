/**
 * SongGraph - DOT Exporter
 */

#ifndef SONGGRAPH_DOT_EXPORTER_H
#define SONGGRAPH_DOT_EXPORTER_H

#include "songgraph/types.h"
#include <ostream>
#include <string>

namespace songgraph {

struct DotOptions {
    // Identify nodes by track_id and put names in labels. With the default
    // (false) nodes are identified by display name, so two distinct tracks
    // sharing a name collapse into one node.
    bool key_by_id = false;
    std::string indent = "    ";
};

/**
 * Serialize a similarity subgraph as a Graphviz digraph.
 *
 * Identifiers are wrapped in double quotes without escaping; a name that
 * contains a double quote produces invalid DOT.
 */
class DotExporter {
public:
    explicit DotExporter(const DotOptions& options = DotOptions());

    /**
     * Render the graph to a string.
     */
    std::string render(const Subgraph& graph) const;

    /**
     * Write the graph to a stream.
     * @return false if the stream reported an error
     */
    bool write(const Subgraph& graph, std::ostream& out) const;

    /**
     * Write the graph to a file, replacing any existing content.
     * A failed write leaves whatever was already written in place.
     * @return Number of bytes written
     */
    Result<size_t> write_file(const Subgraph& graph, const std::string& path) const;

    const DotOptions& options() const { return options_; }

private:
    DotOptions options_;

    std::string node_id(const GraphNode& node) const;
};

} // namespace songgraph

#endif // SONGGRAPH_DOT_EXPORTER_H
