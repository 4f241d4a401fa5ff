/**
 * SongGraph - DOT Exporter Implementation
 */

#include "dot_exporter.h"
#include "subgraph.h"
#include <fstream>
#include <sstream>

namespace songgraph {

DotExporter::DotExporter(const DotOptions& options)
    : options_(options) {}

std::string DotExporter::node_id(const GraphNode& node) const {
    return "\"" + (options_.key_by_id ? node.track_id : node.name) + "\"";
}

bool DotExporter::write(const Subgraph& graph, std::ostream& out) const {
    const std::string& pad = options_.indent;
    const std::string center = node_id(graph.center);

    out << "digraph {\n";

    if (options_.key_by_id) {
        out << pad << center << " [label=\"" << graph.center.name << "\\n"
            << format_features(graph.center.features) << "\"];\n";
        for (const auto& edge : graph.edges) {
            out << pad << node_id(edge.to) << " [label=\"" << edge.to.name << "\"];\n";
        }
    } else {
        out << pad << center << " [label=\"" << format_features(graph.center.features) << "\"];\n";
    }

    for (const auto& edge : graph.edges) {
        out << pad << center << " -> " << node_id(edge.to)
            << " [label=\"" << format_features(edge.to.features) << "\"];\n";
    }

    out << "}\n";
    return static_cast<bool>(out);
}

std::string DotExporter::render(const Subgraph& graph) const {
    std::ostringstream out;
    write(graph, out);
    return out.str();
}

Result<size_t> DotExporter::write_file(const Subgraph& graph, const std::string& path) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return "Failed to open output file: " + path;
    }

    std::string text = render(graph);
    file << text;
    file.flush();

    if (!file) {
        return "Failed to write output file: " + path;
    }
    return text.size();
}

} // namespace songgraph
