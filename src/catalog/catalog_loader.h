/**
 * SongGraph - Catalog Loader
 */

#ifndef SONGGRAPH_CATALOG_LOADER_H
#define SONGGRAPH_CATALOG_LOADER_H

#include "songgraph/types.h"
#include <istream>
#include <string>
#include <vector>

namespace songgraph {

/**
 * Columns every catalog must provide.
 */
const std::vector<std::string>& required_columns();

/**
 * Parse a catalog from CSV text with a header row.
 * Columns are matched by name and unknown columns are ignored.
 * The first malformed record aborts the load; no partial catalog is returned.
 */
Result<Catalog> parse_catalog_csv(std::istream& in);

/**
 * Load a catalog from a CSV file.
 */
Result<Catalog> load_catalog_csv(const std::string& path);

} // namespace songgraph

#endif // SONGGRAPH_CATALOG_LOADER_H
