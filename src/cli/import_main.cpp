/**
 * SongGraph CLI - Import Tool
 *
 * Imports a CSV track catalog into an SQLite database.
 *
 * Usage: songgraph-import [options] <catalog.csv>
 */

#include "songgraph/songgraph.h"
#include <iostream>
#include <string>
#include <cstring>

void print_usage(const char* program) {
    std::string default_db = "songgraph.db";
#ifdef SONGGRAPH_DEFAULT_DB_PATH
    default_db = SONGGRAPH_DEFAULT_DB_PATH;
#endif

    std::cerr << "Usage: " << program << " [options] <catalog.csv>\n"
              << "\nOptions:\n"
              << "  -d, --database <path>  Database file path (default: " << default_db << ")\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
#ifdef SONGGRAPH_DEFAULT_DB_PATH
    std::string db_path = SONGGRAPH_DEFAULT_DB_PATH;
#else
    std::string db_path = "songgraph.db";
#endif
    std::string csv_path;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--database") == 0) {
            if (i + 1 < argc) {
                db_path = argv[++i];
            } else {
                std::cerr << "Error: -d requires a path argument\n";
                return 1;
            }
        } else if (argv[i][0] != '-') {
            csv_path = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (csv_path.empty()) {
        std::cerr << "Error: No catalog file specified\n";
        print_usage(argv[0]);
        return 1;
    }

    SongGraphEngine* engine = songgraph_create(nullptr);
    if (!engine) {
        std::cerr << "Error: Failed to create engine\n";
        return 1;
    }

    std::cout << "Reading " << csv_path << "...\n";

    int loaded = songgraph_load_csv(engine, csv_path.c_str());
    if (loaded < 0) {
        std::cerr << "Error: " << songgraph_get_error(engine) << "\n";
        songgraph_destroy(engine);
        return 1;
    }

    int written = songgraph_save_database(engine, db_path.c_str());
    if (written < 0) {
        std::cerr << "Error: " << songgraph_get_error(engine) << "\n";
        songgraph_destroy(engine);
        return 1;
    }

    std::cout << "Done! " << written << " of " << loaded << " tracks imported into " << db_path << "\n";

    songgraph_destroy(engine);
    return 0;
}
