/**
 * SongGraph CLI - Similar Song Finder
 *
 * Finds songs similar to a named track and exports the result as a DOT graph.
 *
 * Usage: songgraph [options] [song name]
 */

#include "songgraph/songgraph.h"
#include "../core/utils.h"
#include <iostream>
#include <string>
#include <cstring>

namespace {

#ifdef SONGGRAPH_DEFAULT_CATALOG_PATH
const char* kDefaultCatalog = SONGGRAPH_DEFAULT_CATALOG_PATH;
#else
const char* kDefaultCatalog = "spotify.csv";
#endif

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [song name]\n"
              << "\nOptions:\n"
              << "  -c, --catalog <path>       CSV catalog (default: " << kDefaultCatalog << ")\n"
              << "  -d, --database <path>      Load the catalog from an SQLite database instead\n"
              << "  -o, --output <path>        DOT output file (default: graph.dot)\n"
              << "  -n, --name <song>          Song name (prompted if omitted)\n"
              << "  -s, --select <n>           Candidate to pick when the name is ambiguous\n"
              << "      --danceability-tol <x> Danceability tolerance (default: 0.05)\n"
              << "      --energy-tol <x>       Energy tolerance (default: 0.05)\n"
              << "      --tempo-tol <x>        Tempo tolerance in BPM (default: 50)\n"
              << "      --valence-tol <x>      Valence tolerance (default: 0.1)\n"
              << "      --popularity-min <n>   Popularity must exceed this (default: 70)\n"
              << "  -k, --top <n>              Similar songs to keep (default: 5)\n"
              << "      --candidates <n>       Candidates offered on ambiguity (default: 3)\n"
              << "      --key-by-id            Use track ids as graph node identifiers\n"
              << "  -h, --help                 Show this help\n";
}

bool parse_float_arg(const char* text, float& out) {
    auto value = songgraph::utils::parse_float(text);
    if (!value) return false;
    out = *value;
    return true;
}

bool parse_int_arg(const char* text, int& out) {
    // Rejects values that do not fit in an int
    auto value = songgraph::utils::parse_int32(text);
    if (!value) return false;
    out = *value;
    return true;
}

std::string read_line(const char* prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return {};
    }
    return songgraph::utils::trim(line);
}

void print_candidates(SongGraphQuery query) {
    std::cout << "Multiple matches found. Please select one of the top "
              << songgraph_query_candidate_count(query) << " most popular songs:\n"
              << songgraph_query_candidates_text(query);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string catalog_path = kDefaultCatalog;
    std::string db_path;
    std::string output_path = "graph.dot";
    std::string song_name;
    std::string selection;
    bool have_selection = false;

    SongGraphConfig config;
    songgraph_default_config(&config);

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        auto need_value = [&]() {
            if (!has_value) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                return false;
            }
            return true;
        };
        auto bad_value = [&]() {
            std::cerr << "Error: invalid value '" << argv[i] << "' for " << arg << "\n";
            return 1;
        };

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--catalog") == 0) {
            if (!need_value()) return 1;
            catalog_path = argv[++i];
        } else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--database") == 0) {
            if (!need_value()) return 1;
            db_path = argv[++i];
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (!need_value()) return 1;
            output_path = argv[++i];
        } else if (strcmp(arg, "-n") == 0 || strcmp(arg, "--name") == 0) {
            if (!need_value()) return 1;
            song_name = argv[++i];
        } else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--select") == 0) {
            if (!need_value()) return 1;
            selection = argv[++i];
            have_selection = true;
        } else if (strcmp(arg, "--danceability-tol") == 0) {
            if (!need_value()) return 1;
            if (!parse_float_arg(argv[++i], config.danceability_tol)) return bad_value();
        } else if (strcmp(arg, "--energy-tol") == 0) {
            if (!need_value()) return 1;
            if (!parse_float_arg(argv[++i], config.energy_tol)) return bad_value();
        } else if (strcmp(arg, "--tempo-tol") == 0) {
            if (!need_value()) return 1;
            if (!parse_float_arg(argv[++i], config.tempo_tol)) return bad_value();
        } else if (strcmp(arg, "--valence-tol") == 0) {
            if (!need_value()) return 1;
            if (!parse_float_arg(argv[++i], config.valence_tol)) return bad_value();
        } else if (strcmp(arg, "--popularity-min") == 0) {
            if (!need_value()) return 1;
            if (!parse_int_arg(argv[++i], config.popularity_min)) return bad_value();
        } else if (strcmp(arg, "-k") == 0 || strcmp(arg, "--top") == 0) {
            if (!need_value()) return 1;
            if (!parse_int_arg(argv[++i], config.top_k_similar)) return bad_value();
        } else if (strcmp(arg, "--candidates") == 0) {
            if (!need_value()) return 1;
            if (!parse_int_arg(argv[++i], config.top_k_disambiguation)) return bad_value();
        } else if (strcmp(arg, "--key-by-id") == 0) {
            config.key_by_id = 1;
        } else if (arg[0] != '-') {
            song_name = song_name.empty() ? arg : song_name + " " + arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    SongGraphEngine* engine = songgraph_create(&config);
    if (!engine) {
        std::cerr << "Error: Invalid configuration (tolerances must be >= 0, counts > 0)\n";
        return 1;
    }

    // Load catalog
    int loaded = db_path.empty()
        ? songgraph_load_csv(engine, catalog_path.c_str())
        : songgraph_load_database(engine, db_path.c_str());
    if (loaded < 0) {
        std::cerr << "Error: " << songgraph_get_error(engine) << "\n";
        songgraph_destroy(engine);
        return 1;
    }
    std::cout << "Loaded " << loaded << " tracks from the dataset.\n";

    if (song_name.empty()) {
        song_name = read_line("Enter the name of a song: ");
    }

    SongGraphQuery query = songgraph_query(engine, song_name.c_str());
    if (!query) {
        std::cerr << "Error: " << songgraph_get_error(engine) << "\n";
        songgraph_destroy(engine);
        return 1;
    }

    if (songgraph_query_status(query) == SONGGRAPH_QUERY_NOT_FOUND) {
        std::cout << "No song found with the name '" << song_name << "'.\n";
        songgraph_query_free(query);
        songgraph_destroy(engine);
        return 0;
    }

    if (songgraph_query_status(query) == SONGGRAPH_QUERY_AMBIGUOUS) {
        print_candidates(query);
        if (!have_selection) {
            selection = read_line("Enter the number of the correct song: ");
        }
        if (songgraph_query_select(engine, query, selection.c_str()) != SONGGRAPH_OK) {
            std::cout << "Invalid selection '" << selection << "'.\n";
            songgraph_query_free(query);
            songgraph_destroy(engine);
            return 0;
        }
    }

    if (songgraph_query_find_similar(engine, query) < 0) {
        std::cerr << "Error: " << songgraph_get_error(engine) << "\n";
        songgraph_query_free(query);
        songgraph_destroy(engine);
        return 1;
    }

    std::cout << songgraph_query_summary(query);

    if (songgraph_query_export_dot(engine, query, output_path.c_str()) != SONGGRAPH_OK) {
        std::cerr << "Error: " << songgraph_get_error(engine) << "\n";
        songgraph_query_free(query);
        songgraph_destroy(engine);
        return 1;
    }
    std::cout << "Graph exported to '" << output_path << "'.\n";

    songgraph_query_free(query);
    songgraph_destroy(engine);
    return 0;
}
