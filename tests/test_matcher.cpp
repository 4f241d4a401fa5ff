/**
 * SongGraph - Matcher Module Tests
 * Tests for NameResolver and SimilarityFilter
 */

#include "songgraph/types.h"
#include "../src/core/utils.h"
#include "../src/matcher/resolver.h"
#include "../src/matcher/similarity.h"

#include <iostream>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

using namespace songgraph;

/* ============================================================================
 * Test Utilities
 * ============================================================================ */

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

void assert_true(bool condition, const char* msg = "") {
    if (!condition) {
        throw std::runtime_error(std::string("Assertion failed: ") + msg);
    }
}

void assert_equal(const std::string& actual, const std::string& expected, const char* msg = "") {
    if (actual != expected) {
        throw std::runtime_error(std::string(msg) +
            " Expected: '" + expected + "', Actual: '" + actual + "'");
    }
}

/* ============================================================================
 * Test Data Helpers
 * ============================================================================ */

Track make_track(const std::string& id, const std::string& name, int popularity,
                 float danceability = 0.8f, float energy = 0.9f,
                 float tempo = 120.0f, float valence = 0.7f) {
    Track track;
    track.track_id = id;
    track.artists = "Artist " + id;
    track.album_name = "Album " + id;
    track.track_name = name;
    track.popularity = popularity;
    track.danceability = danceability;
    track.energy = energy;
    track.tempo = tempo;
    track.valence = valence;
    return track;
}

// The three-track catalog used throughout the pipeline tests
Catalog abc_catalog() {
    return {
        make_track("1", "Song A", 85, 0.80f, 0.90f, 120.0f, 0.70f),
        make_track("2", "Song B", 75, 0.79f, 0.91f, 121.0f, 0.72f),
        make_track("3", "Song C", 65, 0.50f, 0.50f, 90.0f, 0.30f),
    };
}

SimilarityThresholds tight_thresholds() {
    SimilarityThresholds t;
    t.danceability_tol = 0.05f;
    t.energy_tol = 0.05f;
    t.tempo_tol = 5.0f;
    t.valence_tol = 0.05f;
    t.popularity_min = 70;
    return t;
}

/* ============================================================================
 * Utility Tests
 * ============================================================================ */

TEST(utils_iequals) {
    assert_true(utils::iequals("Song A", "song a"), "Case should be ignored");
    assert_true(utils::iequals("SONG", "song"), "Upper vs lower");
    assert_true(!utils::iequals("Song A", "Song A "), "Trailing space is significant");
    assert_true(!utils::iequals("Song", "Songs"), "Prefix is not a match");
}

TEST(utils_parse_index) {
    assert_true(utils::parse_index("1") == size_t(1), "Plain digit");
    assert_true(utils::parse_index(" 2 \n") == size_t(2), "Whitespace is trimmed");
    assert_true(!utils::parse_index("x"), "Letters rejected");
    assert_true(!utils::parse_index("1x"), "Trailing garbage rejected");
    assert_true(!utils::parse_index("-1"), "Sign rejected");
    assert_true(!utils::parse_index(""), "Empty rejected");
}

TEST(utils_parse_int32) {
    assert_true(utils::parse_int32("5") == 5, "Plain value");
    assert_true(utils::parse_int32("-70") == -70, "Negative value");
    assert_true(utils::parse_int32("2147483647") == 2147483647, "Largest int");
    assert_true(!utils::parse_int32("2147483648"), "One past the largest int rejected");
    assert_true(!utils::parse_int32("4294967301"), "Value that would wrap to 5 rejected");
    assert_true(!utils::parse_int32("99999999999999999999"), "Overflowing long long rejected");
    assert_true(!utils::parse_int32("5x"), "Trailing garbage rejected");
}

/* ============================================================================
 * NameResolver Tests
 * ============================================================================ */

TEST(resolver_not_found) {
    NameResolver resolver;
    auto result = resolver.resolve(abc_catalog(), "Missing Song");

    assert_true(result.status == ResolveStatus::NotFound, "Unknown name should be NotFound");
    assert_equal(result.query, "Missing Song", "Query name is kept for reporting");
    assert_true(!result.track.has_value(), "No track on NotFound");
}

TEST(resolver_single_match_case_insensitive) {
    NameResolver resolver;
    auto result = resolver.resolve(abc_catalog(), "sOnG b");

    assert_true(result.resolved(), "Single match should resolve directly");
    assert_equal(result.track->track_id, "2", "Resolved to Song B");
    assert_true(result.candidates.empty(), "No candidates when resolved directly");
}

TEST(resolver_no_partial_match) {
    NameResolver resolver;
    auto result = resolver.resolve(abc_catalog(), "Song");
    assert_true(result.status == ResolveStatus::NotFound, "Partial names must not match");
}

TEST(resolver_ambiguous_ranked_by_popularity) {
    Catalog catalog = {
        make_track("a1", "Hello", 40),
        make_track("a2", "hello", 90),
        make_track("a3", "HELLO", 60),
        make_track("a4", "Hello", 95),
        make_track("x", "Other", 99),
    };

    NameResolver resolver;
    auto result = resolver.resolve(catalog, "Hello");

    assert_true(result.status == ResolveStatus::Ambiguous, "Several matches are ambiguous");
    assert_true(result.candidates.size() == 3, "Truncated to top 3");
    assert_equal(result.candidates[0].track_id, "a4", "Most popular first");
    assert_equal(result.candidates[1].track_id, "a2", "Second most popular");
    assert_equal(result.candidates[2].track_id, "a3", "Third most popular");
}

TEST(resolver_ambiguous_ties_keep_catalog_order) {
    Catalog catalog = {
        make_track("t1", "Echo", 50),
        make_track("t2", "Echo", 70),
        make_track("t3", "Echo", 50),
        make_track("t4", "Echo", 50),
    };

    NameResolver resolver;
    auto result = resolver.resolve(catalog, "echo");

    assert_true(result.candidates.size() == 3, "Truncated to top 3");
    assert_equal(result.candidates[0].track_id, "t2", "Highest popularity first");
    assert_equal(result.candidates[1].track_id, "t1", "Tie keeps catalog order");
    assert_equal(result.candidates[2].track_id, "t3", "Tie keeps catalog order");
}

TEST(resolver_select_valid) {
    // Disambiguation scenario: Song B (95) ranks above Song A (85)
    Track a = make_track("1", "Song", 85);
    Track b = make_track("2", "Song", 95);
    b.artists = "Artist B";

    NameResolver resolver;
    auto ambiguous = resolver.resolve({a, b}, "song");
    assert_true(ambiguous.status == ResolveStatus::Ambiguous, "Two matches are ambiguous");

    auto first = resolver.select(ambiguous, "1");
    assert_true(first.resolved(), "Selection 1 resolves");
    assert_equal(first.track->track_id, "2", "Selection 1 is the most popular");

    auto second = resolver.select(ambiguous, 2);
    assert_true(second.resolved(), "Selection 2 resolves");
    assert_equal(second.track->track_id, "1", "Selection 2 is the second candidate");
}

TEST(resolver_select_invalid) {
    Track a = make_track("1", "Song", 85);
    Track b = make_track("2", "Song", 95);

    NameResolver resolver;
    auto ambiguous = resolver.resolve({a, b}, "Song");

    auto out_of_range = resolver.select(ambiguous, "3");
    assert_true(out_of_range.status == ResolveStatus::InvalidSelection, "3 is out of range for 2 candidates");
    assert_true(!out_of_range.track.has_value(), "No track on invalid selection");
    assert_equal(out_of_range.selection, "3", "Offending token is reported");

    auto not_numeric = resolver.select(ambiguous, "x");
    assert_true(not_numeric.status == ResolveStatus::InvalidSelection, "Non-numeric is invalid");
    assert_equal(not_numeric.selection, "x", "Offending token is reported");

    auto zero = resolver.select(ambiguous, "0");
    assert_true(zero.status == ResolveStatus::InvalidSelection, "Selection is 1-based");

    auto empty = resolver.select(ambiguous, "");
    assert_true(empty.status == ResolveStatus::InvalidSelection, "Empty input is invalid");
}

TEST(resolver_select_bounds_use_truncated_list) {
    Catalog catalog;
    for (int i = 0; i < 5; ++i) {
        catalog.push_back(make_track("d" + std::to_string(i), "Dup", 50 + i));
    }

    NameResolver resolver;
    auto ambiguous = resolver.resolve(catalog, "Dup");
    assert_true(ambiguous.candidates.size() == 3, "Five matches truncated to three");

    auto third = resolver.select(ambiguous, "3");
    assert_true(third.resolved(), "Selection 3 is the last offered candidate");
    assert_equal(third.track->track_id, "d2", "Third most popular");

    auto fourth = resolver.select(ambiguous, "4");
    assert_true(fourth.status == ResolveStatus::InvalidSelection,
        "Selection 4 exists in the catalog but was not offered");
}

TEST(resolver_custom_candidate_count) {
    Catalog catalog;
    for (int i = 0; i < 6; ++i) {
        catalog.push_back(make_track("c" + std::to_string(i), "Same", i * 10));
    }

    NameResolver resolver(5);
    auto result = resolver.resolve(catalog, "Same");
    assert_true(result.candidates.size() == 5, "Candidate count is configurable");
    assert_equal(result.candidates[0].track_id, "c5", "Most popular first");
}

TEST(resolver_select_requires_ambiguous) {
    NameResolver resolver;
    auto resolved = resolver.resolve(abc_catalog(), "Song A");
    auto result = resolver.select(resolved, 1);
    assert_true(result.status == ResolveStatus::InvalidSelection,
        "Selecting on a non-ambiguous result is rejected");
}

/* ============================================================================
 * SimilarityFilter Tests
 * ============================================================================ */

TEST(similarity_end_to_end_scenario) {
    Catalog catalog = abc_catalog();
    SimilarityFilter filter(tight_thresholds());

    auto similar = filter.find_similar(catalog, catalog[0]);

    assert_true(similar.size() == 1, "Only Song B qualifies");
    assert_equal(similar[0].track_name, "Song B", "Song B is similar to Song A");
}

TEST(similarity_excludes_self) {
    Catalog catalog = abc_catalog();
    catalog[0].popularity = 99;  // Reference would pass every predicate

    SimilarityFilter filter(tight_thresholds());
    auto similar = filter.find_similar(catalog, catalog[0]);

    for (const auto& track : similar) {
        assert_true(track.track_id != catalog[0].track_id, "Reference must not be its own neighbor");
    }
    assert_true(!filter.is_similar(catalog[0], catalog[0]), "is_similar rejects same id");
}

TEST(similarity_same_name_different_id_is_not_self) {
    Track reference = make_track("1", "Twin", 90);
    Track twin = make_track("2", "Twin", 90);

    SimilarityFilter filter;
    auto similar = filter.find_similar({reference, twin}, reference);
    assert_true(similar.size() == 1, "Distinct id with the same name may qualify");
    assert_equal(similar[0].track_id, "2", "Twin track qualifies");
}

TEST(similarity_conjunctive_tempo) {
    Track reference = make_track("1", "Ref", 80, 0.80f, 0.90f, 120.0f, 0.70f);
    Track fast = make_track("2", "Fast", 90, 0.80f, 0.90f, 200.0f, 0.70f);

    SimilarityFilter filter;  // tempo_tol = 50
    assert_true(!filter.is_similar(reference, fast), "Tempo delta 80 > 50 excludes the track");
    assert_true(filter.find_similar({reference, fast}, reference).empty(), "No results");
}

TEST(similarity_each_predicate_excludes) {
    Track reference = make_track("r", "Ref", 80, 0.50f, 0.50f, 100.0f, 0.50f);
    SimilarityFilter filter;

    Track dance = make_track("d", "Dance", 90, 0.75f, 0.50f, 100.0f, 0.50f);
    Track energy = make_track("e", "Energy", 90, 0.50f, 0.25f, 100.0f, 0.50f);
    Track valence = make_track("v", "Valence", 90, 0.50f, 0.50f, 100.0f, 0.75f);
    Track unpopular = make_track("p", "Unpopular", 70, 0.50f, 0.50f, 100.0f, 0.50f);
    Track ok = make_track("o", "Ok", 71, 0.50f, 0.50f, 100.0f, 0.50f);

    assert_true(!filter.is_similar(reference, dance), "Danceability outside tolerance");
    assert_true(!filter.is_similar(reference, energy), "Energy outside tolerance");
    assert_true(!filter.is_similar(reference, valence), "Valence outside tolerance");
    assert_true(!filter.is_similar(reference, unpopular), "Popularity must be strictly greater");
    assert_true(filter.is_similar(reference, ok), "All predicates hold");
}

TEST(similarity_tolerance_is_inclusive) {
    SimilarityThresholds t;
    t.danceability_tol = 0.25f;
    t.energy_tol = 0.25f;
    t.tempo_tol = 50.0f;
    t.valence_tol = 0.25f;
    t.popularity_min = 0;
    SimilarityFilter filter(t);

    // All deltas are exactly representable and equal to the tolerance
    Track reference = make_track("r", "Ref", 10, 0.50f, 0.50f, 120.0f, 0.50f);
    Track edge = make_track("e", "Edge", 10, 0.75f, 0.25f, 170.0f, 0.75f);

    assert_true(filter.is_similar(reference, edge), "Delta equal to tolerance qualifies");
}

TEST(similarity_dedup_first_name_wins) {
    Track reference = make_track("r", "Ref", 80);
    Catalog catalog = {
        reference,
        make_track("x1", "Same Name", 75),
        make_track("x2", "Same Name", 99),
        make_track("y", "Other", 80),
        make_track("x3", "same name", 90),
    };

    SimilarityFilter filter;
    auto similar = filter.find_similar(catalog, reference);

    assert_true(similar.size() == 3, "Exact-name duplicates collapse, case variants do not");

    std::unordered_set<std::string> names;
    for (const auto& track : similar) {
        assert_true(names.insert(track.track_name).second, "Names are unique");
    }

    bool kept_first = false;
    for (const auto& track : similar) {
        if (track.track_name == "Same Name") kept_first = track.track_id == "x1";
    }
    assert_true(kept_first, "First occurrence in catalog order is kept, not the most popular");
}

TEST(similarity_sorted_by_popularity) {
    Track reference = make_track("r", "Ref", 80);
    Catalog catalog = {reference};
    int pops[] = {72, 95, 81, 88, 72, 100, 79};
    for (int i = 0; i < 7; ++i) {
        catalog.push_back(make_track("n" + std::to_string(i), "Name " + std::to_string(i), pops[i]));
    }

    SimilarityFilter filter;
    auto similar = filter.find_similar(catalog, reference);

    assert_true(similar.size() == 7, "All candidates qualify");
    for (size_t i = 1; i < similar.size(); ++i) {
        assert_true(similar[i - 1].popularity >= similar[i].popularity, "Non-increasing popularity");
    }
    // Equal popularity keeps catalog order
    assert_equal(similar[5].track_id, "n0", "Stable order among ties");
    assert_equal(similar[6].track_id, "n4", "Stable order among ties");
}

TEST(similarity_top_k_truncation) {
    Track reference = make_track("r", "Ref", 80);
    Catalog catalog = {reference};
    for (int i = 0; i < 8; ++i) {
        catalog.push_back(make_track("n" + std::to_string(i), "Name " + std::to_string(i), 71 + i));
    }

    SimilarityFilter filter;
    auto top = filter.find_top_similar(catalog, reference, 5);
    assert_true(top.size() == 5, "Truncated to five");
    assert_equal(top[0].track_id, "n7", "Most popular first");
    assert_equal(top[4].track_id, "n3", "Fifth most popular last");

    auto few = filter.find_top_similar({reference, catalog[1]}, reference, 5);
    assert_true(few.size() == 1, "Fewer than five returns all");
}

TEST(similarity_empty_result) {
    Track reference = make_track("r", "Ref", 80);
    SimilarityFilter filter;

    assert_true(filter.find_similar({}, reference).empty(), "Empty catalog gives empty result");
    assert_true(filter.find_similar({reference}, reference).empty(), "Reference alone gives empty result");
}

TEST(similarity_deterministic) {
    Track reference = make_track("r", "Ref", 80);
    Catalog catalog = {reference};
    for (int i = 0; i < 10; ++i) {
        catalog.push_back(make_track("n" + std::to_string(i), "Name " + std::to_string(i % 4), 75 + (i % 3)));
    }

    SimilarityFilter filter;
    auto first = filter.find_similar(catalog, reference);
    auto second = filter.find_similar(catalog, reference);

    assert_true(first.size() == second.size(), "Same size on repeat");
    for (size_t i = 0; i < first.size(); ++i) {
        assert_equal(first[i].track_id, second[i].track_id, "Same order on repeat");
    }
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    std::cout << "======================================\n";
    std::cout << "SongGraph - Matcher Tests\n";
    std::cout << "======================================\n\n";

    std::cout << "--- Utils ---\n";
    RUN_TEST(utils_iequals);
    RUN_TEST(utils_parse_index);
    RUN_TEST(utils_parse_int32);

    std::cout << "\n--- NameResolver ---\n";
    RUN_TEST(resolver_not_found);
    RUN_TEST(resolver_single_match_case_insensitive);
    RUN_TEST(resolver_no_partial_match);
    RUN_TEST(resolver_ambiguous_ranked_by_popularity);
    RUN_TEST(resolver_ambiguous_ties_keep_catalog_order);
    RUN_TEST(resolver_select_valid);
    RUN_TEST(resolver_select_invalid);
    RUN_TEST(resolver_select_bounds_use_truncated_list);
    RUN_TEST(resolver_custom_candidate_count);
    RUN_TEST(resolver_select_requires_ambiguous);

    std::cout << "\n--- SimilarityFilter ---\n";
    RUN_TEST(similarity_end_to_end_scenario);
    RUN_TEST(similarity_excludes_self);
    RUN_TEST(similarity_same_name_different_id_is_not_self);
    RUN_TEST(similarity_conjunctive_tempo);
    RUN_TEST(similarity_each_predicate_excludes);
    RUN_TEST(similarity_tolerance_is_inclusive);
    RUN_TEST(similarity_dedup_first_name_wins);
    RUN_TEST(similarity_sorted_by_popularity);
    RUN_TEST(similarity_top_k_truncation);
    RUN_TEST(similarity_empty_result);
    RUN_TEST(similarity_deterministic);

    std::cout << "\n======================================\n";
    if (failed_tests == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    } else {
        std::cout << failed_tests << " test(s) failed.\n";
        return 1;
    }
}
