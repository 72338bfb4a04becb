#include <gtest/gtest.h>
#include "search/rabin_karp.h"
#include <string>
#include <vector>

using namespace mobilitykit;

TEST(RabinKarpTest, test_single_match) {
    auto hits = rabin_karp_search("New York City Taxi Data", "Taxi");
    EXPECT_EQ(hits, (std::vector<size_t>{14}));
}

TEST(RabinKarpTest, test_overlapping_matches) {
    EXPECT_EQ(rabin_karp_search("aaaa", "aa"), (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(rabin_karp_search("abcabcab", "abc"), (std::vector<size_t>{0, 3}));
}

TEST(RabinKarpTest, test_degenerate_inputs_are_empty) {
    EXPECT_TRUE(rabin_karp_search("New York", "").empty());
    EXPECT_TRUE(rabin_karp_search("", "Taxi").empty());
    EXPECT_TRUE(rabin_karp_search("Taxi", "Taxi Data").empty());
}

TEST(RabinKarpTest, test_whole_text_match) {
    EXPECT_EQ(rabin_karp_search("JFK", "JFK"), (std::vector<size_t>{0}));
}

TEST(RabinKarpTest, test_hash_collisions_are_verified) {
    // With modulus 101 many distinct windows share a hash; only true
    // matches may be reported.
    std::string text;
    for (int c = 0; c < 256; ++c) {
        text.push_back(static_cast<char>(c));
        text.push_back('z');
    }
    for (size_t i = 0; i + 2 <= text.size(); ++i) {
        std::string pattern = text.substr(i, 2);
        for (size_t hit : rabin_karp_search(text, pattern)) {
            EXPECT_EQ(text.compare(hit, 2, pattern), 0);
        }
    }
}

TEST(RabinKarpTest, test_high_bit_characters) {
    std::string text = "caf\xC3\xA9 caf\xC3\xA9";
    EXPECT_EQ(rabin_karp_search(text, "\xC3\xA9"), (std::vector<size_t>{3, 9}));
}

TEST(RabinKarpTest, test_contains) {
    EXPECT_TRUE(rabin_karp_contains("Manhattan Bridge", "Bridge"));
    EXPECT_FALSE(rabin_karp_contains("Manhattan Bridge", "Tunnel"));
}
