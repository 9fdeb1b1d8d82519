#include <gtest/gtest.h>

#include "mnemonic.hpp"

#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, '-')) out.push_back(part);
    return out;
}

} // namespace

TEST(Mnemonic, VocabularyHas105DistinctWords) {
    ASSERT_EQ(relaycp::mnemonic_vocabulary_size(), 105u);
    std::set<std::string> words;
    for (size_t i = 0; i < relaycp::mnemonic_vocabulary_size(); ++i) {
        words.insert(relaycp::mnemonic_word(i));
    }
    EXPECT_EQ(words.size(), 105u);
    EXPECT_THROW(relaycp::mnemonic_word(105), std::out_of_range);
}

TEST(Mnemonic, KnownLabels) {
    EXPECT_EQ(relaycp::make_mnemonic("a"), "trophy-anchor-apple");
    EXPECT_EQ(relaycp::make_mnemonic("abc1"), "skull-trophy-helmet");
    EXPECT_EQ(relaycp::make_mnemonic("peer-1"), "droplet-bomb-bicycle");
    EXPECT_EQ(relaycp::make_mnemonic("x"), "calculator-apple-anchor");
    EXPECT_EQ(relaycp::make_mnemonic("alice"), "splotch-helmet-compass");
}

TEST(Mnemonic, NonAsciiIdsHashPerCodePoint) {
    EXPECT_EQ(relaycp::make_mnemonic("\xC3\xA9"), "cloud-atom-anchor");            // U+00E9
    EXPECT_EQ(relaycp::make_mnemonic("jos\xC3\xA9-1"), "gem-football-brain");
    EXPECT_EQ(relaycp::make_mnemonic("\xE6\x97\xA5\xE6\x9C\xAC"), "ship-paw-paintbrush");
}

TEST(Mnemonic, MalformedUtf8CountsAsReplacementCharacters) {
    EXPECT_EQ(relaycp::make_mnemonic("\xFF" "a"), "rocket-crow-pepper");
    // Encoded surrogate: three bytes, three U+FFFD.
    EXPECT_EQ(relaycp::make_mnemonic("\xED\xA0\x80"), "astronaut-flask-rook");
    EXPECT_EQ(relaycp::make_mnemonic("\xED\xA0\x80"),
              relaycp::make_mnemonic("\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD"));
}

TEST(Mnemonic, DeterministicThreeDistinctWords) {
    for (int i = 0; i < 500; ++i) {
        std::string id = "peer-" + std::to_string(i * 7919);
        std::string label = relaycp::make_mnemonic(id);
        EXPECT_EQ(label, relaycp::make_mnemonic(id));

        auto parts = split(label);
        ASSERT_EQ(parts.size(), 3u) << label;
        EXPECT_NE(parts[0], parts[1]) << id;
        EXPECT_NE(parts[0], parts[2]) << id;
    }
}
