// =============================================================================
// Address Tests
// =============================================================================

#include <gtest/gtest.h>
#include "credrank/address.hpp"

#include <string>
#include <unordered_set>
#include <vector>

using namespace credrank;

class AddressTest : public ::testing::Test {
protected:
    void SetUp() override {
        github = NodeAddress::from_parts({"sourcecred", "github"});
        issue = github.append("ISSUE", "repo", "42");
    }

    NodeAddress github;
    NodeAddress issue;
};

TEST_F(AddressTest, PartsRoundTrip) {
    std::vector<std::string> parts = {"a", "", "b c", "Infinity"};
    NodeAddress address = NodeAddress::from_parts(parts);
    EXPECT_EQ(address.size(), 4u);
    EXPECT_EQ(address.to_parts(), parts);
    EXPECT_EQ(NodeAddress::from_parts(address.to_parts()), address);
}

TEST_F(AddressTest, EmptyAddress) {
    NodeAddress empty = NodeAddress::empty();
    EXPECT_TRUE(empty.is_empty());
    EXPECT_EQ(empty.size(), 0u);
    EXPECT_TRUE(empty.to_parts().empty());
    EXPECT_TRUE(issue.has_prefix(empty));

    // One empty part is not the empty address
    NodeAddress single_empty = NodeAddress::from_parts({""});
    EXPECT_NE(single_empty, empty);
    EXPECT_EQ(single_empty.size(), 1u);
}

TEST_F(AddressTest, RejectsNulInPart) {
    std::string bad("a\0b", 3);
    EXPECT_THROW(NodeAddress::from_parts(std::vector<std::string>{bad}), InvalidArgumentError);
    EXPECT_THROW(github.append(bad), InvalidArgumentError);
}

TEST_F(AddressTest, AppendAndConcat) {
    EXPECT_EQ(issue.to_parts(), (std::vector<std::string>{"sourcecred", "github", "ISSUE", "repo", "42"}));

    NodeAddress suffix = NodeAddress::from_parts({"ISSUE", "repo", "42"});
    EXPECT_EQ(github.concat(suffix), issue);
    EXPECT_EQ(github.append_parts(suffix.to_parts()), issue);
    EXPECT_EQ(github.concat(NodeAddress::empty()), github);
}

TEST_F(AddressTest, PrefixIsPartWise) {
    EXPECT_TRUE(issue.has_prefix(github));
    EXPECT_TRUE(issue.has_prefix(issue));
    EXPECT_FALSE(github.has_prefix(issue));

    // "source" is a string prefix of "sourcecred" but not a part prefix
    EXPECT_FALSE(issue.has_prefix(NodeAddress::from_parts({"source"})));
}

TEST_F(AddressTest, OrderingIsLexicographicOverParts) {
    NodeAddress ab = NodeAddress::from_parts({"a", "b"});
    NodeAddress a_joined = NodeAddress::from_parts({"ab"});
    NodeAddress a = NodeAddress::from_parts({"a"});
    EXPECT_LT(a, ab);
    EXPECT_LT(ab, a_joined);
    EXPECT_FALSE(ab < ab);
}

TEST_F(AddressTest, TaggedStringRoundTrip) {
    std::string tagged = issue.to_string();
    EXPECT_EQ(tagged.front(), '\x01');
    EXPECT_EQ(NodeAddress::from_string(tagged), issue);

    EdgeAddress edge = EdgeAddress::from_parts({"x", "y"});
    EXPECT_EQ(edge.to_string(), std::string("\x02x\0y\0", 5));
    EXPECT_EQ(EdgeAddress::from_string(edge.to_string()), edge);

    // Tags keep the two spaces apart
    EXPECT_THROW(EdgeAddress::from_string(tagged), InvalidArgumentError);
    EXPECT_THROW(NodeAddress::from_string(std::string("\x01" "abc")), InvalidArgumentError);
    EXPECT_EQ(NodeAddress::from_string(std::string(1, '\x01')), NodeAddress::empty());
}

TEST_F(AddressTest, Display) {
    EXPECT_EQ(NodeAddress::from_parts({"a", "b"}).display(), "NodeAddress[\"a\",\"b\"]");
    EXPECT_EQ(EdgeAddress::empty().display(), "EdgeAddress[]");
}

TEST_F(AddressTest, HashDistinguishesParts) {
    std::unordered_set<NodeAddress> set;
    set.insert(NodeAddress::from_parts({"a", "b"}));
    set.insert(NodeAddress::from_parts({"ab"}));
    set.insert(NodeAddress::from_parts({"a", "b"}));
    EXPECT_EQ(set.size(), 2u);
}

// =============================================================================
// AddressTrie
// =============================================================================

class AddressTrieTest : public ::testing::Test {
protected:
    void SetUp() override {
        trie.add(NodeAddress::empty(), 0);
        trie.add(NodeAddress::from_parts({"a"}), 1);
        trie.add(NodeAddress::from_parts({"a", "b", "c"}), 3);
    }

    AddressTrie<NodeAddressTag, int> trie;
};

TEST_F(AddressTrieTest, GetReturnsEveryPrefixShortestFirst) {
    EXPECT_EQ(trie.get(NodeAddress::from_parts({"a", "b", "c", "d"})), (std::vector<int>{0, 1, 3}));
    EXPECT_EQ(trie.get(NodeAddress::from_parts({"a", "b"})), (std::vector<int>{0, 1}));
    EXPECT_EQ(trie.get(NodeAddress::from_parts({"z"})), (std::vector<int>{0}));
    EXPECT_EQ(trie.size(), 3u);
}

TEST_F(AddressTrieTest, GetLastReturnsLongestPrefix) {
    EXPECT_EQ(trie.get_last(NodeAddress::from_parts({"a", "b", "c"})).value_or(-1), 3);
    EXPECT_EQ(trie.get_last(NodeAddress::from_parts({"a", "x"})).value_or(-1), 1);

    AddressTrie<NodeAddressTag, int> empty;
    EXPECT_FALSE(empty.get_last(NodeAddress::from_parts({"a"})).has_value());
}

TEST_F(AddressTrieTest, DuplicatePrefixRejected) {
    EXPECT_THROW(trie.add(NodeAddress::from_parts({"a"}), 7), InvalidArgumentError);
}
