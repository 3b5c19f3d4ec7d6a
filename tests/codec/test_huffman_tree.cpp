#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "huffkit/codec/frequency.hpp"
#include "huffkit/codec/huffman.hpp"
#include "huffkit/codec/huffman_error.hpp"
#include "huffkit/codec/huffman_tree.hpp"

using namespace huffkit::codec;

class HuffmanTreeTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    static auto treeOf(std::string_view text) -> HuffmanTree {
        return buildHuffmanTree(countFrequencies(asSymbols(text)));
    }

    // Leaf frequencies keyed by symbol, collected by walking the tree
    static void collectLeaves(const HuffmanNode* node,
                              std::vector<FrequencyTable::Entry>& out) {
        if (node->isLeaf()) {
            out.emplace_back(node->leaf().symbol, node->leaf().frequency);
            return;
        }
        collectLeaves(node->internal().left.get(), out);
        collectLeaves(node->internal().right.get(), out);
    }
};

TEST_F(HuffmanTreeTest, EmptyTableIsInvalidInput) {
    EXPECT_THROW(buildHuffmanTree(FrequencyTable{}), InvalidInputException);
    try {
        buildHuffmanTree(FrequencyTable{});
        FAIL() << "expected an exception";
    } catch (const HuffmanException& e) {
        EXPECT_EQ(e.kind(), HuffmanErrorKind::InvalidInput);
        EXPECT_THAT(e.getMessage(), ::testing::HasSubstr("empty"));
    }
}

TEST_F(HuffmanTreeTest, ErrorsRecordThrowSite) {
    try {
        buildHuffmanTree(FrequencyTable{});
        FAIL() << "expected an exception";
    } catch (const huffkit::error::Exception& e) {
        EXPECT_THAT(e.getFile(), ::testing::HasSubstr("huffman_tree.cpp"));
        EXPECT_GT(e.getLine(), 0);
        EXPECT_EQ(e.getFunction(), "buildHuffmanTree");
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
        EXPECT_THAT(std::string(e.what()),
                    ::testing::HasSubstr(e.getMessage()));
    }
}

TEST_F(HuffmanTreeTest, SingleSymbolGivesLoneLeaf) {
    HuffmanTree tree = treeOf("AAAA");
    ASSERT_FALSE(tree.empty());
    EXPECT_TRUE(tree.isSingleLeaf());
    EXPECT_EQ(tree.root()->leaf().symbol, 'A');
    EXPECT_EQ(tree.root()->frequency(), 4u);

    TreeStats stats = tree.stats();
    EXPECT_EQ(stats.height, 0u);
    EXPECT_EQ(stats.leafCount, 1u);
    EXPECT_EQ(stats.internalCount, 0u);
    EXPECT_DOUBLE_EQ(stats.averageCodeLength, 1.0);
}

TEST_F(HuffmanTreeTest, TiesBreakByInsertionOrder) {
    // B and C (1 each) merge first; A (2) then ties with that merged node
    // and wins because it was seeded earlier.
    HuffmanTree tree = treeOf("ABAC");
    const HuffmanNode* root = tree.root();
    ASSERT_FALSE(root->isLeaf());
    EXPECT_EQ(root->frequency(), 4u);

    const auto& top = root->internal();
    ASSERT_TRUE(top.left->isLeaf());
    EXPECT_EQ(top.left->leaf().symbol, 'A');

    ASSERT_FALSE(top.right->isLeaf());
    const auto& merged = top.right->internal();
    EXPECT_EQ(merged.left->leaf().symbol, 'B');
    EXPECT_EQ(merged.right->leaf().symbol, 'C');
}

TEST_F(HuffmanTreeTest, ConstructionIsReproducible) {
    const std::string text = "the quick brown fox jumps over the lazy dog";
    EXPECT_EQ(serializeTree(treeOf(text)), serializeTree(treeOf(text)));
}

TEST_F(HuffmanTreeTest, FrequencyInvariantsHold) {
    const std::string text = "mississippi river banks";
    FrequencyTable table = countFrequencies(asSymbols(text));
    HuffmanTree tree = buildHuffmanTree(table);
    EXPECT_TRUE(tree.validate());
    EXPECT_EQ(tree.root()->frequency(), text.size());

    std::vector<FrequencyTable::Entry> leaves;
    collectLeaves(tree.root(), leaves);
    EXPECT_THAT(leaves, ::testing::UnorderedElementsAreArray(table.entries()));
}

TEST_F(HuffmanTreeTest, ValidateRejectsWrongInternalFrequency) {
    auto root = HuffmanNode::makeInternal(HuffmanNode::makeLeaf('a', 1),
                                          HuffmanNode::makeLeaf('b', 2));
    std::get<InternalNode>(root->value).frequency = 7;
    EXPECT_FALSE(HuffmanTree(std::move(root)).validate());
}

TEST_F(HuffmanTreeTest, ValidateRejectsDuplicateSymbol) {
    auto root = HuffmanNode::makeInternal(HuffmanNode::makeLeaf('a', 1),
                                          HuffmanNode::makeLeaf('a', 1));
    EXPECT_FALSE(HuffmanTree(std::move(root)).validate());
}

TEST_F(HuffmanTreeTest, StatsDescribeShape) {
    TreeStats stats = treeOf("ABAC").stats();
    EXPECT_EQ(stats.height, 2u);
    EXPECT_EQ(stats.leafCount, 3u);
    EXPECT_EQ(stats.internalCount, 2u);
    EXPECT_DOUBLE_EQ(stats.averageCodeLength, 5.0 / 3.0);
}

TEST_F(HuffmanTreeTest, EmptyTreeHasNoStats) {
    HuffmanTree tree;
    EXPECT_TRUE(tree.empty());
    EXPECT_TRUE(tree.validate());
    EXPECT_EQ(tree.stats().leafCount, 0u);
}

/* ------------------------ serialization ------------------------ */

TEST_F(HuffmanTreeTest, SerializesPreOrderWithTags) {
    SerializedTree bytes = serializeTree(treeOf("ABAC"));
    SerializedTree expected = {kInternalTag, kLeafTag,     'A',
                               kInternalTag, kLeafTag,     'B',
                               kLeafTag,     'C'};
    EXPECT_EQ(bytes, expected);
}

TEST_F(HuffmanTreeTest, SerializedSizeIsThreeBytesPerLeafMinusOne) {
    FrequencyTable table;
    for (int s = 0; s < 256; ++s) {
        table.add(static_cast<Symbol>(s), static_cast<u64>(s % 17 + 1));
    }
    HuffmanTree tree = buildHuffmanTree(table);
    EXPECT_EQ(serializeTree(tree).size(), 3u * 256u - 1u);
}

TEST_F(HuffmanTreeTest, SingleLeafSerializesToTwoBytes) {
    SerializedTree bytes = serializeTree(treeOf("zzz"));
    EXPECT_EQ(bytes, (SerializedTree{kLeafTag, 'z'}));
    HuffmanTree restored = deserializeTree(bytes);
    EXPECT_TRUE(restored.isSingleLeaf());
    EXPECT_EQ(restored.root()->leaf().symbol, 'z');
}

TEST_F(HuffmanTreeTest, DeserializeRestoresStructure) {
    HuffmanTree original = treeOf("a man a plan a canal panama");
    SerializedTree bytes = serializeTree(original);
    HuffmanTree restored = deserializeTree(bytes);
    EXPECT_EQ(serializeTree(restored), bytes);
    EXPECT_EQ(restored.stats().leafCount, original.stats().leafCount);
    EXPECT_EQ(restored.stats().height, original.stats().height);
}

TEST_F(HuffmanTreeTest, EmptyBytesMeanNoTree) {
    EXPECT_TRUE(serializeTree(HuffmanTree{}).empty());
    EXPECT_TRUE(deserializeTree({}).empty());
}

TEST_F(HuffmanTreeTest, DeserializeRejectsMalformedInput) {
    // Unknown tag
    EXPECT_THROW(deserializeTree(SerializedTree{0x07}),
                 MalformedPayloadException);
    // Leaf without its symbol
    EXPECT_THROW(deserializeTree(SerializedTree{kLeafTag}),
                 MalformedPayloadException);
    // Internal node missing its right subtree
    EXPECT_THROW(deserializeTree(SerializedTree{kInternalTag, kLeafTag, 'a'}),
                 MalformedPayloadException);
    // Trailing garbage
    EXPECT_THROW(deserializeTree(SerializedTree{kLeafTag, 'a', 0x00}),
                 MalformedPayloadException);
    // Same symbol twice
    EXPECT_THROW(deserializeTree(SerializedTree{kInternalTag, kLeafTag, 'a',
                                                kLeafTag, 'a'}),
                 MalformedPayloadException);
}

TEST_F(HuffmanTreeTest, DeserializeRejectsRunawayNesting) {
    SerializedTree deep(1000, kInternalTag);
    EXPECT_THROW(deserializeTree(deep), MalformedPayloadException);
}
