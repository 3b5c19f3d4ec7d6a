/*
 * huffman_tree.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Huffman tree model, greedy construction and serialization

**************************************************/

#ifndef HUFFKIT_CODEC_HUFFMAN_TREE_HPP
#define HUFFKIT_CODEC_HUFFMAN_TREE_HPP

#include <memory>
#include <span>
#include <variant>

#include "huffkit/codec/frequency.hpp"
#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

struct HuffmanNode;

struct LeafNode {
    Symbol symbol;
    u64 frequency;
};

struct InternalNode {
    u64 frequency;
    std::unique_ptr<HuffmanNode> left;
    std::unique_ptr<HuffmanNode> right;
};

/**
 * @brief A node of a Huffman tree: either a leaf or an internal node that
 * exclusively owns both of its children.
 */
struct HuffmanNode {
    std::variant<LeafNode, InternalNode> value;

    static auto makeLeaf(Symbol symbol, u64 frequency)
        -> std::unique_ptr<HuffmanNode>;

    /**
     * @brief Joins two subtrees. The new node's frequency is the sum of the
     * children's frequencies.
     */
    static auto makeInternal(std::unique_ptr<HuffmanNode> left,
                             std::unique_ptr<HuffmanNode> right)
        -> std::unique_ptr<HuffmanNode>;

    [[nodiscard]] auto isLeaf() const noexcept -> bool {
        return std::holds_alternative<LeafNode>(value);
    }

    [[nodiscard]] auto frequency() const noexcept -> u64;

    [[nodiscard]] auto leaf() const -> const LeafNode& {
        return std::get<LeafNode>(value);
    }

    [[nodiscard]] auto internal() const -> const InternalNode& {
        return std::get<InternalNode>(value);
    }
};

struct TreeStats {
    usize height = 0;         ///< Edges on the longest root-to-leaf path.
    usize leafCount = 0;
    usize internalCount = 0;
    f64 averageCodeLength = 0.0;  ///< Unweighted mean over leaves.
};

/**
 * @brief Owner of a complete Huffman tree.
 *
 * A default-constructed tree is empty, which is the "no tree" state produced
 * for empty input. A tree whose root is a leaf describes an input made of a
 * single distinct symbol.
 */
class HuffmanTree {
public:
    HuffmanTree() = default;
    explicit HuffmanTree(std::unique_ptr<HuffmanNode> root);

    HuffmanTree(HuffmanTree&&) noexcept = default;
    auto operator=(HuffmanTree&&) noexcept -> HuffmanTree& = default;
    HuffmanTree(const HuffmanTree&) = delete;
    auto operator=(const HuffmanTree&) -> HuffmanTree& = delete;

    [[nodiscard]] auto root() const noexcept -> const HuffmanNode* {
        return root_.get();
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return !root_; }

    /// True when the tree has no internal nodes.
    [[nodiscard]] auto isSingleLeaf() const noexcept -> bool {
        return root_ && root_->isLeaf();
    }

    [[nodiscard]] auto stats() const -> TreeStats;

    /**
     * @brief Checks the structural invariants: every internal frequency is
     * the sum of its children and no symbol has two leaves.
     */
    [[nodiscard]] auto validate() const -> bool;

private:
    std::unique_ptr<HuffmanNode> root_;
};

/**
 * @brief Builds the Huffman tree of a frequency table by greedy merging.
 *
 * Nodes are ordered by (frequency, sequence). Leaves get sequence numbers in
 * ascending symbol order, merged nodes get the next free number. The first
 * node extracted becomes the left child, so equal inputs always give
 * identical trees.
 *
 * @param frequencies A non-empty frequency table.
 * @return The tree; a lone leaf when the table has one symbol.
 * @throws InvalidInputException if the table is empty.
 */
auto buildHuffmanTree(const FrequencyTable& frequencies) -> HuffmanTree;

/**
 * @brief Serializes a tree as pre-order tagged bytes.
 *
 * An internal node is written as its tag followed by its left and right
 * subtrees; a leaf is written as its tag followed by the symbol. An empty
 * tree serializes to an empty sequence.
 */
auto serializeTree(const HuffmanTree& tree) -> SerializedTree;

/**
 * @brief Rebuilds a tree written by serializeTree.
 *
 * Leaf frequencies are not stored and come back as zero.
 *
 * @throws MalformedPayloadException on unknown tags, truncation, trailing
 * bytes, repeated symbols or a structure no byte alphabet can produce.
 */
auto deserializeTree(std::span<const u8> serialized) -> HuffmanTree;

}  // namespace huffkit::codec

#endif
