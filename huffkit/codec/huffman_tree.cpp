/*
 * huffman_tree.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Huffman tree model, greedy construction and serialization

**************************************************/

#include "huffman_tree.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <vector>

#include <spdlog/spdlog.h>

#include "huffkit/codec/config.hpp"
#include "huffkit/codec/huffman_error.hpp"

namespace huffkit::codec {

/* ------------------------ HuffmanNode ------------------------ */

auto HuffmanNode::makeLeaf(Symbol symbol, u64 frequency)
    -> std::unique_ptr<HuffmanNode> {
    return std::make_unique<HuffmanNode>(
        HuffmanNode{LeafNode{symbol, frequency}});
}

auto HuffmanNode::makeInternal(std::unique_ptr<HuffmanNode> left,
                               std::unique_ptr<HuffmanNode> right)
    -> std::unique_ptr<HuffmanNode> {
    u64 frequency = left->frequency() + right->frequency();
    return std::make_unique<HuffmanNode>(HuffmanNode{
        InternalNode{frequency, std::move(left), std::move(right)}});
}

auto HuffmanNode::frequency() const noexcept -> u64 {
    return std::visit([](const auto& node) { return node.frequency; }, value);
}

/* ------------------------ HuffmanTree ------------------------ */

HuffmanTree::HuffmanTree(std::unique_ptr<HuffmanNode> root)
    : root_(std::move(root)) {}

auto HuffmanTree::stats() const -> TreeStats {
    TreeStats result;
    if (!root_) {
        return result;
    }

    usize depthSum = 0;
    std::function<void(const HuffmanNode*, usize)> walk =
        [&](const HuffmanNode* node, usize depth) {
            if (node->isLeaf()) {
                ++result.leafCount;
                depthSum += depth;
                result.height = std::max(result.height, depth);
                return;
            }
            ++result.internalCount;
            walk(node->internal().left.get(), depth + 1);
            walk(node->internal().right.get(), depth + 1);
        };
    walk(root_.get(), 0);

    if (root_->isLeaf()) {
        // A lone leaf still gets a one-bit code
        result.averageCodeLength = 1.0;
    } else {
        result.averageCodeLength = static_cast<f64>(depthSum) /
                                   static_cast<f64>(result.leafCount);
    }
    return result;
}

auto HuffmanTree::validate() const -> bool {
    if (!root_) {
        return true;
    }

    std::array<bool, kAlphabetSize> seen{};
    std::function<bool(const HuffmanNode*)> check =
        [&](const HuffmanNode* node) -> bool {
        if (node == nullptr) {
            return false;
        }
        if (node->isLeaf()) {
            Symbol symbol = node->leaf().symbol;
            if (seen[symbol]) {
                return false;
            }
            seen[symbol] = true;
            return true;
        }
        const auto& inner = node->internal();
        if (!inner.left || !inner.right) {
            return false;
        }
        if (inner.frequency !=
            inner.left->frequency() + inner.right->frequency()) {
            return false;
        }
        return check(inner.left.get()) && check(inner.right.get());
    };
    return check(root_.get());
}

/* ------------------------ buildHuffmanTree ------------------------ */

namespace {

struct HeapEntry {
    u64 frequency;
    u64 sequence;
    std::unique_ptr<HuffmanNode> node;
};

// Inverted so the std heap algorithms keep the smallest entry at the front
struct CompareEntry {
    bool operator()(const HeapEntry& a, const HeapEntry& b) const noexcept {
        if (a.frequency != b.frequency) {
            return a.frequency > b.frequency;
        }
        return a.sequence > b.sequence;
    }
};

auto popMin(std::vector<HeapEntry>& heap) -> HeapEntry {
    std::pop_heap(heap.begin(), heap.end(), CompareEntry{});
    HeapEntry entry = std::move(heap.back());
    heap.pop_back();
    return entry;
}

}  // namespace

auto buildHuffmanTree(const FrequencyTable& frequencies) -> HuffmanTree {
    if (frequencies.empty()) {
        THROW_INVALID_INPUT(
            "Frequency table is empty. Cannot build a Huffman tree.");
    }

    std::vector<HeapEntry> heap;
    heap.reserve(frequencies.size());
    u64 sequence = 0;
    for (const auto& [symbol, count] : frequencies.entries()) {
        heap.push_back({count, sequence++, HuffmanNode::makeLeaf(symbol, count)});
    }
    std::make_heap(heap.begin(), heap.end(), CompareEntry{});

    while (heap.size() > 1) {
        HeapEntry left = popMin(heap);
        HeapEntry right = popMin(heap);

        auto merged =
            HuffmanNode::makeInternal(std::move(left.node), std::move(right.node));
        u64 frequency = merged->frequency();
        heap.push_back({frequency, sequence++, std::move(merged)});
        std::push_heap(heap.begin(), heap.end(), CompareEntry{});
    }

    spdlog::debug("Built Huffman tree over {} distinct symbols ({} total)",
                  frequencies.size(), frequencies.totalCount());
    return HuffmanTree(std::move(heap.front().node));
}

/* ------------------------ serializeTree ------------------------ */

auto serializeTree(const HuffmanTree& tree) -> SerializedTree {
    SerializedTree serialized;
    if (tree.empty()) {
        return serialized;
    }

    std::function<void(const HuffmanNode*)> serializeHelper =
        [&](const HuffmanNode* node) {
            if (node->isLeaf()) {
                serialized.push_back(kLeafTag);
                serialized.push_back(node->leaf().symbol);
                return;
            }
            serialized.push_back(kInternalTag);
            serializeHelper(node->internal().left.get());
            serializeHelper(node->internal().right.get());
        };

    serializeHelper(tree.root());
    return serialized;
}

/* ------------------------ deserializeTree ------------------------ */

namespace {

class TreeReader {
public:
    explicit TreeReader(std::span<const u8> bytes) : bytes_(bytes) {}

    auto readNode(usize depth) -> std::unique_ptr<HuffmanNode> {
        // A tree over at most 256 leaves is never deeper than 255 edges
        if (depth >= kAlphabetSize) {
            THROW_MALFORMED_PAYLOAD(
                "Invalid serialized tree: nesting deeper than any byte "
                "alphabet allows");
        }
        if (index_ >= bytes_.size()) {
            THROW_MALFORMED_PAYLOAD(
                "Invalid serialized tree: unexpected end of data at offset ",
                index_);
        }

        u8 tag = bytes_[index_++];
        if (tag == kLeafTag) {
            if (index_ >= bytes_.size()) {
                THROW_MALFORMED_PAYLOAD(
                    "Invalid serialized tree: leaf without a symbol byte");
            }
            Symbol symbol = bytes_[index_++];
            if (seen_[symbol]) {
                THROW_MALFORMED_PAYLOAD(
                    "Invalid serialized tree: symbol ",
                    static_cast<unsigned>(symbol), " appears twice");
            }
            seen_[symbol] = true;
            return HuffmanNode::makeLeaf(symbol, 0);
        }
        if (tag == kInternalTag) {
            auto left = readNode(depth + 1);
            auto right = readNode(depth + 1);
            return HuffmanNode::makeInternal(std::move(left), std::move(right));
        }

        THROW_MALFORMED_PAYLOAD("Invalid serialized tree: unknown tag ",
                                static_cast<unsigned>(tag), " at offset ",
                                index_ - 1);
    }

    [[nodiscard]] auto consumed() const noexcept -> usize { return index_; }

private:
    std::span<const u8> bytes_;
    usize index_ = 0;
    std::array<bool, kAlphabetSize> seen_{};
};

}  // namespace

auto deserializeTree(std::span<const u8> serialized) -> HuffmanTree {
    if (serialized.empty()) {
        return {};
    }

    TreeReader reader(serialized);
    auto root = reader.readNode(0);
    if (reader.consumed() != serialized.size()) {
        spdlog::error("Serialized tree has {} trailing bytes",
                      serialized.size() - reader.consumed());
        THROW_MALFORMED_PAYLOAD("Invalid serialized tree: ",
                                serialized.size() - reader.consumed(),
                                " trailing bytes");
    }
    return HuffmanTree(std::move(root));
}

}  // namespace huffkit::codec
