/*
 * decoder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Huffman decoding pass

**************************************************/

#include "decoder.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "huffkit/codec/config.hpp"
#include "huffkit/codec/huffman_error.hpp"

namespace huffkit::codec {

namespace {

void decodeSingleLeaf(BitReader& reader, Symbol symbol,
                      std::vector<Symbol>& out) {
    while (!reader.atEnd()) {
        u64 position = reader.totalBits() - reader.remaining();
        if (reader.readBit() != kLeftBit) {
            THROW_MALFORMED_PAYLOAD(
                "Bit ", position,
                " does not match the single-symbol code of this tree");
        }
        out.push_back(symbol);
    }
}

void decodeWalk(BitReader& reader, const HuffmanNode* root,
                std::vector<Symbol>& out) {
    const HuffmanNode* current = root;
    while (!reader.atEnd()) {
        const auto& inner = current->internal();
        current = reader.readBit() == kLeftBit ? inner.left.get()
                                               : inner.right.get();
        if (current == nullptr) {
            THROW_MALFORMED_PAYLOAD(
                "Invalid tree: traversed to a missing child");
        }
        if (current->isLeaf()) {
            out.push_back(current->leaf().symbol);
            current = root;
        }
    }

    if (current != root) {
        spdlog::error("Payload of {} bits ends inside the tree",
                      reader.totalBits());
        THROW_MALFORMED_PAYLOAD(
            "Incomplete payload: the last code stops before reaching a leaf");
    }
}

}  // namespace

auto decode(const CompressedPayload& payload, const HuffmanTree& tree,
            std::optional<u64> expectedSymbols) -> std::vector<Symbol> {
    BitReader reader(payload);

    if (reader.totalBits() == 0) {
        if (expectedSymbols.value_or(0) != 0) {
            THROW_MALFORMED_PAYLOAD("Payload is empty but ", *expectedSymbols,
                                    " symbols were expected");
        }
        return {};
    }
    if (tree.empty()) {
        THROW_MALFORMED_PAYLOAD("Payload carries ", reader.totalBits(),
                                " bits but no tree was supplied");
    }

    std::vector<Symbol> out;
    // Every symbol costs at least one bit
    out.reserve(static_cast<usize>(
        std::min(expectedSymbols.value_or(0), reader.totalBits())));

    if (tree.isSingleLeaf()) {
        decodeSingleLeaf(reader, tree.root()->leaf().symbol, out);
    } else {
        decodeWalk(reader, tree.root(), out);
    }

    if (expectedSymbols && out.size() != *expectedSymbols) {
        spdlog::error("Decoded {} symbols, expected {}", out.size(),
                      *expectedSymbols);
        THROW_MALFORMED_PAYLOAD("Decoded ", out.size(),
                                " symbols but the payload declares ",
                                *expectedSymbols);
    }

    spdlog::debug("Decoded {} bits into {} symbols", reader.totalBits(),
                  out.size());
    return out;
}

}  // namespace huffkit::codec
