/*
 * decoder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Huffman decoding pass

**************************************************/

#ifndef HUFFKIT_CODEC_DECODER_HPP
#define HUFFKIT_CODEC_DECODER_HPP

#include <optional>
#include <vector>

#include "huffkit/codec/bit_packer.hpp"
#include "huffkit/codec/huffman_tree.hpp"
#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

/**
 * @brief Walks the tree bit by bit to rebuild the original symbols.
 *
 * Every valid bit is consumed; each leaf reached emits its symbol and the
 * walk restarts at the root. Under a single-leaf tree each kLeftBit is one
 * symbol.
 *
 * @param payload The packed code bits.
 * @param tree The tree the payload was encoded with.
 * @param expectedSymbols When set, the number of symbols the caller expects.
 * @return The decoded symbols.
 * @throws MalformedPayloadException if the bits stop between leaves, do not
 * fit the tree, or disagree with expectedSymbols.
 */
auto decode(const CompressedPayload& payload, const HuffmanTree& tree,
            std::optional<u64> expectedSymbols = std::nullopt)
    -> std::vector<Symbol>;

}  // namespace huffkit::codec

#endif
