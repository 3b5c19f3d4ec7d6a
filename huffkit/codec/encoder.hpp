/*
 * encoder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Huffman encoding pass

**************************************************/

#ifndef HUFFKIT_CODEC_ENCODER_HPP
#define HUFFKIT_CODEC_ENCODER_HPP

#include <span>

#include "huffkit/codec/bit_packer.hpp"
#include "huffkit/codec/codebook.hpp"
#include "huffkit/codec/config.hpp"
#include "huffkit/codec/huffman_tree.hpp"
#include "huffkit/codec/stats.hpp"
#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

/**
 * @brief Everything one encode call produces. The tree and codebook belong
 * to this input only.
 */
struct EncodeResult {
    CompressedPayload payload;
    HuffmanTree tree;  ///< Empty for empty input.
    Codebook codebook;
    CompressionStats stats;
};

/**
 * @brief Encodes a symbol sequence with a Huffman code built for it.
 *
 * Empty input returns an empty payload and an empty tree without touching
 * the tree builder.
 *
 * @param symbols The input.
 * @param options verifyRoundTrip decodes the result and compares it with the
 * input; measureTime fills stats.elapsed.
 * @throws MalformedPayloadException if round-trip verification fails.
 */
auto encode(std::span<const Symbol> symbols, const CodecOptions& options = {})
    -> EncodeResult;

/**
 * @brief Maps each symbol through an existing codebook and packs the bits.
 *
 * @throws UnsupportedSymbolException if a symbol has no code.
 */
auto encodeWithCodebook(std::span<const Symbol> symbols,
                        const Codebook& codebook) -> CompressedPayload;

}  // namespace huffkit::codec

#endif
