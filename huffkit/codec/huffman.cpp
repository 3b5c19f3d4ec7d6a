/*
 * huffman.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Lossless Huffman compression of byte sequences

**************************************************/

#include "huffman.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "huffkit/codec/decoder.hpp"
#include "huffkit/codec/encoder.hpp"
#include "huffkit/codec/huffman_tree.hpp"

namespace huffkit::codec {

auto compress(std::span<const Symbol> symbols, const CodecOptions& options)
    -> CompressionResult {
    EncodeResult encoded = encode(symbols, options);

    CompressionResult result;
    result.payload = std::move(encoded.payload);
    result.tree = serializeTree(encoded.tree);
    result.stats = encoded.stats;

    spdlog::info("Compressed {} bytes to {} bits ({:.2f}% saved)",
                 result.stats.symbolCount, result.stats.compressedBits,
                 result.stats.compressionRate());
    return result;
}

auto compress(std::string_view text, const CodecOptions& options)
    -> CompressionResult {
    return compress(asSymbols(text), options);
}

auto decompress(const CompressedPayload& payload, std::span<const u8> tree,
                std::optional<u64> expectedSymbols) -> std::vector<Symbol> {
    HuffmanTree restored = deserializeTree(tree);
    return decode(payload, restored, expectedSymbols);
}

auto decompressText(const CompressedPayload& payload, std::span<const u8> tree,
                    std::optional<u64> expectedSymbols) -> std::string {
    auto symbols = decompress(payload, tree, expectedSymbols);
    return std::string(symbols.begin(), symbols.end());
}

}  // namespace huffkit::codec
