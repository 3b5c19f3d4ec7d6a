/*
 * huffman.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Lossless Huffman compression of byte sequences

**************************************************/

#ifndef HUFFKIT_CODEC_HUFFMAN_HPP
#define HUFFKIT_CODEC_HUFFMAN_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "huffkit/codec/bit_packer.hpp"
#include "huffkit/codec/config.hpp"
#include "huffkit/codec/huffman_error.hpp"
#include "huffkit/codec/stats.hpp"
#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

/**
 * @brief Output of compress(): the packed payload together with the
 * serialized tree needed to decode it.
 */
struct CompressionResult {
    CompressedPayload payload;
    SerializedTree tree;  ///< Empty when the input was empty.
    CompressionStats stats;
};

/**
 * @brief Compresses a byte sequence.
 *
 * Each call builds its own frequency table, tree and codebook; nothing is
 * shared between calls, so independent calls may run concurrently.
 *
 * @param symbols The input bytes.
 * @param options Runtime options, see CodecOptions.
 * @return Payload, serialized tree and statistics.
 */
auto compress(std::span<const Symbol> symbols, const CodecOptions& options = {})
    -> CompressionResult;

auto compress(std::string_view text, const CodecOptions& options = {})
    -> CompressionResult;

/**
 * @brief Restores the bytes of a compress() result.
 *
 * @param payload The packed payload.
 * @param tree The serialized tree produced alongside the payload.
 * @param expectedSymbols Optional number of symbols to expect.
 * @return The original bytes.
 * @throws MalformedPayloadException on corrupt or mismatched input.
 */
auto decompress(const CompressedPayload& payload, std::span<const u8> tree,
                std::optional<u64> expectedSymbols = std::nullopt)
    -> std::vector<Symbol>;

/**
 * @brief Like decompress() but returns the bytes as a string.
 */
auto decompressText(const CompressedPayload& payload, std::span<const u8> tree,
                    std::optional<u64> expectedSymbols = std::nullopt)
    -> std::string;

/// Views the characters of a string as symbols.
inline auto asSymbols(std::string_view text) noexcept
    -> std::span<const Symbol> {
    return {reinterpret_cast<const Symbol*>(text.data()), text.size()};
}

}  // namespace huffkit::codec

#endif
