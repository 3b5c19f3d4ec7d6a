/*
 * container.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Self-describing byte frame for a compressed result

**************************************************/

#ifndef HUFFKIT_CODEC_CONTAINER_HPP
#define HUFFKIT_CODEC_CONTAINER_HPP

#include <span>
#include <vector>

#include "huffkit/codec/bit_packer.hpp"
#include "huffkit/codec/huffman.hpp"
#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

/**
 * @brief Fixed header size: magic, version, valid-bit count, symbol count,
 * tree length and payload length.
 */
inline constexpr usize kContainerHeaderBytes = 4 + 1 + 1 + 8 + 4 + 8;

struct Container {
    CompressedPayload payload;
    SerializedTree tree;
    u64 symbolCount = 0;
};

/**
 * @brief Lays out a compress() result as one byte buffer.
 *
 * Layout (integers little endian): magic "HUFK", u8 version, u8 valid bits
 * in the last payload byte, u64 symbol count, u32 tree length, u64 payload
 * length, tree bytes, payload bytes.
 */
auto writeContainer(const CompressionResult& result) -> std::vector<u8>;

/**
 * @throws MalformedPayloadException on bad magic, unknown version,
 * truncation or trailing bytes.
 */
auto readContainer(std::span<const u8> bytes) -> Container;

/**
 * @brief readContainer() followed by decompress(), checking the stored
 * symbol count.
 */
auto decompressContainer(std::span<const u8> bytes) -> std::vector<Symbol>;

}  // namespace huffkit::codec

#endif
