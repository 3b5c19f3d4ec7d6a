/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Fixed-width aliases and the basic vocabulary of the codec

**************************************************/

#ifndef HUFFKIT_CODEC_TYPES_HPP
#define HUFFKIT_CODEC_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace huffkit::codec {
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using usize = std::size_t;

using f64 = double;

/**
 * @brief One unit of input. Symbols are bytes.
 */
using Symbol = u8;

/**
 * @brief An ordered sequence of code bits, first bit first.
 */
using BitString = std::vector<bool>;

/**
 * @brief Pre-order tagged byte encoding of a Huffman tree. Empty means "no
 * tree", which is what empty input compresses to.
 */
using SerializedTree = std::vector<u8>;
}  // namespace huffkit::codec

#endif
