/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Codec configuration

**************************************************/

#ifndef HUFFKIT_CODEC_CONFIG_HPP
#define HUFFKIT_CODEC_CONFIG_HPP

#include <array>

#include "huffkit/codec/types.hpp"

// Bit emitted for a step to the left child. The right child gets the other
// value. Encoder, decoder and codebook all read it from here.
#ifndef HUFFKIT_LEFT_EDGE_BIT
#define HUFFKIT_LEFT_EDGE_BIT 0
#endif

// Serialized tree tags
#ifndef HUFFKIT_TREE_INTERNAL_TAG
#define HUFFKIT_TREE_INTERNAL_TAG 0x00
#endif

#ifndef HUFFKIT_TREE_LEAF_TAG
#define HUFFKIT_TREE_LEAF_TAG 0x01
#endif

// Container frame version written by writeContainer
#ifndef HUFFKIT_CONTAINER_VERSION
#define HUFFKIT_CONTAINER_VERSION 1
#endif

namespace huffkit::codec {

inline constexpr bool kLeftBit = HUFFKIT_LEFT_EDGE_BIT != 0;
inline constexpr bool kRightBit = !kLeftBit;

inline constexpr u8 kInternalTag = HUFFKIT_TREE_INTERNAL_TAG;
inline constexpr u8 kLeafTag = HUFFKIT_TREE_LEAF_TAG;
static_assert(kInternalTag != kLeafTag, "tree tags must differ");

inline constexpr usize kAlphabetSize = 256;
inline constexpr usize kBitsPerSymbol = 8;
inline constexpr usize kBitsPerByte = 8;

inline constexpr std::array<u8, 4> kContainerMagic = {'H', 'U', 'F', 'K'};
inline constexpr u8 kContainerVersion = HUFFKIT_CONTAINER_VERSION;

/**
 * @brief Runtime options for compress().
 */
struct CodecOptions {
    /// Decode the freshly encoded payload and compare it with the input.
    bool verifyRoundTrip = false;
    /// Record the wall time of the encode pass in the statistics.
    bool measureTime = true;
};

}  // namespace huffkit::codec

#endif
