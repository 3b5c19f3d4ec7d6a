/*
 * stats.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Compression statistics and coding efficiency

**************************************************/

#ifndef HUFFKIT_CODEC_STATS_HPP
#define HUFFKIT_CODEC_STATS_HPP

#include <chrono>
#include <span>

#include "huffkit/codec/codebook.hpp"
#include "huffkit/codec/frequency.hpp"
#include "huffkit/codec/huffman_tree.hpp"
#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

/**
 * @brief Informational figures about one compress call. Never fed back into
 * encoding or decoding.
 */
struct CompressionStats {
    u64 symbolCount = 0;
    usize distinctSymbols = 0;
    u64 originalBits = 0;    ///< 8 bits per input symbol.
    u64 compressedBits = 0;  ///< Valid bits of the payload.
    TreeStats tree;
    std::chrono::nanoseconds elapsed{0};

    /// compressedBits / originalBits, 0 when there is no data.
    [[nodiscard]] auto ratio() const noexcept -> f64;

    /// originalBits - compressedBits; negative when coding expands the input.
    [[nodiscard]] auto savedBits() const noexcept -> i64;

    /// Percentage of the original bits saved, 0 when there is no data.
    [[nodiscard]] auto compressionRate() const noexcept -> f64;

    /// originalBits / compressedBits, 0 when nothing was emitted.
    [[nodiscard]] auto compressionFactor() const noexcept -> f64;
};

auto makeCompressionStats(const FrequencyTable& frequencies,
                          u64 compressedBits, const TreeStats& tree)
    -> CompressionStats;

struct EfficiencyReport {
    f64 entropy = 0.0;               ///< Shannon entropy, bits per symbol.
    f64 averageBitsPerSymbol = 0.0;  ///< Frequency-weighted code length.
    f64 efficiency = 0.0;            ///< entropy / averageBitsPerSymbol.
};

auto shannonEntropy(const FrequencyTable& frequencies) -> f64;

/**
 * @brief Compares the achieved code length with the entropy bound.
 *
 * A single-symbol input has zero entropy but still spends one bit per
 * symbol, so its efficiency is 0.
 */
auto analyzeEfficiency(const FrequencyTable& frequencies,
                       const Codebook& codebook) -> EfficiencyReport;

auto verifyIntegrity(std::span<const Symbol> original,
                     std::span<const Symbol> decoded) -> bool;

}  // namespace huffkit::codec

#endif
