/*
 * stats.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Compression statistics and coding efficiency

**************************************************/

#include "stats.hpp"

#include <algorithm>
#include <cmath>

#include "huffkit/codec/config.hpp"

namespace huffkit::codec {

auto CompressionStats::ratio() const noexcept -> f64 {
    if (originalBits == 0) {
        return 0.0;
    }
    return static_cast<f64>(compressedBits) / static_cast<f64>(originalBits);
}

auto CompressionStats::savedBits() const noexcept -> i64 {
    return static_cast<i64>(originalBits) - static_cast<i64>(compressedBits);
}

auto CompressionStats::compressionRate() const noexcept -> f64 {
    if (originalBits == 0) {
        return 0.0;
    }
    return static_cast<f64>(savedBits()) / static_cast<f64>(originalBits) *
           100.0;
}

auto CompressionStats::compressionFactor() const noexcept -> f64 {
    if (compressedBits == 0) {
        return 0.0;
    }
    return static_cast<f64>(originalBits) / static_cast<f64>(compressedBits);
}

auto makeCompressionStats(const FrequencyTable& frequencies,
                          u64 compressedBits, const TreeStats& tree)
    -> CompressionStats {
    CompressionStats stats;
    stats.symbolCount = frequencies.totalCount();
    stats.distinctSymbols = frequencies.size();
    stats.originalBits = frequencies.totalCount() * kBitsPerSymbol;
    stats.compressedBits = compressedBits;
    stats.tree = tree;
    return stats;
}

auto shannonEntropy(const FrequencyTable& frequencies) -> f64 {
    if (frequencies.empty()) {
        return 0.0;
    }
    auto total = static_cast<f64>(frequencies.totalCount());
    f64 entropy = 0.0;
    for (const auto& [symbol, count] : frequencies.entries()) {
        f64 p = static_cast<f64>(count) / total;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

auto analyzeEfficiency(const FrequencyTable& frequencies,
                       const Codebook& codebook) -> EfficiencyReport {
    EfficiencyReport report;
    if (frequencies.empty()) {
        return report;
    }
    report.entropy = shannonEntropy(frequencies);
    report.averageBitsPerSymbol =
        static_cast<f64>(codebook.totalEncodedBits(frequencies)) /
        static_cast<f64>(frequencies.totalCount());
    if (report.averageBitsPerSymbol > 0.0) {
        report.efficiency = report.entropy / report.averageBitsPerSymbol;
    }
    return report;
}

auto verifyIntegrity(std::span<const Symbol> original,
                     std::span<const Symbol> decoded) -> bool {
    return std::ranges::equal(original, decoded);
}

}  // namespace huffkit::codec
