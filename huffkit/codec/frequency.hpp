/*
 * frequency.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Symbol occurrence counting

**************************************************/

#ifndef HUFFKIT_CODEC_FREQUENCY_HPP
#define HUFFKIT_CODEC_FREQUENCY_HPP

#include <array>
#include <span>
#include <utility>
#include <vector>

#include "huffkit/codec/config.hpp"
#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

/**
 * @brief Occurrence count of every distinct symbol of one input.
 *
 * Stored densely over the byte alphabet. Iteration through entries() is in
 * ascending symbol order, which is what makes tree construction
 * reproducible.
 */
class FrequencyTable {
public:
    using Entry = std::pair<Symbol, u64>;

    FrequencyTable() = default;

    /**
     * @brief Builds a table from explicit (symbol, count) pairs.
     *
     * Zero counts are skipped and repeated symbols accumulate.
     */
    static auto fromEntries(std::span<const Entry> entries) -> FrequencyTable;

    void add(Symbol symbol, u64 count = 1);

    [[nodiscard]] auto count(Symbol symbol) const noexcept -> u64 {
        return counts_[symbol];
    }

    [[nodiscard]] auto contains(Symbol symbol) const noexcept -> bool {
        return counts_[symbol] != 0;
    }

    /// Number of distinct symbols.
    [[nodiscard]] auto size() const noexcept -> usize { return distinct_; }

    /// True for the table of an empty input.
    [[nodiscard]] auto empty() const noexcept -> bool { return distinct_ == 0; }

    /// Sum of all counts, i.e. the length of the counted input.
    [[nodiscard]] auto totalCount() const noexcept -> u64 { return total_; }

    [[nodiscard]] auto entries() const -> std::vector<Entry>;

    auto operator==(const FrequencyTable& other) const -> bool = default;

private:
    std::array<u64, kAlphabetSize> counts_{};
    usize distinct_ = 0;
    u64 total_ = 0;
};

/**
 * @brief Tallies every symbol of the input in a single pass.
 *
 * @param symbols The input sequence.
 * @return The frequency table; empty() is true for an empty input.
 */
auto countFrequencies(std::span<const Symbol> symbols) -> FrequencyTable;

}  // namespace huffkit::codec

#endif
