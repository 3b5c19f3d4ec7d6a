/*
 * frequency.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Symbol occurrence counting

**************************************************/

#include "frequency.hpp"

#include <spdlog/spdlog.h>

namespace huffkit::codec {

auto FrequencyTable::fromEntries(std::span<const Entry> entries)
    -> FrequencyTable {
    FrequencyTable table;
    for (const auto& [symbol, count] : entries) {
        table.add(symbol, count);
    }
    return table;
}

void FrequencyTable::add(Symbol symbol, u64 count) {
    if (count == 0) {
        return;
    }
    if (counts_[symbol] == 0) {
        ++distinct_;
    }
    counts_[symbol] += count;
    total_ += count;
}

auto FrequencyTable::entries() const -> std::vector<Entry> {
    std::vector<Entry> result;
    result.reserve(distinct_);
    for (usize s = 0; s < kAlphabetSize; ++s) {
        if (counts_[s] != 0) {
            result.emplace_back(static_cast<Symbol>(s), counts_[s]);
        }
    }
    return result;
}

auto countFrequencies(std::span<const Symbol> symbols) -> FrequencyTable {
    std::array<u64, kAlphabetSize> counts{};
    for (Symbol s : symbols) {
        ++counts[s];
    }

    FrequencyTable table;
    for (usize s = 0; s < kAlphabetSize; ++s) {
        table.add(static_cast<Symbol>(s), counts[s]);
    }
    spdlog::debug("Counted {} symbols, {} distinct", table.totalCount(),
                  table.size());
    return table;
}

}  // namespace huffkit::codec
