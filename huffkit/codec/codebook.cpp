/*
 * codebook.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Symbol to code mapping derived from a Huffman tree

**************************************************/

#include "codebook.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "huffkit/codec/huffman_error.hpp"

namespace huffkit::codec {

void Codebook::assign(Symbol symbol, BitString code) {
    if (code.empty()) {
        THROW_INVALID_INPUT("Empty code for symbol ",
                            static_cast<unsigned>(symbol));
    }
    if (codes_[symbol].empty()) {
        ++size_;
    }
    codes_[symbol] = std::move(code);
}

auto Codebook::find(Symbol symbol) const noexcept -> const BitString* {
    const auto& code = codes_[symbol];
    return code.empty() ? nullptr : &code;
}

auto Codebook::entries() const -> std::vector<Entry> {
    std::vector<Entry> result;
    result.reserve(size_);
    for (usize s = 0; s < kAlphabetSize; ++s) {
        if (!codes_[s].empty()) {
            result.emplace_back(static_cast<Symbol>(s), codes_[s]);
        }
    }
    return result;
}

auto Codebook::isPrefixFree() const -> bool {
    auto all = entries();
    for (usize i = 0; i < all.size(); ++i) {
        for (usize j = 0; j < all.size(); ++j) {
            if (i == j) {
                continue;
            }
            const auto& shorter = all[i].second;
            const auto& longer = all[j].second;
            if (shorter.size() <= longer.size() &&
                std::equal(shorter.begin(), shorter.end(), longer.begin())) {
                return false;
            }
        }
    }
    return true;
}

auto Codebook::totalEncodedBits(const FrequencyTable& frequencies) const
    -> u64 {
    u64 total = 0;
    for (const auto& [symbol, count] : frequencies.entries()) {
        total += count * codes_[symbol].size();
    }
    return total;
}

namespace {

void collectCodes(const HuffmanNode* node, BitString& path, Codebook& book) {
    if (node->isLeaf()) {
        book.assign(node->leaf().symbol, path);
        return;
    }
    const auto& inner = node->internal();

    path.push_back(kLeftBit);
    collectCodes(inner.left.get(), path, book);
    path.back() = kRightBit;
    collectCodes(inner.right.get(), path, book);
    path.pop_back();
}

}  // namespace

auto generateCodebook(const HuffmanTree& tree) -> Codebook {
    Codebook book;
    if (tree.empty()) {
        return book;
    }

    if (tree.isSingleLeaf()) {
        book.assign(tree.root()->leaf().symbol, BitString{kLeftBit});
        return book;
    }

    BitString path;
    collectCodes(tree.root(), path, book);
    spdlog::debug("Generated {} Huffman codes", book.size());
    return book;
}

auto toBitText(const BitString& bits) -> std::string {
    std::string text;
    text.reserve(bits.size());
    for (bool bit : bits) {
        text += bit ? '1' : '0';
    }
    return text;
}

}  // namespace huffkit::codec
