/*
 * codebook.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Symbol to code mapping derived from a Huffman tree

**************************************************/

#ifndef HUFFKIT_CODEC_CODEBOOK_HPP
#define HUFFKIT_CODEC_CODEBOOK_HPP

#include <array>
#include <string>
#include <utility>
#include <vector>

#include "huffkit/codec/config.hpp"
#include "huffkit/codec/frequency.hpp"
#include "huffkit/codec/huffman_tree.hpp"
#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

/**
 * @brief Code assigned to each symbol of one input.
 *
 * A codebook is only valid for the input whose tree it came from.
 */
class Codebook {
public:
    using Entry = std::pair<Symbol, BitString>;

    Codebook() = default;

    /**
     * @brief Assigns a code to a symbol, replacing any previous one.
     * @throws InvalidInputException if the code is empty.
     */
    void assign(Symbol symbol, BitString code);

    /// The code of a symbol, or nullptr when the symbol has none.
    [[nodiscard]] auto find(Symbol symbol) const noexcept -> const BitString*;

    [[nodiscard]] auto contains(Symbol symbol) const noexcept -> bool {
        return !codes_[symbol].empty();
    }

    [[nodiscard]] auto size() const noexcept -> usize { return size_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }

    /// Codes in ascending symbol order.
    [[nodiscard]] auto entries() const -> std::vector<Entry>;

    /// True when no code is a prefix of a different symbol's code.
    [[nodiscard]] auto isPrefixFree() const -> bool;

    /// Sum over symbols of count x code length.
    [[nodiscard]] auto totalEncodedBits(const FrequencyTable& frequencies) const
        -> u64;

private:
    std::array<BitString, kAlphabetSize> codes_{};
    usize size_ = 0;
};

/**
 * @brief Derives the codebook of a tree by depth-first traversal.
 *
 * Left edges append kLeftBit, right edges kRightBit. A tree consisting of a
 * single leaf maps its symbol to the one-bit code {kLeftBit}. An empty tree
 * gives an empty codebook.
 */
auto generateCodebook(const HuffmanTree& tree) -> Codebook;

/// Renders a code as a string of '0' and '1'.
auto toBitText(const BitString& bits) -> std::string;

}  // namespace huffkit::codec

#endif
