/*
 * encoder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Huffman encoding pass

**************************************************/

#include "encoder.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

#include "huffkit/codec/decoder.hpp"
#include "huffkit/codec/frequency.hpp"
#include "huffkit/codec/huffman_error.hpp"

namespace huffkit::codec {

auto encodeWithCodebook(std::span<const Symbol> symbols,
                        const Codebook& codebook) -> CompressedPayload {
    BitWriter writer;
    for (usize i = 0; i < symbols.size(); ++i) {
        const BitString* code = codebook.find(symbols[i]);
        if (code == nullptr) {
            THROW_UNSUPPORTED_SYMBOL("Symbol ",
                                     static_cast<unsigned>(symbols[i]),
                                     " at position ", i,
                                     " has no Huffman code");
        }
        writer.writeBits(*code);
    }
    return writer.finish();
}

auto encode(std::span<const Symbol> symbols, const CodecOptions& options)
    -> EncodeResult {
    auto start = std::chrono::steady_clock::now();

    EncodeResult result;
    if (symbols.empty()) {
        spdlog::debug("Encoding empty input, no tree built");
        return result;
    }

    FrequencyTable frequencies = countFrequencies(symbols);
    result.tree = buildHuffmanTree(frequencies);
    result.codebook = generateCodebook(result.tree);
    result.payload = encodeWithCodebook(symbols, result.codebook);
    result.stats = makeCompressionStats(
        frequencies, result.payload.totalBits(), result.tree.stats());

    if (options.measureTime) {
        result.stats.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start);
    }

    spdlog::debug("Encoded {} symbols into {} bits ({} bytes)",
                  symbols.size(), result.stats.compressedBits,
                  result.payload.bytes.size());

    if (options.verifyRoundTrip) {
        auto decoded = decode(result.payload, result.tree, symbols.size());
        if (!verifyIntegrity(symbols, decoded)) {
            spdlog::error("Round-trip verification failed for {} symbols",
                          symbols.size());
            THROW_MALFORMED_PAYLOAD(
                "Round-trip verification failed: decoded output differs "
                "from the input");
        }
    }
    return result;
}

}  // namespace huffkit::codec
