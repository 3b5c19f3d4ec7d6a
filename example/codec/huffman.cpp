#include "huffkit/codec/huffman.hpp"

#include <iostream>
#include <string>

#include "huffkit/codec/codebook.hpp"
#include "huffkit/codec/container.hpp"
#include "huffkit/codec/encoder.hpp"
#include "huffkit/codec/huffman_error.hpp"
#include "huffkit/codec/huffman_tree.hpp"
#include "huffkit/codec/stats.hpp"

using namespace huffkit::codec;

int main() {
    const std::string text = "abacabadabacabae";

    // Step 1: Encode, keeping the tree and codebook in process
    EncodeResult encoded = encode(asSymbols(text));
    std::cout << "Huffman Codes:" << std::endl;
    for (const auto& [symbol, code] : encoded.codebook.entries()) {
        std::cout << "  '" << static_cast<char>(symbol)
                  << "': " << toBitText(code) << std::endl;
    }

    // Step 2: Compress through the external contract
    CompressionResult result = compress(text);
    const auto& stats = result.stats;
    std::cout << "\nOriginal bits:   " << stats.originalBits << std::endl;
    std::cout << "Compressed bits: " << stats.compressedBits << std::endl;
    std::cout << "Ratio:           " << stats.ratio() << std::endl;
    std::cout << "Space saved:     " << stats.compressionRate() << "%"
              << std::endl;
    std::cout << "Tree height:     " << stats.tree.height << std::endl;

    // Step 3: Decompress from the serialized tree
    std::string restored = decompressText(result.payload, result.tree,
                                          stats.symbolCount);
    std::cout << "\nDecompressed: " << restored << std::endl;

    // Step 4: Ship everything in one frame
    auto frame = writeContainer(result);
    auto fromFrame = decompressContainer(frame);
    std::cout << "Frame size: " << frame.size() << " bytes, round trip "
              << (verifyIntegrity(asSymbols(text), fromFrame) ? "ok" : "FAILED")
              << std::endl;

    try {
        CompressedPayload truncated = result.payload;
        truncated.bytes.pop_back();
        truncated.validBitsInLastByte = 3;
        decompress(truncated, result.tree, stats.symbolCount);
    } catch (const HuffmanException& e) {
        std::cout << "\nCorrupted payload rejected: " << toString(e.kind())
                  << " - " << e.getMessage() << std::endl;
    }
    return 0;
}
