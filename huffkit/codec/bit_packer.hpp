/*
 * bit_packer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: MSB-first bit packing with an explicit final-byte bit count

**************************************************/

#ifndef HUFFKIT_CODEC_BIT_PACKER_HPP
#define HUFFKIT_CODEC_BIT_PACKER_HPP

#include <vector>

#include "huffkit/codec/types.hpp"

namespace huffkit::codec {

/**
 * @brief Packed code bits plus the number of meaningful bits in the last
 * byte.
 *
 * Empty payloads have validBitsInLastByte == 0; otherwise it lies in 1..8.
 * The writer zero-fills padding and readers ignore it. Neither field means
 * anything without the other.
 */
struct CompressedPayload {
    std::vector<u8> bytes;
    u8 validBitsInLastByte = 0;

    [[nodiscard]] auto empty() const noexcept -> bool { return bytes.empty(); }

    /// Number of valid bits; does not check the invariant.
    [[nodiscard]] auto totalBits() const noexcept -> u64;

    /// True when the bit count agrees with the byte count.
    [[nodiscard]] auto isWellFormed() const noexcept -> bool;

    auto operator==(const CompressedPayload& other) const -> bool = default;
};

/**
 * @brief Accumulates bits most-significant-bit first.
 */
class BitWriter {
public:
    void writeBit(bool bit);
    void writeBits(const BitString& bits);

    [[nodiscard]] auto bitCount() const noexcept -> u64 { return bit_count_; }

    /**
     * @brief Flushes the partial byte, zero-padded, and hands out the
     * payload. The writer is left empty.
     */
    auto finish() -> CompressedPayload;

private:
    std::vector<u8> data_;
    u8 cur_ = 0;
    u8 bit_pos_ = 0;  // bits filled in cur_ (0..7)
    u64 bit_count_ = 0;
};

/**
 * @brief Reads exactly the valid bits of a payload, in order.
 */
class BitReader {
public:
    /**
     * @throws MalformedPayloadException if the payload's bit count does not
     * match its bytes.
     */
    explicit BitReader(const CompressedPayload& payload);

    [[nodiscard]] auto totalBits() const noexcept -> u64 { return total_; }
    [[nodiscard]] auto remaining() const noexcept -> u64 {
        return total_ - consumed_;
    }
    [[nodiscard]] auto atEnd() const noexcept -> bool {
        return consumed_ == total_;
    }

    /**
     * @throws MalformedPayloadException when no valid bit is left.
     */
    auto readBit() -> bool;

private:
    const std::vector<u8>& data_;
    u64 total_;
    u64 consumed_ = 0;
};

auto packBits(const BitString& bits) -> CompressedPayload;

/**
 * @throws MalformedPayloadException if the payload is not well formed.
 */
auto unpackBits(const CompressedPayload& payload) -> BitString;

}  // namespace huffkit::codec

#endif
