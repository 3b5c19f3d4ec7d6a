/*
 * bit_packer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: MSB-first bit packing with an explicit final-byte bit count

**************************************************/

#include "bit_packer.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "huffkit/codec/config.hpp"
#include "huffkit/codec/huffman_error.hpp"

namespace huffkit::codec {

/* ------------------------ CompressedPayload ------------------------ */

auto CompressedPayload::totalBits() const noexcept -> u64 {
    if (bytes.empty()) {
        return 0;
    }
    return static_cast<u64>(bytes.size() - 1) * kBitsPerByte +
           validBitsInLastByte;
}

auto CompressedPayload::isWellFormed() const noexcept -> bool {
    if (bytes.empty()) {
        return validBitsInLastByte == 0;
    }
    return validBitsInLastByte != 0 && validBitsInLastByte <= kBitsPerByte;
}

/* ------------------------ BitWriter ------------------------ */

void BitWriter::writeBit(bool bit) {
    cur_ = static_cast<u8>((cur_ << 1) | (bit ? 1u : 0u));
    ++bit_pos_;
    ++bit_count_;
    if (bit_pos_ == kBitsPerByte) {
        data_.push_back(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

void BitWriter::writeBits(const BitString& bits) {
    for (bool bit : bits) {
        writeBit(bit);
    }
}

auto BitWriter::finish() -> CompressedPayload {
    CompressedPayload payload;
    if (bit_pos_ > 0) {
        data_.push_back(static_cast<u8>(cur_ << (kBitsPerByte - bit_pos_)));
        payload.validBitsInLastByte = bit_pos_;
    } else if (!data_.empty()) {
        payload.validBitsInLastByte = static_cast<u8>(kBitsPerByte);
    }
    payload.bytes = std::move(data_);

    data_.clear();
    cur_ = 0;
    bit_pos_ = 0;
    bit_count_ = 0;
    return payload;
}

/* ------------------------ BitReader ------------------------ */

BitReader::BitReader(const CompressedPayload& payload)
    : data_(payload.bytes), total_(payload.totalBits()) {
    if (!payload.isWellFormed()) {
        spdlog::error("Payload of {} bytes declares {} valid bits in its "
                      "last byte",
                      payload.bytes.size(),
                      static_cast<unsigned>(payload.validBitsInLastByte));
        THROW_MALFORMED_PAYLOAD(
            "Payload bit count does not match its bytes: ",
            payload.bytes.size(), " bytes with ",
            static_cast<unsigned>(payload.validBitsInLastByte),
            " valid bits in the last byte");
    }
}

auto BitReader::readBit() -> bool {
    if (consumed_ >= total_) {
        THROW_MALFORMED_PAYLOAD("Read past the last valid bit (", total_,
                                " bits)");
    }
    u8 byte = data_[consumed_ / kBitsPerByte];
    auto shift = static_cast<unsigned>(kBitsPerByte - 1 -
                                       consumed_ % kBitsPerByte);
    ++consumed_;
    return ((byte >> shift) & 1u) != 0;
}

/* ------------------------ packBits / unpackBits ------------------------ */

auto packBits(const BitString& bits) -> CompressedPayload {
    BitWriter writer;
    writer.writeBits(bits);
    return writer.finish();
}

auto unpackBits(const CompressedPayload& payload) -> BitString {
    BitReader reader(payload);
    BitString bits;
    bits.reserve(reader.totalBits());
    while (!reader.atEnd()) {
        bits.push_back(reader.readBit());
    }
    return bits;
}

}  // namespace huffkit::codec
