/*
 * container.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Self-describing byte frame for a compressed result

**************************************************/

#include "container.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

#include "huffkit/codec/config.hpp"
#include "huffkit/codec/huffman_error.hpp"

namespace huffkit::codec {

namespace {

class ByteWriter {
public:
    void writeU8(u8 v) { buf_.push_back(v); }
    void writeU32Le(u32 v) {
        for (int i = 0; i < 4; ++i) {
            buf_.push_back(static_cast<u8>((v >> (8 * i)) & 0xFF));
        }
    }
    void writeU64Le(u64 v) {
        writeU32Le(static_cast<u32>(v & 0xFFFFFFFFu));
        writeU32Le(static_cast<u32>(v >> 32));
    }
    void writeBytes(std::span<const u8> bytes) {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }
    void reserve(usize n) { buf_.reserve(n); }
    auto take() -> std::vector<u8> { return std::move(buf_); }

private:
    std::vector<u8> buf_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const u8> data) : buf_(data) {}

    auto readU8() -> u8 {
        need(1);
        return buf_[pos_++];
    }
    auto readU32Le() -> u32 {
        need(4);
        u32 v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<u32>(buf_[pos_++]) << (8 * i);
        }
        return v;
    }
    auto readU64Le() -> u64 {
        u64 lo = readU32Le();
        u64 hi = readU32Le();
        return lo | (hi << 32);
    }
    auto readBytes(u64 n) -> std::vector<u8> {
        need(n);
        auto first = buf_.begin() + static_cast<std::ptrdiff_t>(pos_);
        std::vector<u8> out(first, first + static_cast<std::ptrdiff_t>(n));
        pos_ += static_cast<usize>(n);
        return out;
    }
    [[nodiscard]] auto remaining() const noexcept -> usize {
        return buf_.size() - pos_;
    }

private:
    void need(u64 n) const {
        if (n > remaining()) {
            THROW_MALFORMED_PAYLOAD("Container truncated: need ", n,
                                    " bytes at offset ", pos_, ", have ",
                                    remaining());
        }
    }

    std::span<const u8> buf_;
    usize pos_ = 0;
};

}  // namespace

auto writeContainer(const CompressionResult& result) -> std::vector<u8> {
    if (result.tree.size() > std::numeric_limits<u32>::max()) {
        THROW_INVALID_INPUT("Serialized tree of ", result.tree.size(),
                            " bytes does not fit a container");
    }

    ByteWriter w;
    w.reserve(kContainerHeaderBytes + result.tree.size() +
              result.payload.bytes.size());
    w.writeBytes(kContainerMagic);
    w.writeU8(kContainerVersion);
    w.writeU8(result.payload.validBitsInLastByte);
    w.writeU64Le(result.stats.symbolCount);
    w.writeU32Le(static_cast<u32>(result.tree.size()));
    w.writeU64Le(result.payload.bytes.size());
    w.writeBytes(result.tree);
    w.writeBytes(result.payload.bytes);
    return w.take();
}

auto readContainer(std::span<const u8> bytes) -> Container {
    if (bytes.size() < kContainerHeaderBytes) {
        THROW_MALFORMED_PAYLOAD("Container too small: ", bytes.size(),
                                " bytes");
    }
    if (!std::equal(kContainerMagic.begin(), kContainerMagic.end(),
                    bytes.begin())) {
        THROW_MALFORMED_PAYLOAD("Container has bad magic");
    }

    ByteReader r(bytes.subspan(kContainerMagic.size()));
    u8 version = r.readU8();
    if (version != kContainerVersion) {
        THROW_MALFORMED_PAYLOAD("Unsupported container version ",
                                static_cast<unsigned>(version));
    }

    Container container;
    container.payload.validBitsInLastByte = r.readU8();
    container.symbolCount = r.readU64Le();
    u32 treeLength = r.readU32Le();
    u64 payloadLength = r.readU64Le();
    container.tree = r.readBytes(treeLength);
    container.payload.bytes = r.readBytes(payloadLength);

    if (r.remaining() != 0) {
        spdlog::error("Container has {} trailing bytes", r.remaining());
        THROW_MALFORMED_PAYLOAD("Container has ", r.remaining(),
                                " trailing bytes");
    }
    if (!container.payload.isWellFormed()) {
        THROW_MALFORMED_PAYLOAD(
            "Container payload bit count does not match its bytes");
    }
    return container;
}

auto decompressContainer(std::span<const u8> bytes) -> std::vector<Symbol> {
    Container container = readContainer(bytes);
    return decompress(container.payload, container.tree,
                      container.symbolCount);
}

}  // namespace huffkit::codec
