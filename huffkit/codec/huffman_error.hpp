/*
 * huffman_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Error kinds raised by the Huffman codec

**************************************************/

#ifndef HUFFKIT_CODEC_HUFFMAN_ERROR_HPP
#define HUFFKIT_CODEC_HUFFMAN_ERROR_HPP

#include <string_view>
#include <utility>

#include "huffkit/error/exception.hpp"

namespace huffkit::codec {

enum class HuffmanErrorKind {
    InvalidInput,      ///< Empty frequency table reached the tree builder.
    MalformedPayload,  ///< Payload or tree bytes are corrupt or mismatched.
    UnsupportedSymbol  ///< Symbol has no code in the supplied codebook.
};

constexpr auto toString(HuffmanErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case HuffmanErrorKind::InvalidInput:
            return "InvalidInput";
        case HuffmanErrorKind::MalformedPayload:
            return "MalformedPayload";
        case HuffmanErrorKind::UnsupportedSymbol:
            return "UnsupportedSymbol";
    }
    return "Unknown";
}

class HuffmanException : public error::Exception {
public:
    template <typename... Args>
    HuffmanException(HuffmanErrorKind kind, const char* file, int line,
                     const char* func, Args&&... args)
        : error::Exception(file, line, func, std::forward<Args>(args)...),
          kind_(kind) {}

    [[nodiscard]] auto kind() const noexcept -> HuffmanErrorKind {
        return kind_;
    }

private:
    HuffmanErrorKind kind_;
};

class InvalidInputException : public HuffmanException {
public:
    template <typename... Args>
    InvalidInputException(const char* file, int line, const char* func,
                          Args&&... args)
        : HuffmanException(HuffmanErrorKind::InvalidInput, file, line, func,
                           std::forward<Args>(args)...) {}
};

class MalformedPayloadException : public HuffmanException {
public:
    template <typename... Args>
    MalformedPayloadException(const char* file, int line, const char* func,
                              Args&&... args)
        : HuffmanException(HuffmanErrorKind::MalformedPayload, file, line,
                           func, std::forward<Args>(args)...) {}
};

class UnsupportedSymbolException : public HuffmanException {
public:
    template <typename... Args>
    UnsupportedSymbolException(const char* file, int line, const char* func,
                               Args&&... args)
        : HuffmanException(HuffmanErrorKind::UnsupportedSymbol, file, line,
                           func, std::forward<Args>(args)...) {}
};

}  // namespace huffkit::codec

#define THROW_INVALID_INPUT(...)                                         \
    throw huffkit::codec::InvalidInputException(                         \
        HUFFKIT_FILE_NAME, HUFFKIT_FILE_LINE, HUFFKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_MALFORMED_PAYLOAD(...)                                     \
    throw huffkit::codec::MalformedPayloadException(                     \
        HUFFKIT_FILE_NAME, HUFFKIT_FILE_LINE, HUFFKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_UNSUPPORTED_SYMBOL(...)                                    \
    throw huffkit::codec::UnsupportedSymbolException(                    \
        HUFFKIT_FILE_NAME, HUFFKIT_FILE_LINE, HUFFKIT_FUNC_NAME, __VA_ARGS__)

#endif
