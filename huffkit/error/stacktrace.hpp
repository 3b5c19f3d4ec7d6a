/*
 * stacktrace.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Stack trace capture attached to huffkit exceptions

**************************************************/

#ifndef HUFFKIT_ERROR_STACKTRACE_HPP
#define HUFFKIT_ERROR_STACKTRACE_HPP

#include <cstdlib>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#ifdef HUFFKIT_USE_BOOST
#include <boost/stacktrace.hpp>
#endif

namespace huffkit::error {

/**
 * @brief Captures the call stack at construction time.
 *
 * Frames are resolved lazily in toString(), so capturing is cheap enough to
 * happen on every thrown exception.
 */
class StackTrace {
public:
    /**
     * @brief Captures the current stack trace, skipping this constructor.
     */
    StackTrace();

    /**
     * @brief Get the string representation of the stack trace.
     *
     * @return One line per frame with the demangled function name, address
     * and owning module when available.
     */
    [[nodiscard]] auto toString() const -> std::string;

private:
    void capture();

    [[nodiscard]] auto processFrame(void* frame, int frameIndex) const
        -> std::string;

#ifdef HUFFKIT_USE_BOOST
    boost::stacktrace::stacktrace trace_;
#elif defined(__APPLE__) || defined(__linux__)
    std::shared_ptr<char*> symbols_;
    std::vector<void*> frames_;
    int num_frames_ = 0;
    mutable std::unordered_map<void*, std::string> symbolCache_;
#endif
};

}  // namespace huffkit::error

#endif
