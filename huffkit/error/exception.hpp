/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Exception base carrying source location, thread and stack trace

**************************************************/

#ifndef HUFFKIT_ERROR_EXCEPTION_HPP
#define HUFFKIT_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "huffkit/error/stacktrace.hpp"

#define HUFFKIT_FILE_NAME __FILE__
#define HUFFKIT_FILE_LINE __LINE__
#define HUFFKIT_FUNC_NAME __func__

namespace huffkit::error {

/**
 * @brief Base exception of the library.
 *
 * Records where it was thrown from. The message is built by streaming every
 * trailing constructor argument, so throw sites can mix strings and numbers.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    /**
     * @brief Full report: location, thread, message and stack trace.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;

    /**
     * @brief The bare message, without location or stack trace.
     */
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
    StackTrace stack_trace_;
};

}  // namespace huffkit::error

#endif
