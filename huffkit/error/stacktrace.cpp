/*
 * stacktrace.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Stack trace capture attached to huffkit exceptions

**************************************************/

#include "stacktrace.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

#if defined(__APPLE__) || defined(__linux__)
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace huffkit::error {

namespace {

#if !defined(HUFFKIT_USE_BOOST) && (defined(__APPLE__) || defined(__linux__))
auto demangle(const char* mangled) -> std::string {
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return mangled;
}

// backtrace_symbols yields "module(symbol+0xoff) [0xaddr]"
auto extractSymbol(const std::string& line) -> std::string {
    size_t open = line.find('(');
    size_t plus = line.find('+', open);
    if (open == std::string::npos || plus == std::string::npos ||
        plus == open + 1) {
        return line;
    }
    return demangle(line.substr(open + 1, plus - open - 1).c_str());
}
#endif

auto formatAddress(uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(sizeof(void*) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string& path) -> std::string {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

}  // namespace

StackTrace::StackTrace() { capture(); }

auto StackTrace::toString() const -> std::string {
    std::ostringstream oss;

#ifdef HUFFKIT_USE_BOOST
    oss << trace_;
#elif defined(__APPLE__) || defined(__linux__)
    for (int i = 0; i < num_frames_; ++i) {
        oss << "\t[" << i << "] " << processFrame(frames_[i], i) << "\n";
    }
#else
    oss << "\tStack trace not available on this platform.\n";
#endif

    return oss.str();
}

#if !defined(HUFFKIT_USE_BOOST) && (defined(__APPLE__) || defined(__linux__))
auto StackTrace::processFrame(void* frame, int frameIndex) const
    -> std::string {
    auto it = symbolCache_.find(frame);
    if (it != symbolCache_.end()) {
        return it->second;
    }

    std::ostringstream oss;
    uintptr_t address = reinterpret_cast<uintptr_t>(frame);

    Dl_info dlInfo;
    std::string functionName = "<unknown function>";
    std::string moduleName;
    uintptr_t offset = 0;

    if (dladdr(frame, &dlInfo) != 0) {
        if (dlInfo.dli_fname != nullptr) {
            moduleName = dlInfo.dli_fname;
        }
        if (dlInfo.dli_fbase != nullptr) {
            offset = address - reinterpret_cast<uintptr_t>(dlInfo.dli_fbase);
        }
        if (dlInfo.dli_sname != nullptr) {
            functionName = demangle(dlInfo.dli_sname);
        }
    }

    if (functionName == "<unknown function>" && symbols_ &&
        frameIndex < num_frames_) {
        functionName = extractSymbol(symbols_.get()[frameIndex]);
    }

    oss << functionName << " at " << formatAddress(address);
    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
        if (offset > 0) {
            oss << " (+" << std::hex << offset << ")";
        }
    }

    std::string result = oss.str();
    symbolCache_[frame] = result;
    return result;
}
#else
auto StackTrace::processFrame(void* frame, int /*frameIndex*/) const
    -> std::string {
    return "<frame information unavailable> at " +
           formatAddress(reinterpret_cast<uintptr_t>(frame));
}
#endif

void StackTrace::capture() {
#ifdef HUFFKIT_USE_BOOST
    // trace_ captured itself on construction
#elif defined(__APPLE__) || defined(__linux__)
    constexpr int MAX_FRAMES = 64;
    void* framePtrs[MAX_FRAMES];

    num_frames_ = backtrace(framePtrs, MAX_FRAMES);
    if (num_frames_ > 1) {
        symbols_.reset(backtrace_symbols(framePtrs + 1, num_frames_ - 1),
                       [](char** p) { std::free(p); });
        frames_.assign(framePtrs + 1, framePtrs + num_frames_);
        num_frames_--;
    } else {
        symbols_.reset();
        frames_.clear();
        num_frames_ = 0;
    }
    symbolCache_.clear();
#endif
}

}  // namespace huffkit::error
