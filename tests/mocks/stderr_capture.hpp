#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace haproxyotel::testing {

/**
 * @brief Redirects std::cerr (where utils::log writes) for the scope's lifetime
 */
class StderrCapture {
public:
    StderrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~StderrCapture() { std::cerr.rdbuf(previous_); }

    StderrCapture(const StderrCapture&) = delete;
    StderrCapture& operator=(const StderrCapture&) = delete;

    [[nodiscard]] std::string text() const { return buffer_.str(); }

    [[nodiscard]] bool contains(const std::string& needle) const {
        return text().find(needle) != std::string::npos;
    }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

} // namespace haproxyotel::testing
