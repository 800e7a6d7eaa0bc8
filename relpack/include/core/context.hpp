#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace relpack {

// Shared by every Context so lines from build workers never interleave.
inline std::mutex &outputMutex() {
    static std::mutex mutex;
    return mutex;
}

class Context {
public:
    explicit Context(bool verbose = true) : verbose_(verbose) {}

    template <typename... Args>
    void log(const Args &...args) const {
        if (!verbose_) {
            return;
        }
        std::lock_guard<std::mutex> lock(outputMutex());
        (std::cout << ... << args) << '\n';
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cerr << "[warn] ";
        (std::cerr << ... << args) << '\n';
    }

    template <typename... Args>
    void error(const Args &...args) const {
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cerr << "[error] ";
        (std::cerr << ... << args) << '\n';
    }

    // Multi-line tool output, each line indented under the message that owns it.
    void block(const std::string &text) const {
        if (text.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(outputMutex());
        std::size_t start = 0;
        while (start < text.size()) {
            std::size_t end = text.find('\n', start);
            if (end == std::string::npos) {
                end = text.size();
            }
            std::cerr << "    | " << text.substr(start, end - start) << '\n';
            start = end + 1;
        }
    }

    bool verbose() const { return verbose_; }

private:
    bool verbose_;
};

} // namespace relpack
