#pragma once

#include <iostream>

namespace begone {

class Context {
public:
    explicit Context(bool verbose = false) : verbose_(verbose) {}

    template <typename... Args>
    void log(const Args &...args) const {
        (std::cout << ... << args) << '\n';
    }

    template <typename... Args>
    void debug(const Args &...args) const {
        if (!verbose_) {
            return;
        }
        std::cerr << "[debug] ";
        (std::cerr << ... << args) << '\n';
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        std::cerr << "[warn] ";
        (std::cerr << ... << args) << '\n';
    }

    template <typename... Args>
    void error(const Args &...args) const {
        std::cerr << "[error] ";
        (std::cerr << ... << args) << '\n';
    }

    bool verbose() const { return verbose_; }

private:
    bool verbose_;
};

} // namespace begone
