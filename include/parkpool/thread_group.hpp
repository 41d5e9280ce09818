#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "parkpool/log.hpp"

namespace parkpool {

// Owns a set of worker threads and joins every one of them on destruction,
// including while an exception is unwinding the owner's frame. A task that
// throws std::exception has the error logged under its name; the other
// tasks keep running.
class ThreadGroup {
public:
    ThreadGroup() = default;
    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;
    ~ThreadGroup() { joinAll(); }

    template <typename F>
    void spawn(std::string name, F fn) {
        threads_.emplace_back([name = std::move(name), fn = std::move(fn)]() mutable {
            try {
                fn();
            } catch (const std::exception& e) {
                logError(name + ": " + e.what());
            }
        });
    }

    void joinAll();
    std::size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace parkpool
