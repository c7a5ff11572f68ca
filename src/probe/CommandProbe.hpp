#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "bus/EventBus.hpp"

namespace latmon {

// Times a callable and publishes one command-execution event for it.
// Only a call that returns normally is recorded; an exception goes back to
// the caller untouched and nothing is published.
class CommandProbe {
public:
    CommandProbe(std::shared_ptr<EventBus> bus, ComponentClass component);

    template <typename F>
    auto time(const std::string& description, F&& fn) -> decltype(fn()) {
        using R = decltype(fn());
        const auto start = std::chrono::steady_clock::now();
        if constexpr (std::is_void_v<R>) {
            std::forward<F>(fn)();
            emit(description, std::chrono::steady_clock::now() - start);
        } else {
            R result = std::forward<F>(fn)();
            emit(description, std::chrono::steady_clock::now() - start);
            return result;
        }
    }

    ComponentClass component() const { return component_; }
    uint64_t       published() const { return published_.load(); }
    uint64_t       rejected()  const { return rejected_.load(); }

private:
    void emit(const std::string& description, std::chrono::steady_clock::duration elapsed);

    std::shared_ptr<EventBus> bus_;
    ComponentClass            component_;
    std::atomic<uint64_t>     published_{0};
    std::atomic<uint64_t>     rejected_{0};
};

} // namespace latmon
