#include "bus/EventBus.hpp"
#include <iostream>
#include <stdexcept>

using namespace latmon;

struct EventBus::Shared {
    struct Queue {
        std::deque<LatencyEvent> items;
        std::condition_variable  cv;
    };

    std::mutex mtx;
    std::vector<std::unique_ptr<Queue>> queues;
    bool closed{false};
};

static bool is_power_of_two(uint64_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

EventBus::EventBus(std::size_t capacity)
    : capacity_(capacity), shared_(std::make_shared<Shared>()) {
    if (capacity_ == 0) {
        throw std::invalid_argument("EventBus capacity must be > 0");
    }
}

std::shared_ptr<EventSubscription> EventBus::subscribe(const std::string& name) {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    shared_->queues.push_back(std::make_unique<Shared::Queue>());
    std::size_t index = shared_->queues.size() - 1;
    return std::make_shared<Subscription>(Key{}, shared_, index, name);
}

bool EventBus::publish(const LatencyEvent& event) {
    {
        std::lock_guard<std::mutex> lk(shared_->mtx);

        if (shared_->closed) {
            rejected_closed_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        bool full = false;
        for (const auto& q : shared_->queues) {
            if (q->items.size() >= capacity_) {
                full = true;
                break;
            }
        }

        if (!full) {
            for (auto& q : shared_->queues) {
                q->items.push_back(event);
                q->cv.notify_one();
            }
            published_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
    }

    uint64_t n = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (is_power_of_two(n)) {
        std::cerr << "[BUS] Full (capacity " << capacity_ << "), "
                  << n << " events dropped so far\n";
    }
    return false;
}

void EventBus::close() {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    shared_->closed = true;
    for (auto& q : shared_->queues) q->cv.notify_all();
}

void EventBus::close_and_discard() {
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        shared_->closed = true;
        for (auto& q : shared_->queues) {
            discarded += q->items.size();
            q->items.clear();
            q->cv.notify_all();
        }
    }
    if (discarded > 0) {
        std::cerr << "[BUS] Forced close discarded " << discarded << " queued deliveries\n";
    }
}

bool EventBus::closed() const {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    return shared_->closed;
}

// ---------------------------------------------------------------------------
// Subscription
// ---------------------------------------------------------------------------

EventBus::Subscription::Subscription(Key,
                                     std::shared_ptr<Shared> shared,
                                     std::size_t index,
                                     std::string name)
    : shared_(std::move(shared)), index_(index), name_(std::move(name)) {}

EventBus::PopStatus EventBus::Subscription::pop(std::optional<LatencyEvent>& out,
                                                std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(shared_->mtx);
    auto& q = *shared_->queues[index_];

    q.cv.wait_for(lk, timeout, [&]() { return !q.items.empty() || shared_->closed; });

    if (!q.items.empty()) {
        out.emplace(std::move(q.items.front()));
        q.items.pop_front();
        return PopStatus::ITEM;
    }
    return shared_->closed ? PopStatus::CLOSED : PopStatus::TIMEOUT;
}

std::size_t EventBus::Subscription::drain(std::vector<LatencyEvent>& out, std::size_t max) {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    auto& q = *shared_->queues[index_];

    std::size_t n = 0;
    while (n < max && !q.items.empty()) {
        out.push_back(std::move(q.items.front()));
        q.items.pop_front();
        ++n;
    }
    return n;
}

std::size_t EventBus::Subscription::depth() const {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    return shared_->queues[index_]->items.size();
}
