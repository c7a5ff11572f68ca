#include "probe/CommandProbe.hpp"
#include <stdexcept>

using namespace latmon;

CommandProbe::CommandProbe(std::shared_ptr<EventBus> bus, ComponentClass component)
    : bus_(std::move(bus)), component_(component) {
    if (!bus_) throw std::invalid_argument("CommandProbe needs a bus");
}

void CommandProbe::emit(const std::string& description,
                        std::chrono::steady_clock::duration elapsed) {
    auto us = std::chrono::duration_cast<Micros>(elapsed);
    auto ev = LatencyEvent::capture(component_, SourceKind::COMMAND_EXECUTION, us, description,
                                    nlohmann::json{{"command", description}});
    if (bus_->publish(ev)) published_.fetch_add(1, std::memory_order_relaxed);
    else                   rejected_.fetch_add(1, std::memory_order_relaxed);
}
