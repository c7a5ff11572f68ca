#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace latmon {

// Closed set of monitored subjects. Order is stable: it indexes the
// per-class arrays in Aggregator.
enum class ComponentClass : int {
    EDITOR = 0,
    EXTENSION_HOST,
    AI_MODEL_LOCAL,
    AI_MODEL_REMOTE,
    TERMINAL,
    FILESYSTEM,
    NETWORK,
    SYSTEM,
};

constexpr std::size_t kComponentClassCount = 8;

constexpr std::array<ComponentClass, kComponentClassCount> kAllComponentClasses{
    ComponentClass::EDITOR,
    ComponentClass::EXTENSION_HOST,
    ComponentClass::AI_MODEL_LOCAL,
    ComponentClass::AI_MODEL_REMOTE,
    ComponentClass::TERMINAL,
    ComponentClass::FILESYSTEM,
    ComponentClass::NETWORK,
    ComponentClass::SYSTEM,
};

enum class SourceKind : int {
    PROCESS_SCAN = 0,
    COMMAND_EXECUTION,
    FILE_OP,
    NETWORK_REQUEST,
    SYNTHETIC_TEST,
    USER_INTERACTION,
};

// Wire names ("extension-host", "process-scan", ...). Used by the store
// and the JSON API; nowhere else.
const char* to_string(ComponentClass c);
const char* to_string(SourceKind s);

// Unknown strings yield nullopt. Callers decide whether that is an error.
std::optional<ComponentClass> parse_component_class(const std::string& s);
std::optional<SourceKind>     parse_source_kind(const std::string& s);

inline std::size_t index_of(ComponentClass c) {
    return static_cast<std::size_t>(c);
}

} // namespace latmon
