#include "model/Types.hpp"

using namespace latmon;

const char* latmon::to_string(ComponentClass c) {
    switch (c) {
        case ComponentClass::EDITOR:          return "editor";
        case ComponentClass::EXTENSION_HOST:  return "extension-host";
        case ComponentClass::AI_MODEL_LOCAL:  return "ai-model-local";
        case ComponentClass::AI_MODEL_REMOTE: return "ai-model-remote";
        case ComponentClass::TERMINAL:        return "terminal";
        case ComponentClass::FILESYSTEM:      return "filesystem";
        case ComponentClass::NETWORK:         return "network";
        case ComponentClass::SYSTEM:          return "system";
    }
    return "system";
}

const char* latmon::to_string(SourceKind s) {
    switch (s) {
        case SourceKind::PROCESS_SCAN:      return "process-scan";
        case SourceKind::COMMAND_EXECUTION: return "command-execution";
        case SourceKind::FILE_OP:           return "file-op";
        case SourceKind::NETWORK_REQUEST:   return "network-request";
        case SourceKind::SYNTHETIC_TEST:    return "synthetic-test";
        case SourceKind::USER_INTERACTION:  return "user-interaction";
    }
    return "process-scan";
}

std::optional<ComponentClass> latmon::parse_component_class(const std::string& s) {
    for (ComponentClass c : kAllComponentClasses) {
        if (s == to_string(c)) return c;
    }
    return std::nullopt;
}

std::optional<SourceKind> latmon::parse_source_kind(const std::string& s) {
    static const SourceKind ALL[] = {
        SourceKind::PROCESS_SCAN,
        SourceKind::COMMAND_EXECUTION,
        SourceKind::FILE_OP,
        SourceKind::NETWORK_REQUEST,
        SourceKind::SYNTHETIC_TEST,
        SourceKind::USER_INTERACTION,
    };
    for (SourceKind k : ALL) {
        if (s == to_string(k)) return k;
    }
    return std::nullopt;
}
