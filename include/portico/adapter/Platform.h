#pragma once

#include "portico/network/Callbacks.h"

#include <memory>
#include <variant>

namespace portico {
namespace engine {
class EventExchange;
class MemoryExchange;
} // namespace engine

namespace adapter {

// Native handles of the event engine.
struct EventPlatform {
    static constexpr const char* kName = "event";
    std::shared_ptr<engine::EventExchange> exchange;
    network::TcpConnectionPtr connection;
};

// Native handle of the in-process engine.
struct MemoryPlatform {
    static constexpr const char* kName = "memory";
    std::shared_ptr<engine::MemoryExchange> exchange;
};

using Platform = std::variant<EventPlatform, MemoryPlatform>;

inline const char* PlatformName(const Platform& platform) {
    return std::visit([](const auto& p) { return p.kName; }, platform);
}

} // namespace adapter
} // namespace portico
