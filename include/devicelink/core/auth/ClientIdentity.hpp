/**
 * @file ClientIdentity.hpp
 * @brief Identity of the device or module a set of links belongs to.
 */
#pragma once
#include <functional>
#include <optional>
#include <string>

namespace devicelink {


    /**
     * @brief Identity of the device or module behind one set of links.
     *
     *    ┌──────────┬──────────────────────────┐
     *    │ deviceId │ moduleId (modules only)  │
     *    └──────────┴──────────────────────────┘
     *
     * • Immutable once built; shared by the connection handler and its proxy.
     * • id() is "deviceId" for devices and "deviceId/moduleId" for modules.
     */
    struct ClientIdentity {
        std::string                     deviceId;
        std::optional<std::string>      moduleId;

        [[nodiscard]] static ClientIdentity device(std::string deviceId) {
            return ClientIdentity{ std::move(deviceId), std::nullopt };
        }

        [[nodiscard]] static ClientIdentity module(std::string deviceId, std::string moduleId) {
            return ClientIdentity{ std::move(deviceId), std::move(moduleId) };
        }

        [[nodiscard]] bool isModule() const noexcept { return moduleId.has_value(); }

        [[nodiscard]] std::string id() const {
            return moduleId ? deviceId + "/" + *moduleId : deviceId;
        }

        [[nodiscard]] bool operator==(const ClientIdentity& o) const noexcept {
            return deviceId == o.deviceId && moduleId == o.moduleId;
        }
    };

    /* ---------- utility  ---------- */
    inline void hashCombine(std::size_t& seed, std::size_t v) noexcept {
        seed ^= v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }

}

/* ---------- std::hash specialization ---------- */
template<>
struct std::hash<devicelink::ClientIdentity> {
    std::size_t operator()(const devicelink::ClientIdentity& id) const noexcept {
        std::size_t h = std::hash<std::string>{}(id.deviceId);
        // a module id of "" still differs from "no module"
        devicelink::hashCombine(h, id.moduleId ? std::hash<std::string>{}(*id.moduleId) + 1 : 0);
        return h;
    }
};
