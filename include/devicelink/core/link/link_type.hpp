/**
 * @file link_type.hpp
 * @brief Protocol link roles and their pairing rules.
 */
#pragma once
#include <cstdint>
#include <optional>

namespace devicelink {

    /**
     * @enum LinkType
     * @brief Role of one protocol link multiplexed over a client connection.
     *
     * MethodSending/MethodReceiving and TwinSending/TwinReceiving are declared
     * pairs: both halves of a pair must carry the same correlation id.
     */
    enum class LinkType : uint8_t {
        Cbs,             ///< Claims-based security
        Events,          ///< Device → cloud telemetry
        C2D,             ///< Cloud → device messages
        ModuleMessages,  ///< Messages routed to a module input
        MethodSending,   ///< Method invocations sent to the client
        MethodReceiving, ///< Method responses received from the client
        TwinSending,     ///< Twin updates sent to the client
        TwinReceiving    ///< Twin requests received from the client
    };

    /**
     * @brief True for roles whose link implements ISendingLink.
     */
    constexpr bool isSendingLinkType(LinkType type) noexcept {
        switch (type) {
        case LinkType::C2D:
        case LinkType::ModuleMessages:
        case LinkType::MethodSending:
        case LinkType::TwinSending:
            return true;
        default:
            return false;
        }
    }

    /**
     * @brief The other half of a declared pair, or std::nullopt for unpaired roles.
     */
    constexpr std::optional<LinkType> pairedLinkType(LinkType type) noexcept {
        switch (type) {
        case LinkType::MethodSending:   return LinkType::MethodReceiving;
        case LinkType::MethodReceiving: return LinkType::MethodSending;
        case LinkType::TwinSending:     return LinkType::TwinReceiving;
        case LinkType::TwinReceiving:   return LinkType::TwinSending;
        default:                        return std::nullopt;
        }
    }

    const char* toString(LinkType type) noexcept;

}
