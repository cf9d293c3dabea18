/**
 * @file error_types.hpp
 * @brief Error type definitions for devicelink.
 *
 * Provides the error code enumeration and the exception type thrown for
 * gateway-level failures (link close, unsupported capabilities).
 */
#pragma once
#include <stdexcept>
#include <string>

namespace devicelink {

    /**
     * @enum GatewayErr
     * @brief Error codes for link and session operations.
     *
     * - LinkCloseTimeout: A link did not close within its timeout
     * - SessionCreation: The session provider could not create a session
     * - NotSupported: The capability is declared but not provided
     */
    enum class GatewayErr : int {
        LinkCloseTimeout = 1, ///< Link close exceeded its timeout
        SessionCreation,      ///< Session provider failure
        NotSupported          ///< Capability not provided by this core
    };

    /**
     * @brief Human-readable name of an error code.
     */
    inline const char* toString(GatewayErr code) noexcept {
        switch (code) {
        case GatewayErr::LinkCloseTimeout: return "LinkCloseTimeout";
        case GatewayErr::SessionCreation:  return "SessionCreation";
        case GatewayErr::NotSupported:     return "NotSupported";
        }
        return "Unknown";
    }

    /**
     * @class GatewayError
     * @brief Exception carrying a GatewayErr code.
     */
    class GatewayError : public std::runtime_error {
    public:
        GatewayError(GatewayErr code, const std::string& msg)
            : std::runtime_error(msg), code_(code) {}

        GatewayErr code() const noexcept { return code_; }

    private:
        GatewayErr code_;
    };

}
