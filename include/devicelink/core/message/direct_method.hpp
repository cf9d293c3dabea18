/**
 * @file direct_method.hpp
 * @brief Direct method request and response types.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devicelink {

    /**
     * @struct DirectMethodRequest
     * @brief A cloud-initiated method call addressed to a device or module.
     */
    struct DirectMethodRequest {
        std::string          name;          ///< Method name
        std::string          correlationId; ///< Matches the response to the request
        std::vector<uint8_t> data;          ///< Request payload
    };

    /**
     * @class DirectMethodResponse
     * @brief Result of DeviceProxy::invokeMethod().
     *
     * Responses coming back from the device are not routed through this core, so
     * invokeMethod() only ever returns a placeholder. A placeholder knows the
     * correlation id of its request; reading status() or data() from it throws
     * GatewayError(GatewayErr::NotSupported).
     */
    class DirectMethodResponse {
    public:
        /// Placeholder response.
        DirectMethodResponse() = default;
        explicit DirectMethodResponse(std::string correlationId)
            : correlationId_(std::move(correlationId)) {}
        /// Response carrying a real result.
        DirectMethodResponse(std::string correlationId, int status, std::vector<uint8_t> data);

        const std::string& correlationId() const { return correlationId_; }

        /**
         * @brief True when the response carries the device's actual result.
         */
        bool hasResult() const noexcept { return status_.has_value(); }

        int status() const;
        const std::vector<uint8_t>& data() const;

    private:
        std::string          correlationId_;
        std::optional<int>   status_;
        std::vector<uint8_t> data_;
    };

}
