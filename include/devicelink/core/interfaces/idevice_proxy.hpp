/**
 * @file idevice_proxy.hpp
 * @brief Outbound capabilities a device session uses to reach its client.
 */
#pragma once
#include <exception>
#include <optional>
#include <string>
#include "devicelink/core/auth/ClientIdentity.hpp"
#include "devicelink/core/message/message.hpp"
#include "devicelink/core/message/direct_method.hpp"

namespace devicelink {

    /**
     * @class IDeviceProxy
     * @brief Capability set bound into a device session.
     *
     * Every send is best effort: when the link it needs is not attached the
     * message is dropped and the call returns normally.
     */
    class IDeviceProxy {
    public:
        virtual ~IDeviceProxy() = default;

        /**
         * @brief Send a cloud-to-device message.
         * @param message Message; its "to" system property is overwritten
         */
        virtual void sendC2DMessage(Message message) = 0;

        /**
         * @brief Deliver a message to a module input.
         * @param message Message to deliver
         * @param input Name of the target input
         */
        virtual void sendMessage(Message message, const std::string& input) = 0;

        /**
         * @brief Invoke a direct method on the client.
         * @param request Method request
         * @return Placeholder response (see DirectMethodResponse)
         */
        virtual DirectMethodResponse invokeMethod(const DirectMethodRequest& request) = 0;

        /**
         * @brief Push a desired properties patch.
         */
        virtual void onDesiredPropertyUpdates(Message desiredProperties) = 0;

        /**
         * @brief Push a full twin.
         */
        virtual void sendTwinUpdate(Message twin) = 0;

        /**
         * @brief Close the client connection. Only the first call has an effect.
         * @param error Reason for closing; may be null
         */
        virtual void close(std::exception_ptr error) = 0;

        /**
         * @brief Mark the proxy as no longer deliverable without closing anything.
         */
        virtual void setInactive() = 0;

        virtual bool isActive() const = 0;

        virtual const ClientIdentity& identity() const = 0;

        /**
         * @brief Refreshed client identity.
         * @throws GatewayError(GatewayErr::NotSupported) always
         */
        virtual std::optional<ClientIdentity> getUpdatedIdentity() = 0;
    };

}
