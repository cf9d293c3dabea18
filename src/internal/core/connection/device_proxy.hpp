/**
 * @file device_proxy.hpp
 * @brief IDeviceProxy implementation routing outbound traffic onto registered links.
 */
#pragma once
#include <atomic>
#include <memory>
#include "devicelink/core/interfaces/idevice_proxy.hpp"
#include "devicelink/core/connection/connection_handler.hpp"

namespace devicelink {

    /**
     * @class DeviceProxy
     * @brief Looks up the link for each outbound operation and forwards the message.
     *
     * Holds only a weak reference to its ConnectionHandler. Messages for a role
     * with no registered link, or sent after the handler is gone, are dropped.
     */
    class DeviceProxy : public IDeviceProxy {
    public:
        DeviceProxy(std::weak_ptr<ConnectionHandler> handler, ClientIdentity identity);

        void sendC2DMessage(Message message) override;
        void sendMessage(Message message, const std::string& input) override;
        DirectMethodResponse invokeMethod(const DirectMethodRequest& request) override;
        void onDesiredPropertyUpdates(Message desiredProperties) override;
        void sendTwinUpdate(Message twin) override;

        void close(std::exception_ptr error) override;
        void setInactive() override;
        bool isActive() const override { return active_.load(); }
        const ClientIdentity& identity() const override { return identity_; }
        std::optional<ClientIdentity> getUpdatedIdentity() override;

    private:
        std::shared_ptr<ISendingLink> findLink(LinkType type, const char* operation) const;

        std::weak_ptr<ConnectionHandler> handler_;
        const ClientIdentity             identity_;
        std::atomic<bool>                active_{ true };
    };

}
