#include "internal/core/connection/device_proxy.hpp"
#include "internal/core/connection/connection_handler_impl.hpp"
#include "devicelink/core/util/error_types.hpp"
#include "devicelink/core/util/logger.hpp"
#include "devicelink/core/util/url_encode.hpp"
#include <format>

namespace devicelink {

    namespace {
        std::string describe(const std::exception_ptr& error) {
            if (!error) return "no error";
            try {
                std::rethrow_exception(error);
            }
            catch (const std::exception& ex) {
                return ex.what();
            }
            catch (...) {
                return "unknown error";
            }
        }
    }

    DeviceProxy::DeviceProxy(std::weak_ptr<ConnectionHandler> handler, ClientIdentity identity)
        : handler_(std::move(handler)), identity_(std::move(identity)) {}

    std::shared_ptr<ISendingLink> DeviceProxy::findLink(LinkType type, const char* operation) const
    {
        std::shared_ptr<ISendingLink> link;
        if (auto handler = handler_.lock()) {
            link = handler->pImpl_->registry_.findSending(type);
        }
        if (!link) {
            LOG_WARN(std::format("Unable to send {} to {} because {} link was not found.",
                operation, identity_.id(), toString(type)));
        }
        return link;
    }

    void DeviceProxy::sendC2DMessage(Message message)
    {
        auto link = findLink(LinkType::C2D, "C2D message");
        if (!link) return;

        message.systemProperties()[SystemProperties::To] = deviceAddress(identity_);
        LOG_DEBUG("Sending C2D message to " + identity_.id());
        link->sendMessage(std::move(message));
    }

    void DeviceProxy::sendMessage(Message message, const std::string& input)
    {
        auto link = findLink(LinkType::ModuleMessages, "message");
        if (!link) return;

        message.systemProperties()[SystemProperties::InputName] = input;
        LOG_DEBUG("Sending telemetry message to " + identity_.id());
        link->sendMessage(std::move(message));
    }

    DirectMethodResponse DeviceProxy::invokeMethod(const DirectMethodRequest& request)
    {
        auto link = findLink(LinkType::MethodSending, "method request");
        if (!link) return DirectMethodResponse{};

        Message message(request.data);
        message.properties()[MethodNamePropertyKey] = request.name;
        message.systemProperties()[SystemProperties::CorrelationId] = request.correlationId;
        link->sendMessage(std::move(message));
        LOG_DEBUG(std::format("Sent method invocation '{}' to {}", request.name, identity_.id()));

        // The device's reply arrives on the MethodReceiving link, outside this proxy.
        return DirectMethodResponse{ request.correlationId };
    }

    void DeviceProxy::onDesiredPropertyUpdates(Message desiredProperties)
    {
        auto link = findLink(LinkType::TwinSending, "desired properties update");
        if (!link) return;

        LOG_DEBUG("Sending desired properties update to " + identity_.id());
        link->sendMessage(std::move(desiredProperties));
    }

    void DeviceProxy::sendTwinUpdate(Message twin)
    {
        auto link = findLink(LinkType::TwinSending, "twin update");
        if (!link) return;

        LOG_DEBUG("Sending twin update to " + identity_.id());
        link->sendMessage(std::move(twin));
    }

    void DeviceProxy::close(std::exception_ptr error)
    {
        if (!active_.exchange(false)) return;

        LOG_INFO(std::format("Closing device proxy for {}: {}", identity_.id(), describe(error)));
        if (auto handler = handler_.lock()) {
            handler->pImpl_->connection_->close();
        }
        else {
            LOG_DEBUG("Connection handler for " + identity_.id() + " already released");
        }
    }

    void DeviceProxy::setInactive()
    {
        LOG_INFO("Setting proxy inactive for " + identity_.id());
        active_.store(false);
    }

    std::optional<ClientIdentity> DeviceProxy::getUpdatedIdentity()
    {
        throw GatewayError(GatewayErr::NotSupported,
            "Updated identity is not available for " + identity_.id());
    }

}
