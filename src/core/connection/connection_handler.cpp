#include "devicelink/core/connection/connection_handler.hpp"
#include "internal/core/connection/connection_handler_impl.hpp"
#include "internal/core/connection/device_proxy.hpp"
#include "devicelink/core/util/error_types.hpp"
#include "devicelink/core/util/logger.hpp"
#include <format>
#include <stdexcept>

namespace devicelink {

    ConnectionHandler::ConnectionHandler(ClientIdentity identity,
                                         ISessionProvider& provider,
                                         std::shared_ptr<IClientConnection> connection,
                                         ConnectionOptions options)
    {
        if (!connection) {
            throw std::invalid_argument("ConnectionHandler: connection is null");
        }
        pImpl_ = std::make_unique<Impl>(std::move(identity), provider, std::move(connection), options);
    }

    ConnectionHandler::~ConnectionHandler() = default;

    const ClientIdentity& ConnectionHandler::identity() const {
        return pImpl_->identity_;
    }

    /*──────────────── Session gate ───────────────*/
    std::shared_ptr<IDeviceSession> ConnectionHandler::getSession()
    {
        std::weak_ptr<ConnectionHandler> self = weak_from_this();
        if (self.expired()) {
            throw std::logic_error("ConnectionHandler must be owned by a std::shared_ptr");
        }

        // A throwing provider leaves the flag unset, so the next caller retries.
        std::call_once(pImpl_->sessionOnce_, [this, &self] {
            std::scoped_lock lk(pImpl_->sessionMx_);
            auto session = pImpl_->provider_.createSession(pImpl_->identity_);
            if (!session) {
                throw GatewayError(GatewayErr::SessionCreation,
                    "Session provider returned no session for " + pImpl_->identity_.id());
            }
            session->bindProxy(std::make_shared<DeviceProxy>(self, pImpl_->identity_));
            pImpl_->session_ = std::move(session);
            LOG_DEBUG("Created device session for " + pImpl_->identity_.id());
        });
        return pImpl_->session_;
    }

    /*──────────────── Link registry ───────────────*/
    void ConnectionHandler::registerLink(std::shared_ptr<ILink> link)
    {
        pImpl_->registry_.add(std::move(link), pImpl_->options_.linkCloseTimeout);
    }

    void ConnectionHandler::removeLink(const std::shared_ptr<ILink>& link)
    {
        if (!link) {
            throw std::invalid_argument("ConnectionHandler::removeLink: link is null");
        }
        // Teardown runs after the registry lock is released: the session may
        // still send through its proxy while closing.
        if (pImpl_->registry_.remove(*link) == RemoveResult::Drained) {
            LOG_DEBUG(std::format("All links closed for client {} on the connection", pImpl_->identity_.id()));
            closeConnection();
        }
    }

    std::shared_ptr<ILink> ConnectionHandler::findLink(LinkType type) const {
        return pImpl_->registry_.find(type);
    }

    std::size_t ConnectionHandler::linkCount() const {
        return pImpl_->registry_.size();
    }

    /*──────────────── Teardown ───────────────*/
    void ConnectionHandler::closeConnection()
    {
        std::scoped_lock lk(pImpl_->sessionMx_);
        LOG_DEBUG("Closing underlying connection for client " + pImpl_->identity_.id());
        if (!pImpl_->session_) return;

        try {
            pImpl_->session_->close();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(std::format("Closing session for {} failed: {}", pImpl_->identity_.id(), ex.what()));
            throw;
        }
    }

}
