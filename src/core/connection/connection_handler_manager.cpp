#include "devicelink/core/connection/connection_handler_manager.hpp"
#include "devicelink/core/util/logger.hpp"
#include <format>
#include <mutex>
#include <stdexcept>

using namespace devicelink;

ConnectionHandlerManager::ConnectionHandlerManager(ISessionProvider& provider,
                                                   std::shared_ptr<IClientConnection> connection,
                                                   ConnectionOptions options)
    : provider_(provider), connection_(std::move(connection)), options_(options)
{
    if (!connection_) {
        throw std::invalid_argument("ConnectionHandlerManager: connection is null");
    }
}

/*──────────────── Lookup or create ───────────────*/
std::shared_ptr<ConnectionHandler>
ConnectionHandlerManager::getOrCreate(const ClientIdentity& identity)
{
    {
        std::shared_lock rlk(mx_);
        if (auto it = handlers_.find(identity); it != handlers_.end())
            return it->second;
    }

    std::unique_lock wlk(mx_);
    // another caller may have won the race between the two locks
    if (auto it = handlers_.find(identity); it != handlers_.end())
        return it->second;

    auto handler = std::make_shared<ConnectionHandler>(identity, provider_, connection_, options_);
    handlers_.emplace(identity, handler);
    LOG_DEBUG(std::format("Created connection handler for {} ({} on this connection)",
        identity.id(), handlers_.size()));
    return handler;
}

std::shared_ptr<ConnectionHandler>
ConnectionHandlerManager::find(const ClientIdentity& identity) const
{
    std::shared_lock lk(mx_);
    if (auto it = handlers_.find(identity); it != handlers_.end())
        return it->second;
    return nullptr;
}

void ConnectionHandlerManager::remove(const ClientIdentity& identity)
{
    std::scoped_lock lk(mx_);
    if (handlers_.erase(identity) > 0) {
        LOG_DEBUG("Removed connection handler for " + identity.id());
    }
}

std::vector<ClientIdentity> ConnectionHandlerManager::listIdentities() const
{
    std::vector<ClientIdentity> out;
    std::shared_lock lk(mx_);
    out.reserve(handlers_.size());
    for (auto& [identity, _] : handlers_) out.emplace_back(identity);
    return out;
}

std::size_t ConnectionHandlerManager::size() const
{
    std::shared_lock lk(mx_);
    return handlers_.size();
}
