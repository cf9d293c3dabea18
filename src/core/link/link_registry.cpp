#include "internal/core/link/link_registry.hpp"
#include "devicelink/core/util/logger.hpp"
#include <format>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace devicelink {

    LinkRegistry::LinkRegistry(std::string owner)
        : owner_(std::move(owner)) {}

    void LinkRegistry::add(std::shared_ptr<ILink> link, std::chrono::milliseconds closeTimeout)
    {
        if (!link) {
            throw std::invalid_argument("LinkRegistry::add: link is null");
        }
        const LinkType type = link->type();
        if (isSendingLinkType(type) && !dynamic_cast<ISendingLink*>(link.get())) {
            throw std::invalid_argument(std::format(
                "LinkRegistry::add: {} link must implement ISendingLink", toString(type)));
        }

        std::unique_lock lk(mx_);

        // 1. Supersede the current holder of the role
        auto current = links_.find(type);
        const bool superseding = current != links_.end() && current->second != link;
        if (superseding) {
            LOG_DEBUG(std::format("Closing superseded {} link for {}", toString(type), owner_));
            current->second->close(closeTimeout);
        }

        // 2. Evict the other half of the pair when it belongs to another correlation
        if (auto paired = pairedLinkType(type)) {
            auto it = links_.find(*paired);
            if (it != links_.end() && it->second->correlationId() != link->correlationId()) {
                LOG_DEBUG(std::format("Closing uncorrelated {} link for {} (cid '{}' != '{}')",
                    toString(*paired), owner_, it->second->correlationId(), link->correlationId()));
                try {
                    it->second->close(closeTimeout);
                }
                catch (const std::exception& ex) {
                    // the superseded link is already closed and must not keep its role
                    if (superseding) links_.erase(type);
                    LOG_ERROR(std::format("Closing uncorrelated {} link for {} failed: {}",
                        toString(*paired), owner_, ex.what()));
                    throw;
                }
                links_.erase(*paired);
            }
        }

        // 3. Install
        links_[type] = std::move(link);
        LOG_DEBUG(std::format("Registered {} link for {}", toString(type), owner_));
    }

    RemoveResult LinkRegistry::remove(const ILink& link)
    {
        std::unique_lock lk(mx_);
        auto it = links_.find(link.type());
        if (it == links_.end() || it->second.get() != &link) {
            return RemoveResult::NotRegistered;
        }
        links_.erase(it);
        LOG_DEBUG(std::format("Removed {} link for {}", toString(link.type()), owner_));
        return links_.empty() ? RemoveResult::Drained : RemoveResult::Removed;
    }

    std::shared_ptr<ILink> LinkRegistry::find(LinkType type) const
    {
        std::shared_lock lk(mx_);
        if (auto it = links_.find(type); it != links_.end())
            return it->second;
        return nullptr;
    }

    std::shared_ptr<ISendingLink> LinkRegistry::findSending(LinkType type) const
    {
        if (!isSendingLinkType(type)) return nullptr;
        // add() guarantees every send-capable role holds an ISendingLink
        return std::static_pointer_cast<ISendingLink>(find(type));
    }

    std::size_t LinkRegistry::size() const
    {
        std::shared_lock lk(mx_);
        return links_.size();
    }

    bool LinkRegistry::empty() const
    {
        return size() == 0;
    }

}
