/**
 * @file link_registry.hpp
 * @brief Role → link table of one client connection.
 *
 * Keeps at most one link per LinkType and never lets the two halves of a
 * declared pair stay registered with different correlation ids. All mutation
 * happens under an exclusive lock; lookups take a shared lock and hand out a
 * shared_ptr so the caller can send without holding it.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <folly/SharedMutex.h>
#include <folly/container/F14Map.h>
#include "devicelink/core/interfaces/ilink.hpp"
#include "devicelink/core/link/link_type.hpp"

namespace devicelink {

    /// Outcome of LinkRegistry::remove().
    enum class RemoveResult {
        NotRegistered, ///< The link does not hold its role
        Removed,       ///< Removed, other links remain
        Drained        ///< Removed, and the table is now empty
    };

    /**
     * @class LinkRegistry
     * @brief Serialized role → link map with pair correlation enforcement.
     */
    class LinkRegistry {
    public:
        /**
         * @param owner Identity string used in log lines
         */
        explicit LinkRegistry(std::string owner);

        LinkRegistry(const LinkRegistry&) = delete;
        LinkRegistry& operator=(const LinkRegistry&) = delete;

        /**
         * @brief Install a link at its role.
         *
         * Under the exclusive lock:
         *  1. a different link already holding the role is closed,
         *  2. a link holding the paired role with another correlation id is
         *     closed and dropped,
         *  3. the new link is stored.
         * If the close in step 1 throws, the exception propagates and the table is
         * left as it was. If step 1 succeeded and the close in step 2 throws, the
         * link closed in step 1 is dropped before the exception propagates, so no
         * closed link stays installed.
         *
         * @param link Link to install
         * @param closeTimeout Bound passed to ILink::close()
         * @throws std::invalid_argument for a null link, or a send-capable role whose
         *         link does not implement ISendingLink
         */
        void add(std::shared_ptr<ILink> link, std::chrono::milliseconds closeTimeout);

        /**
         * @brief Remove a link if it is the one currently registered for its role.
         *
         * A link that was superseded no longer holds its role and is ignored.
         *
         * @param link Link to remove
         * @return Drained when this removal emptied the table. Exactly one
         *         concurrent remover observes a given drain.
         */
        RemoveResult remove(const ILink& link);

        /**
         * @brief Link currently registered for a role.
         * @return The link, or nullptr
         */
        std::shared_ptr<ILink> find(LinkType type) const;

        /**
         * @brief Sending link currently registered for a send-capable role.
         * @return The link, or nullptr (also for roles that do not send)
         */
        std::shared_ptr<ISendingLink> findSending(LinkType type) const;

        std::size_t size() const;
        bool empty() const;

    private:
        std::string owner_;
        folly::F14FastMap<LinkType, std::shared_ptr<ILink>, std::hash<LinkType>> links_;
        mutable folly::SharedMutex mx_;
    };

}
