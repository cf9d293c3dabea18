/**
 * @file connection_handler.hpp
 * @brief ConnectionHandler: links, session and proxy of one client on a connection.
 *
 * Every link handler of a client calls registerLink() when its link attaches and
 * removeLink() when it detaches. The device session is created on first use and
 * reaches the client back through a DeviceProxy that routes each outbound
 * message to the link of the matching role. When the last link goes away the
 * session is closed, which in turn closes the physical connection.
 */
#pragma once
#include <cstddef>
#include <memory>
#include "devicelink/core/auth/ClientIdentity.hpp"
#include "devicelink/core/interfaces/iclient_connection.hpp"
#include "devicelink/core/interfaces/idevice_session.hpp"
#include "devicelink/core/interfaces/ilink.hpp"
#include "devicelink/core/link/link_type.hpp"
#include "devicelink/core/util/options.hpp"

namespace devicelink {

    class DeviceProxy;

    /**
     * @class ConnectionHandler
     * @brief Per-client link registry, session gate and outbound proxy.
     *
     * Must be owned by a std::shared_ptr: the proxy handed to the session keeps a
     * weak reference back to its handler.
     *
     * Two independent locks are used. The session lock guards session creation and
     * teardown; the registry lock guards link registration and removal. They are
     * never held together: removing the last link releases the registry lock
     * before the session is closed.
     */
    class ConnectionHandler : public std::enable_shared_from_this<ConnectionHandler> {
    public:
        /**
         * @brief Construct a handler.
         * @param identity Client identity
         * @param provider Session provider; must outlive the handler
         * @param connection Physical connection the links run on
         * @param options Connection options
         * @throws std::invalid_argument if connection is null
         */
        ConnectionHandler(ClientIdentity identity,
                          ISessionProvider& provider,
                          std::shared_ptr<IClientConnection> connection,
                          ConnectionOptions options = {});

        ~ConnectionHandler();

        ConnectionHandler(const ConnectionHandler&) = delete;
        ConnectionHandler& operator=(const ConnectionHandler&) = delete;

        /**
         * @brief Session of this client, created and bound on first use.
         *
         * Concurrent first callers block until the single creation finishes and all
         * receive the same instance. If the provider throws, the exception reaches
         * the caller and the next call tries again.
         *
         * @return The device session
         */
        std::shared_ptr<IDeviceSession> getSession();

        /**
         * @brief Register a newly attached link.
         *
         * Closes the link currently holding the same role, and the link holding the
         * paired role when its correlation id differs, before installing @p link.
         *
         * @param link Attached link
         * @throws std::invalid_argument for a null or mistyped link
         * @throws whatever ILink::close() throws; the registry is then unchanged
         */
        void registerLink(std::shared_ptr<ILink> link);

        /**
         * @brief Unregister a detached link.
         *
         * A link that no longer holds its role (it was superseded) is ignored.
         * Removing the last link closes the session; the session may still send
         * through its proxy while it closes.
         *
         * @param link Detached link
         * @throws std::invalid_argument if link is null
         * @throws whatever IDeviceSession::close() throws; the link is removed regardless
         */
        void removeLink(const std::shared_ptr<ILink>& link);

        /**
         * @brief Link currently registered for a role, or nullptr.
         */
        std::shared_ptr<ILink> findLink(LinkType type) const;

        /**
         * @brief Number of registered links.
         */
        std::size_t linkCount() const;

        const ClientIdentity& identity() const;

    private:
        friend class DeviceProxy;

        void closeConnection();

        // PIMPL idiom
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
