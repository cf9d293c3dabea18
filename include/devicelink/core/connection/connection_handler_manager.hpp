/**
 * @file connection_handler_manager.hpp
 * @brief Keeps one ConnectionHandler per client identity on a physical connection.
 *
 * A single transport connection may multiplex links of several clients (a device
 * and its modules, or clients behind a downstream gateway). Link handlers look
 * up the handler of their client here.
 */
#pragma once
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "devicelink/core/auth/ClientIdentity.hpp"
#include "devicelink/core/connection/connection_handler.hpp"
#include "devicelink/core/interfaces/iclient_connection.hpp"
#include "devicelink/core/interfaces/idevice_session.hpp"
#include "devicelink/core/util/options.hpp"

namespace devicelink {

    /**
     * @class ConnectionHandlerManager
     * @brief Identity → ConnectionHandler map for one physical connection.
     */
    class ConnectionHandlerManager {
    public:
        /**
         * @param provider Session provider handed to every handler; must outlive the manager
         * @param connection Physical connection shared by every handler
         * @param options Options handed to every handler
         * @throws std::invalid_argument if connection is null
         */
        ConnectionHandlerManager(ISessionProvider& provider,
                                 std::shared_ptr<IClientConnection> connection,
                                 ConnectionOptions options = {});

        /**
         * @brief Handler of an identity, created on first request.
         *
         * Concurrent callers with equal identities receive the same handler.
         * @param identity Client identity
         * @return Shared pointer to the handler
         */
        std::shared_ptr<ConnectionHandler> getOrCreate(const ClientIdentity& identity);

        /**
         * @brief Handler of an identity.
         * @return Shared pointer to the handler (nullptr if not found)
         */
        std::shared_ptr<ConnectionHandler> find(const ClientIdentity& identity) const;

        /**
         * @brief Forget the handler of an identity. Unknown identities are ignored.
         */
        void remove(const ClientIdentity& identity);

        /**
         * @brief Identities with a handler.
         */
        std::vector<ClientIdentity> listIdentities() const;

        std::size_t size() const;

    private:
        ISessionProvider&                  provider_;
        std::shared_ptr<IClientConnection> connection_;
        ConnectionOptions                  options_;

        std::unordered_map<ClientIdentity, std::shared_ptr<ConnectionHandler>> handlers_;
        mutable std::shared_mutex mx_;        // ← RW-lock
    };

}
