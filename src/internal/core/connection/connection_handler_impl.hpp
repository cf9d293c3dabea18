/**
 * @file connection_handler_impl.hpp
 * @brief Private state of ConnectionHandler, shared with DeviceProxy.
 */
#pragma once
#include <memory>
#include <mutex>
#include "devicelink/core/connection/connection_handler.hpp"
#include "internal/core/link/link_registry.hpp"

namespace devicelink {

    struct ConnectionHandler::Impl {
        const ClientIdentity                identity_;
        ISessionProvider&                   provider_;
        std::shared_ptr<IClientConnection>  connection_;
        ConnectionOptions                   options_;

        LinkRegistry                        registry_;

        /* session domain */
        std::once_flag                      sessionOnce_;
        std::mutex                          sessionMx_;
        std::shared_ptr<IDeviceSession>     session_;

        Impl(ClientIdentity identity,
             ISessionProvider& provider,
             std::shared_ptr<IClientConnection> connection,
             ConnectionOptions options)
            : identity_(std::move(identity)),
              provider_(provider),
              connection_(std::move(connection)),
              options_(options),
              registry_(identity_.id()) {}
    };

}
