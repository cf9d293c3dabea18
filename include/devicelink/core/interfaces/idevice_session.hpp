/**
 * @file idevice_session.hpp
 * @brief Device session and its provider, as seen by the connection handler.
 */
#pragma once
#include <memory>
#include "devicelink/core/auth/ClientIdentity.hpp"
#include "devicelink/core/interfaces/idevice_proxy.hpp"

namespace devicelink {

    /**
     * @class IDeviceSession
     * @brief Logical device/module session, independent of the transport.
     */
    class IDeviceSession {
    public:
        virtual ~IDeviceSession() = default;

        /**
         * @brief Bind the proxy the session uses for outbound traffic. Called once.
         * @param proxy Proxy of the owning connection
         */
        virtual void bindProxy(std::shared_ptr<IDeviceProxy> proxy) = 0;

        /**
         * @brief Close the session. Expected to close the bound proxy in turn.
         *
         * Called without the registry lock held, so the proxy's send operations
         * may be used to flush pending traffic first.
         */
        virtual void close() = 0;
    };

    /**
     * @class ISessionProvider
     * @brief Creates device sessions for authenticated identities.
     */
    class ISessionProvider {
    public:
        virtual ~ISessionProvider() = default;

        /**
         * @brief Create the session for an identity.
         * @param identity Client identity
         * @return New session; implementations throw on failure
         */
        virtual std::shared_ptr<IDeviceSession> createSession(const ClientIdentity& identity) = 0;
    };

}
