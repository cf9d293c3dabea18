/**
 * @file ilink.hpp
 * @brief Interfaces implemented by the per-role link handlers.
 *
 * Link handlers live in the protocol layer. They register themselves with the
 * connection handler when their link attaches and remove themselves when it
 * detaches.
 */
#pragma once
#include <chrono>
#include <string>
#include "devicelink/core/link/link_type.hpp"
#include "devicelink/core/message/message.hpp"

namespace devicelink {

    /**
     * @class ILink
     * @brief One open protocol link of a given role.
     */
    class ILink {
    public:
        virtual ~ILink() = default;

        /**
         * @brief Role of the link. Never changes.
         */
        virtual LinkType type() const = 0;

        /**
         * @brief Correlation id assigned when the link was opened. Never changes.
         *
         * Two links of a declared pair belong together when their ids are equal.
         */
        virtual const std::string& correlationId() const = 0;

        /**
         * @brief Close the link.
         *
         * Must not call back into ConnectionHandler::registerLink(), removeLink()
         * or the device proxy's send operations on the calling thread: the handler
         * may be holding its registry lock.
         *
         * @param timeout Upper bound for the close handshake
         * @throws GatewayError(GatewayErr::LinkCloseTimeout) when the bound is exceeded
         */
        virtual void close(std::chrono::milliseconds timeout) = 0;
    };

    /**
     * @class ISendingLink
     * @brief Link of a send-capable role (C2D, ModuleMessages, MethodSending, TwinSending).
     */
    class ISendingLink : public ILink {
    public:
        /**
         * @brief Forward a message to the client over this link.
         * @param message Message to send
         */
        virtual void sendMessage(Message message) = 0;
    };

}
