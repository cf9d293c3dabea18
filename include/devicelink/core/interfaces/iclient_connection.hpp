/**
 * @file iclient_connection.hpp
 * @brief Physical client connection carrying the links.
 */
#pragma once

namespace devicelink {

    /**
     * @class IClientConnection
     * @brief The underlying transport connection shared by every link of a client.
     */
    class IClientConnection {
    public:
        virtual ~IClientConnection() = default;
        /**
         * @brief Close the transport connection.
         */
        virtual void close() = 0;
    };

}
