/**
 * @file options.hpp
 * @brief Per-connection configuration for devicelink.
 */
#pragma once
#include <chrono>

namespace devicelink {

    /**
     * @struct ConnectionOptions
     * @brief Configuration shared by the connection handlers of one physical connection.
     */
    struct ConnectionOptions {
        /// Bound handed to ILink::close() when a link is superseded or uncorrelated
        std::chrono::milliseconds linkCloseTimeout{ 20'000 };
    };

}
