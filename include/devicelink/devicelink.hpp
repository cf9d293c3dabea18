// This is the single entry point for the devicelink library.
// Include this file to get access to the core public API.

#pragma once

// Connection handling
#include "devicelink/core/connection/connection_handler.hpp"
#include "devicelink/core/connection/connection_handler_manager.hpp"

// Client identity and configuration
#include "devicelink/core/auth/ClientIdentity.hpp"
#include "devicelink/core/util/options.hpp"
#include "devicelink/core/util/error_types.hpp"

// Messages
#include "devicelink/core/message/message.hpp"
#include "devicelink/core/message/direct_method.hpp"

// Interfaces implemented by the protocol and session layers
#include "devicelink/core/link/link_type.hpp"
#include "devicelink/core/interfaces/ilink.hpp"
#include "devicelink/core/interfaces/iclient_connection.hpp"
#include "devicelink/core/interfaces/idevice_proxy.hpp"
#include "devicelink/core/interfaces/idevice_session.hpp"
