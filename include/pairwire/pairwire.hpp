// This is the single entry point for the pairwire library.
// Include this file to get access to the core public API.

#pragma once

// Core data types and errors
#include "pairwire/core/types.hpp"
#include "pairwire/core/util/error_types.hpp"
#include "pairwire/core/util/logger.hpp"

// Packet model and stream framing
#include "pairwire/core/packet/packet.hpp"
#include "pairwire/core/packet/packet_framer.hpp"

// Identity handshake
#include "pairwire/core/identity/capability.hpp"
#include "pairwire/core/identity/identity_packet.hpp"

// Host configuration
#include "pairwire/core/interfaces/ihost_configuration.hpp"
#include "pairwire/core/config/host_configuration.hpp"

// Per-type validation
#include "pairwire/core/schema/schema_registry.hpp"
