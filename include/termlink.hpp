#pragma once

/*
===============================================================================
termlink - Public API Entry Point
===============================================================================

gateway::Client is the ready-to-use session over the MT5 gRPC gateway.
The configuration layer loads and validates its settings.

The generic session engine (termlink/core/session/engine.hpp) is available
for custom account and channel types.
===============================================================================
*/

#include <termlink/config/config.hpp>
#include <termlink/config/loader.hpp>
#include <termlink/core/session/error.hpp>
#include <termlink/core/session/state.hpp>
#include <termlink/gateway/client.hpp>
