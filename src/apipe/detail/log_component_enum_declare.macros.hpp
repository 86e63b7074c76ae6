/// @cond
// -^- Doxygen, please ignore the following.  This is macro magic and not a regular `#pragma once` header.

// Log call sites that belong to no particular module.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Pipe-pair establishment: name generation, retries, handshake.
FLOW_LOG_CFG_COMPONENT_DEFINE(PIPE, 1)
// Logging from test code.
FLOW_LOG_CFG_COMPONENT_DEFINE(TEST, 2)

// -v- Doxygen, please stop ignoring.
/// @endcond
