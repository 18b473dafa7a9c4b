#pragma once

#include "selsync/core/types.h"
#include <cstdint>

namespace selsync {

class SelectionEngine;

/**
 * Decodes one command and applies it to the engine at time `now`.
 * Acts as the callback body for parseCommandBuffer.
 */
EngineError dispatchCommand(
    SelectionEngine* engine,
    TimeMs now,
    std::uint32_t op,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
);

// Decode-only pass used to reject a malformed buffer before anything applies.
EngineError validateCommand(
    std::uint32_t op,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
);

} // namespace selsync
