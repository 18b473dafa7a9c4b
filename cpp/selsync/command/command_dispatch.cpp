#include "selsync/command/command_dispatch.h"
#include "selsync/command/commands.h"
#include "selsync/core/logging.h"
#include "selsync/engine.h"

namespace selsync {

EngineError validateCommand(
    std::uint32_t op,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
) {
    DecodedCommand cmd;
    return decodeCommand(op, payload, payloadByteCount, cmd);
}

EngineError dispatchCommand(
    SelectionEngine* self,
    TimeMs now,
    std::uint32_t op,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
) {
    DecodedCommand cmd;
    const EngineError decodeErr = decodeCommand(op, payload, payloadByteCount, cmd);
    if (decodeErr != EngineError::Ok) return decodeErr;

    switch (cmd.op) {
        case CommandOp::SelectionUpdate:
            return self->applySelectionUpdate(cmd.selection, now);
        case CommandOp::RemoveUser:
            return self->removeUser(cmd.userId, now);
        case CommandOp::AcquireOwnership: {
            const AcquireResult result = self->requestOwnership(cmd.ownership, now);
            if (result.granted) return EngineError::Ok;
            return result.status == AcquireStatus::RejectedInvalid ? EngineError::InvalidArgument : EngineError::Rejected;
        }
        case CommandOp::RenewOwnership:
            return self->renewOwnership(cmd.ownership.elementId, cmd.ownership.userId, cmd.ownership.ttlMs, now);
        case CommandOp::ReleaseOwnership:
            return self->releaseOwnership(cmd.elementId, cmd.userId, now);
        case CommandOp::ResolveConflict:
            return self->resolveConflict(cmd.resolution, now).error;
        case CommandOp::SetViewport:
            return self->setViewport(cmd.viewport);
        case CommandOp::InvalidateBounds:
            if (cmd.elementId.empty()) {
                self->invalidateAllBounds();
            } else {
                self->invalidateBounds(cmd.elementId);
            }
            return EngineError::Ok;
        case CommandOp::Tick:
            self->tick(now);
            return EngineError::Ok;
    }

    SELSYNC_LOG_WARN("dispatchCommand: unhandled op %u", op);
    return EngineError::UnknownCommand;
}

} // namespace selsync
