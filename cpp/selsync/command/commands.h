#ifndef SELSYNC_COMMAND_COMMANDS_H
#define SELSYNC_COMMAND_COMMANDS_H

#include "selsync/core/types.h"
#include "selsync/ownership/ownership_manager.h"
#include "selsync/protocol/protocol_types.h"
#include "selsync/render/viewport_culler.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace selsync {

// Command buffer layout (little-endian):
//   header   : u32 magic "SSCB", u32 version, u32 commandCount, u32 reserved, f64 nowMs
//   command  : u32 op, u32 reserved, u32 payloadByteCount, u32 reserved, payload
//   string   : u32 byteLength, bytes (no terminator)
enum class CommandOp : std::uint32_t {
    SelectionUpdate = 1,
    RemoveUser = 2,
    AcquireOwnership = 3,
    RenewOwnership = 4,
    ReleaseOwnership = 5,
    ResolveConflict = 6,
    SetViewport = 7,
    InvalidateBounds = 8,
    Tick = 9,
};

static constexpr std::uint32_t kSelectionFlagActive = 1u << 0;
static constexpr std::uint32_t kSelectionFlagMultiSelect = 1u << 1;
static constexpr std::uint32_t kSelectionFlagHasBounds = 1u << 2;
static constexpr std::uint32_t kOwnershipFlagHardLock = 1u << 0;

// SelectionUpdate: header, then userId, userName, userColor, whiteboardId,
// sessionId and elementCount element ids as strings.
struct SelectionUpdatePayloadHeader {
    std::int32_t priority;
    std::uint32_t flags;
    double timestamp;
    double lastSeen;
    float boundsX, boundsY, boundsW, boundsH;
    std::uint32_t elementCount;
    std::uint32_t reserved;
};
static_assert(sizeof(SelectionUpdatePayloadHeader) == 48, "SelectionUpdatePayloadHeader size mismatch");

// AcquireOwnership / RenewOwnership: header, then elementId and userId.
struct OwnershipPayloadHeader {
    double ttlMs;
    std::int32_t priority;
    std::uint32_t reason;
    std::uint32_t flags;
    std::uint32_t reserved;
};
static_assert(sizeof(OwnershipPayloadHeader) == 24, "OwnershipPayloadHeader size mismatch");

// ResolveConflict: header, then conflictId and resolverId.
struct ResolveConflictPayloadHeader {
    std::uint32_t resolution;
    std::uint32_t reserved;
};
static_assert(sizeof(ResolveConflictPayloadHeader) == 8, "ResolveConflictPayloadHeader size mismatch");

struct ViewportPayload {
    float x, y, width, height;
    float translateX, translateY, zoom;
    float reserved;
};
static_assert(sizeof(ViewportPayload) == 32, "ViewportPayload size mismatch");

struct CommandBufferHeader {
    std::uint32_t magic;
    std::uint32_t version;
    std::uint32_t commandCount;
    double nowMs;
};

// Fully decoded command. Only the fields of `op` are meaningful.
struct DecodedCommand {
    CommandOp op{CommandOp::Tick};
    protocol::SelectionUpdateEvent selection;
    OwnershipRequest ownership;
    protocol::ConflictResolutionCommand resolution;
    Viewport viewport;
    std::string userId;    // RemoveUser, ReleaseOwnership
    std::string elementId; // ReleaseOwnership, InvalidateBounds
};

using CommandCallback = EngineError(*)(void* ctx, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount);

// Reads and checks the buffer header.
EngineError readCommandBufferHeader(const std::uint8_t* src, std::uint32_t byteCount, CommandBufferHeader& out);

// Parse a command buffer and invoke the callback for each command in order.
// Framing errors stop parsing and are returned. Callback errors do not stop
// parsing; the first one is returned.
EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx);

// Decodes one payload. Trailing bytes are an InvalidPayloadSize error.
EngineError decodeCommand(std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount, DecodedCommand& out);

// Builds command buffers for native hosts and tests.
class CommandBufferWriter {
public:
    explicit CommandBufferWriter(double nowMs = 0.0) : nowMs_(nowMs) {}

    void setNow(double nowMs) { nowMs_ = nowMs; }
    std::uint32_t commandCount() const { return commandCount_; }

    CommandBufferWriter& selectionUpdate(const protocol::SelectionUpdateEvent& event);
    CommandBufferWriter& removeUser(const std::string& userId);
    CommandBufferWriter& acquireOwnership(const OwnershipRequest& request);
    CommandBufferWriter& renewOwnership(const std::string& elementId, const std::string& userId, TimeMs ttlMs);
    CommandBufferWriter& releaseOwnership(const std::string& elementId, const std::string& userId);
    CommandBufferWriter& resolveConflict(const protocol::ConflictResolutionCommand& command);
    CommandBufferWriter& setViewport(const Viewport& viewport);
    CommandBufferWriter& invalidateBounds(const std::string& elementId);
    CommandBufferWriter& tick();

    std::vector<std::uint8_t> finish() const;

private:
    double nowMs_;
    std::uint32_t commandCount_ = 0;
    std::vector<std::uint8_t> body_;

    void append(CommandOp op, const std::vector<std::uint8_t>& payload);
};

} // namespace selsync

#endif // SELSYNC_COMMAND_COMMANDS_H
