#include "selsync/command/commands.h"
#include "selsync/core/util.h"

#include <cstring>

namespace selsync {

namespace {

class PayloadReader {
public:
    PayloadReader(const std::uint8_t* data, std::uint32_t size) : data_(data), size_(size) {}

    template <typename T>
    bool readPod(T& out) {
        if (remaining() < sizeof(T)) return false;
        std::memcpy(&out, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return true;
    }

    bool readString(std::string& out) {
        if (remaining() < 4) return false;
        const std::uint32_t len = readU32(data_, offset_);
        offset_ += 4;
        if (remaining() < len) return false;
        out.assign(reinterpret_cast<const char*>(data_ + offset_), len);
        offset_ += len;
        return true;
    }

    std::size_t remaining() const { return size_ - offset_; }
    bool atEnd() const { return offset_ == size_; }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
};

void pushBytes(std::vector<std::uint8_t>& out, const void* data, std::size_t len) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    out.insert(out.end(), p, p + len);
}

template <typename T>
void pushPod(std::vector<std::uint8_t>& out, const T& v) {
    pushBytes(out, &v, sizeof(T));
}

void pushString(std::vector<std::uint8_t>& out, const std::string& s) {
    const std::uint32_t len = static_cast<std::uint32_t>(s.size());
    pushPod(out, len);
    pushBytes(out, s.data(), s.size());
}

} // namespace

EngineError readCommandBufferHeader(const std::uint8_t* src, std::uint32_t byteCount, CommandBufferHeader& out) {
    if (!src || byteCount < commandHeaderBytes) {
        return EngineError::BufferTruncated;
    }
    out.magic = readU32(src, 0);
    if (out.magic != commandMagicSscb) {
        return EngineError::InvalidMagic;
    }
    out.version = readU32(src, 4);
    if (out.version != commandVersionSscb) {
        return EngineError::UnsupportedVersion;
    }
    out.commandCount = readU32(src, 8);
    out.nowMs = readF64(src, 16);
    return EngineError::Ok;
}

EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx) {
    CommandBufferHeader header{};
    const EngineError headerErr = readCommandBufferHeader(src, byteCount, header);
    if (headerErr != EngineError::Ok) return headerErr;

    EngineError firstError = EngineError::Ok;
    std::size_t o = commandHeaderBytes;
    for (std::uint32_t i = 0; i < header.commandCount; i++) {
        if (o + perCommandHeaderBytes > byteCount) {
            return EngineError::BufferTruncated;
        }
        const std::uint32_t op = readU32(src, o); o += 4;
        o += 4; // reserved
        const std::uint32_t payloadByteCount = readU32(src, o); o += 4;
        o += 4; // reserved

        if (payloadByteCount > byteCount - o) {
            return EngineError::BufferTruncated;
        }

        if (cb) {
            const EngineError err = cb(ctx, op, src + o, payloadByteCount);
            if (err != EngineError::Ok && firstError == EngineError::Ok) {
                firstError = err;
            }
        }
        o += payloadByteCount;
    }
    return firstError;
}

EngineError decodeCommand(std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount, DecodedCommand& out) {
    PayloadReader r(payload, payloadByteCount);

    switch (op) {
        case static_cast<std::uint32_t>(CommandOp::SelectionUpdate): {
            SelectionUpdatePayloadHeader hdr;
            if (!r.readPod(hdr)) return EngineError::InvalidPayloadSize;
            auto& ev = out.selection;
            if (!r.readString(ev.userId) || !r.readString(ev.userName) || !r.readString(ev.userColor)
                || !r.readString(ev.whiteboardId) || !r.readString(ev.sessionId)) {
                return EngineError::InvalidPayloadSize;
            }
            // Every id needs at least its length prefix.
            if (hdr.elementCount > r.remaining() / 4) return EngineError::InvalidPayloadSize;
            ev.elementIds.clear();
            ev.elementIds.resize(hdr.elementCount);
            for (auto& id : ev.elementIds) {
                if (!r.readString(id)) return EngineError::InvalidPayloadSize;
            }
            if (!r.atEnd()) return EngineError::InvalidPayloadSize;

            ev.priority = hdr.priority;
            ev.timestamp = msToTime(hdr.timestamp);
            ev.lastSeen = msToTime(hdr.lastSeen);
            ev.isActive = (hdr.flags & kSelectionFlagActive) != 0;
            ev.isMultiSelect = (hdr.flags & kSelectionFlagMultiSelect) != 0;
            if (hdr.flags & kSelectionFlagHasBounds) {
                ev.selectionBounds = Box{hdr.boundsX, hdr.boundsY, hdr.boundsW, hdr.boundsH};
            } else {
                ev.selectionBounds.reset();
            }
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::RemoveUser): {
            if (!r.readString(out.userId) || !r.atEnd()) return EngineError::InvalidPayloadSize;
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::AcquireOwnership):
        case static_cast<std::uint32_t>(CommandOp::RenewOwnership): {
            OwnershipPayloadHeader hdr;
            if (!r.readPod(hdr)) return EngineError::InvalidPayloadSize;
            auto& req = out.ownership;
            if (!r.readString(req.elementId) || !r.readString(req.userId) || !r.atEnd()) {
                return EngineError::InvalidPayloadSize;
            }
            if (hdr.reason > static_cast<std::uint32_t>(LockReason::Manual)) return EngineError::InvalidArgument;
            req.ttlMs = msToTime(hdr.ttlMs);
            req.priority = hdr.priority;
            req.reason = static_cast<LockReason>(hdr.reason);
            req.hardLock = (hdr.flags & kOwnershipFlagHardLock) != 0;
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ReleaseOwnership): {
            if (!r.readString(out.elementId) || !r.readString(out.userId) || !r.atEnd()) {
                return EngineError::InvalidPayloadSize;
            }
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ResolveConflict): {
            ResolveConflictPayloadHeader hdr;
            if (!r.readPod(hdr)) return EngineError::InvalidPayloadSize;
            auto& cmd = out.resolution;
            if (!r.readString(cmd.conflictId) || !r.readString(cmd.resolverId) || !r.atEnd()) {
                return EngineError::InvalidPayloadSize;
            }
            if (hdr.resolution > static_cast<std::uint32_t>(ResolutionAction::Cancel)) return EngineError::InvalidArgument;
            cmd.resolution = static_cast<ResolutionAction>(hdr.resolution);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetViewport): {
            if (payloadByteCount != sizeof(ViewportPayload)) return EngineError::InvalidPayloadSize;
            ViewportPayload p;
            std::memcpy(&p, payload, sizeof(ViewportPayload));
            out.viewport = Viewport{p.x, p.y, p.width, p.height, CanvasTransform{p.translateX, p.translateY, p.zoom}};
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::InvalidateBounds): {
            if (!r.readString(out.elementId) || !r.atEnd()) return EngineError::InvalidPayloadSize;
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::Tick): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            break;
        }
        default:
            return EngineError::UnknownCommand;
    }

    out.op = static_cast<CommandOp>(op);
    return EngineError::Ok;
}

// =============================================================================
// CommandBufferWriter
// =============================================================================

void CommandBufferWriter::append(CommandOp op, const std::vector<std::uint8_t>& payload) {
    pushPod(body_, static_cast<std::uint32_t>(op));
    pushPod(body_, std::uint32_t{0});
    pushPod(body_, static_cast<std::uint32_t>(payload.size()));
    pushPod(body_, std::uint32_t{0});
    body_.insert(body_.end(), payload.begin(), payload.end());
    commandCount_++;
}

CommandBufferWriter& CommandBufferWriter::selectionUpdate(const protocol::SelectionUpdateEvent& event) {
    SelectionUpdatePayloadHeader hdr{};
    hdr.priority = event.priority;
    hdr.flags = (event.isActive ? kSelectionFlagActive : 0u)
        | (event.isMultiSelect ? kSelectionFlagMultiSelect : 0u)
        | (event.selectionBounds ? kSelectionFlagHasBounds : 0u);
    hdr.timestamp = static_cast<double>(event.timestamp);
    hdr.lastSeen = static_cast<double>(event.lastSeen);
    if (event.selectionBounds) {
        hdr.boundsX = event.selectionBounds->x;
        hdr.boundsY = event.selectionBounds->y;
        hdr.boundsW = event.selectionBounds->width;
        hdr.boundsH = event.selectionBounds->height;
    }
    hdr.elementCount = static_cast<std::uint32_t>(event.elementIds.size());

    std::vector<std::uint8_t> payload;
    pushPod(payload, hdr);
    pushString(payload, event.userId);
    pushString(payload, event.userName);
    pushString(payload, event.userColor);
    pushString(payload, event.whiteboardId);
    pushString(payload, event.sessionId);
    for (const auto& id : event.elementIds) pushString(payload, id);
    append(CommandOp::SelectionUpdate, payload);
    return *this;
}

CommandBufferWriter& CommandBufferWriter::removeUser(const std::string& userId) {
    std::vector<std::uint8_t> payload;
    pushString(payload, userId);
    append(CommandOp::RemoveUser, payload);
    return *this;
}

CommandBufferWriter& CommandBufferWriter::acquireOwnership(const OwnershipRequest& request) {
    OwnershipPayloadHeader hdr{};
    hdr.ttlMs = static_cast<double>(request.ttlMs);
    hdr.priority = request.priority;
    hdr.reason = static_cast<std::uint32_t>(request.reason);
    hdr.flags = request.hardLock ? kOwnershipFlagHardLock : 0u;

    std::vector<std::uint8_t> payload;
    pushPod(payload, hdr);
    pushString(payload, request.elementId);
    pushString(payload, request.userId);
    append(CommandOp::AcquireOwnership, payload);
    return *this;
}

CommandBufferWriter& CommandBufferWriter::renewOwnership(const std::string& elementId, const std::string& userId, TimeMs ttlMs) {
    OwnershipPayloadHeader hdr{};
    hdr.ttlMs = static_cast<double>(ttlMs);

    std::vector<std::uint8_t> payload;
    pushPod(payload, hdr);
    pushString(payload, elementId);
    pushString(payload, userId);
    append(CommandOp::RenewOwnership, payload);
    return *this;
}

CommandBufferWriter& CommandBufferWriter::releaseOwnership(const std::string& elementId, const std::string& userId) {
    std::vector<std::uint8_t> payload;
    pushString(payload, elementId);
    pushString(payload, userId);
    append(CommandOp::ReleaseOwnership, payload);
    return *this;
}

CommandBufferWriter& CommandBufferWriter::resolveConflict(const protocol::ConflictResolutionCommand& command) {
    ResolveConflictPayloadHeader hdr{};
    hdr.resolution = static_cast<std::uint32_t>(command.resolution);

    std::vector<std::uint8_t> payload;
    pushPod(payload, hdr);
    pushString(payload, command.conflictId);
    pushString(payload, command.resolverId);
    append(CommandOp::ResolveConflict, payload);
    return *this;
}

CommandBufferWriter& CommandBufferWriter::setViewport(const Viewport& viewport) {
    const ViewportPayload p{
        viewport.x, viewport.y, viewport.width, viewport.height,
        viewport.transform.x, viewport.transform.y, viewport.transform.zoom,
        0.0f,
    };
    std::vector<std::uint8_t> payload;
    pushPod(payload, p);
    append(CommandOp::SetViewport, payload);
    return *this;
}

CommandBufferWriter& CommandBufferWriter::invalidateBounds(const std::string& elementId) {
    std::vector<std::uint8_t> payload;
    pushString(payload, elementId);
    append(CommandOp::InvalidateBounds, payload);
    return *this;
}

CommandBufferWriter& CommandBufferWriter::tick() {
    append(CommandOp::Tick, {});
    return *this;
}

std::vector<std::uint8_t> CommandBufferWriter::finish() const {
    std::vector<std::uint8_t> out;
    out.reserve(commandHeaderBytes + body_.size());
    pushPod(out, commandMagicSscb);
    pushPod(out, commandVersionSscb);
    pushPod(out, commandCount_);
    pushPod(out, std::uint32_t{0});
    pushPod(out, nowMs_);
    out.insert(out.end(), body_.begin(), body_.end());
    return out;
}

} // namespace selsync
