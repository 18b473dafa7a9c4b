#include "tests/engine_test_common.h"

#include <cstring>
#include <vector>

using selsync::CommandBufferWriter;
using selsync::CommandOp;
using selsync::EngineError;
using selsync::LockReason;
using selsync::OwnershipRequest;
using selsync::ResolutionAction;
using selsync::SelectionEngine;
using selsync::SelectionEngineTestAccessor;
using selsync::Viewport;
using selsync_test::kBoard;
using selsync_test::kT0;
using selsync_test::makeUpdate;

namespace {

OwnershipRequest acquireRequest(const std::string& elementId, const std::string& userId) {
    OwnershipRequest r;
    r.elementId = elementId;
    r.userId = userId;
    r.ttlMs = 30000;
    r.reason = LockReason::Moving;
    r.priority = 0;
    r.hardLock = true;
    return r;
}

void patchU32(std::vector<std::uint8_t>& buf, std::size_t offset, std::uint32_t value) {
    std::memcpy(buf.data() + offset, &value, sizeof(value));
}

struct CountingContext {
    std::vector<std::uint32_t> ops;
    std::uint32_t failOn = 0;
};

EngineError countingCallback(void* raw, std::uint32_t op, const std::uint8_t*, std::uint32_t) {
    auto* ctx = static_cast<CountingContext*>(raw);
    ctx->ops.push_back(op);
    return op == ctx->failOn ? EngineError::Rejected : EngineError::Ok;
}

} // namespace

TEST_F(SelectionEngineTest, CommandBufferAppliesInOrder) {
    scene.set("e1", selsync::Box{10.0f, 10.0f, 20.0f, 20.0f});

    CommandBufferWriter writer(static_cast<double>(kT0));
    writer.selectionUpdate(makeUpdate("userA", {"e1"}, kT0, 10))
        .selectionUpdate(makeUpdate("userB", {"e1", "e2"}, kT0))
        .acquireOwnership(acquireRequest("e2", "userB"))
        .setViewport(Viewport{0.0f, 0.0f, 800.0f, 600.0f, selsync::CanvasTransform{-5.0f, 0.0f, 2.0f}});
    const auto buffer = writer.finish();

    EXPECT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())), EngineError::Ok);
    EXPECT_EQ(engine->getLastError(), EngineError::Ok);

    EXPECT_EQ(engine->activeSelections().size(), 2u);
    ASSERT_EQ(engine->conflicts().size(), 1u);
    EXPECT_EQ(engine->conflicts()[0].contenders.front().userId, "userA");

    const auto owned = engine->ownership("e2", kT0);
    ASSERT_TRUE(owned.has_value());
    EXPECT_EQ(owned->ownerId, "userB");
    EXPECT_EQ(owned->lockReason, LockReason::Moving);
    EXPECT_EQ(owned->expiresAt, kT0 + 30000);

    EXPECT_FLOAT_EQ(engine->viewport().width, 800.0f);
    EXPECT_FLOAT_EQ(engine->viewport().transform.x, -5.0f);
    EXPECT_FLOAT_EQ(engine->viewport().transform.zoom, 2.0f);
}

TEST_F(SelectionEngineTest, CommandBufferResolvesAndReleases) {
    engine->applySelectionUpdate(makeUpdate("userA", {"e1"}, kT0, 10), kT0);
    engine->applySelectionUpdate(makeUpdate("userB", {"e1", "e2"}, kT0), kT0);
    ASSERT_EQ(engine->conflicts().size(), 1u);

    SelectionEngine::ConflictResolutionCommand cmd;
    cmd.conflictId = "conflict:e1";
    cmd.resolution = ResolutionAction::Ownership;
    cmd.resolverId = "userA";

    CommandBufferWriter writer(static_cast<double>(kT0 + 10));
    writer.resolveConflict(cmd);
    auto buffer = writer.finish();
    ASSERT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())), EngineError::Ok);
    EXPECT_TRUE(engine->conflicts().empty());
    ASSERT_TRUE(engine->ownership("e1", kT0 + 10).has_value());
    EXPECT_EQ(engine->ownership("e1", kT0 + 10)->ownerId, "userA");

    CommandBufferWriter release(static_cast<double>(kT0 + 20));
    release.releaseOwnership("e1", "userA").removeUser("userB");
    buffer = release.finish();
    ASSERT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())), EngineError::Ok);
    EXPECT_FALSE(engine->ownership("e1", kT0 + 20).has_value());
    ASSERT_EQ(engine->activeSelections().size(), 1u);
    EXPECT_EQ(engine->activeSelections()[0].userId, "userA");
}

TEST_F(SelectionEngineTest, CommandBufferRenewAndTick) {
    engine->requestOwnership(acquireRequest("e1", "userA"), kT0);

    CommandBufferWriter writer(static_cast<double>(kT0 + 20000));
    writer.renewOwnership("e1", "userA", 60000).tick();
    const auto buffer = writer.finish();
    ASSERT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())), EngineError::Ok);

    EXPECT_EQ(engine->ownership("e1", kT0 + 20000)->expiresAt, kT0 + 80000);
    EXPECT_GE(engine->getStats().sweepCount, 1u);
}

TEST_F(SelectionEngineTest, CommandBufferInvalidatesBounds) {
    scene.set("e1", selsync::Box{0.0f, 0.0f, 10.0f, 10.0f});
    scene.set("e2", selsync::Box{50.0f, 0.0f, 10.0f, 10.0f});
    engine->applySelectionUpdate(makeUpdate("userA", {"e1"}, kT0), kT0);
    engine->applySelectionUpdate(makeUpdate("userB", {"e2"}, kT0), kT0);
    engine->setViewport(Viewport{0.0f, 0.0f, 200.0f, 200.0f, {}});
    ASSERT_EQ(engine->query(kT0).highlights.size(), 2u);

    // Cached bounds are served until invalidated.
    const int callsAfterFirstQuery = scene.resolverCalls();
    scene.set("e1", selsync::Box{900.0f, 900.0f, 10.0f, 10.0f});
    EXPECT_EQ(engine->query(kT0).highlights.size(), 2u);
    EXPECT_EQ(scene.resolverCalls(), callsAfterFirstQuery);

    CommandBufferWriter one(static_cast<double>(kT0));
    one.invalidateBounds("e1");
    auto buffer = one.finish();
    ASSERT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())), EngineError::Ok);

    const auto moved = engine->query(kT0);
    ASSERT_EQ(moved.highlights.size(), 1u);
    EXPECT_EQ(moved.highlights[0].userId, "userB");
    EXPECT_GT(scene.resolverCalls(), callsAfterFirstQuery);

    // An empty id drops every entry.
    const auto& cache = SelectionEngineTestAccessor::boundsCache(*engine);
    ASSERT_GT(cache.size(), 0u);
    CommandBufferWriter all(static_cast<double>(kT0));
    all.invalidateBounds("");
    buffer = all.finish();
    ASSERT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())), EngineError::Ok);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(SelectionEngineTest, CommandBufferFromEngineMemory) {
    CommandBufferWriter writer(static_cast<double>(kT0));
    writer.selectionUpdate(makeUpdate("userA", {"e1", "e2"}, kT0));
    const auto buffer = writer.finish();

    const std::uintptr_t ptr = engine->allocBytes(static_cast<std::uint32_t>(buffer.size()));
    ASSERT_NE(ptr, 0u);
    std::memcpy(reinterpret_cast<void*>(ptr), buffer.data(), buffer.size());
    EXPECT_EQ(engine->applyCommandBuffer(ptr, static_cast<std::uint32_t>(buffer.size())), EngineError::Ok);
    engine->freeBytes(ptr);

    ASSERT_EQ(engine->activeSelections().size(), 1u);
    EXPECT_EQ(engine->activeSelections()[0].elementIds, (std::vector<std::string>{"e1", "e2"}));
}

TEST_F(SelectionEngineTest, MalformedHeaderAppliesNothing) {
    CommandBufferWriter writer(static_cast<double>(kT0));
    writer.selectionUpdate(makeUpdate("userA", {"e1"}, kT0));
    const auto good = writer.finish();

    auto badMagic = good;
    patchU32(badMagic, 0, 0x12345678u);
    EXPECT_EQ(engine->applyCommandBuffer(badMagic.data(), static_cast<std::uint32_t>(badMagic.size())),
              EngineError::InvalidMagic);

    auto badVersion = good;
    patchU32(badVersion, 4, selsync::commandVersionSscb + 1);
    EXPECT_EQ(engine->applyCommandBuffer(badVersion.data(), static_cast<std::uint32_t>(badVersion.size())),
              EngineError::UnsupportedVersion);
    EXPECT_EQ(engine->getLastError(), EngineError::UnsupportedVersion);

    EXPECT_EQ(engine->applyCommandBuffer(good.data(), 8), EngineError::BufferTruncated);
    EXPECT_EQ(engine->applyCommandBuffer(static_cast<const std::uint8_t*>(nullptr), 0), EngineError::BufferTruncated);

    EXPECT_TRUE(engine->activeSelections().empty());
    EXPECT_EQ(engine->getGeneration(), 0u);
}

TEST_F(SelectionEngineTest, TruncatedBodyAppliesNothing) {
    CommandBufferWriter writer(static_cast<double>(kT0));
    writer.selectionUpdate(makeUpdate("userA", {"e1"}, kT0))
        .selectionUpdate(makeUpdate("userB", {"e2"}, kT0));
    auto buffer = writer.finish();
    buffer.resize(buffer.size() - 3);

    EXPECT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())),
              EngineError::BufferTruncated);
    EXPECT_TRUE(engine->activeSelections().empty());
}

TEST_F(SelectionEngineTest, UnknownCommandAppliesNothing) {
    CommandBufferWriter writer(static_cast<double>(kT0));
    writer.selectionUpdate(makeUpdate("userA", {"e1"}, kT0)).tick();
    auto buffer = writer.finish();

    // The tick is the last command and carries no payload.
    const std::size_t tickOffset = buffer.size() - selsync::perCommandHeaderBytes;
    patchU32(buffer, tickOffset, 99u);

    EXPECT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())),
              EngineError::UnknownCommand);
    EXPECT_TRUE(engine->activeSelections().empty());
}

TEST_F(SelectionEngineTest, TrailingPayloadBytesAreRejected) {
    CommandBufferWriter writer(static_cast<double>(kT0));
    writer.removeUser("userA");
    auto buffer = writer.finish();

    // Grow the payload by four bytes and count them in the command header.
    const std::size_t sizeOffset = selsync::commandHeaderBytes + 8;
    std::uint32_t payloadSize = 0;
    std::memcpy(&payloadSize, buffer.data() + sizeOffset, sizeof(payloadSize));
    patchU32(buffer, sizeOffset, payloadSize + 4);
    buffer.insert(buffer.end(), 4, 0u);

    EXPECT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())),
              EngineError::InvalidPayloadSize);
}

TEST_F(SelectionEngineTest, SemanticErrorsDoNotStopTheBatch) {
    auto foreign = makeUpdate("userA", {"e1"}, kT0);
    foreign.whiteboardId = "board-2";

    CommandBufferWriter writer(static_cast<double>(kT0));
    writer.selectionUpdate(foreign)
        .releaseOwnership("e9", "userA")
        .selectionUpdate(makeUpdate("userB", {"e2"}, kT0));
    const auto buffer = writer.finish();

    EXPECT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())),
              EngineError::InvalidArgument);
    EXPECT_EQ(engine->getLastError(), EngineError::InvalidArgument);
    ASSERT_EQ(engine->activeSelections().size(), 1u);
    EXPECT_EQ(engine->activeSelections()[0].userId, "userB");
    EXPECT_EQ(engine->activeSelections()[0].whiteboardId, kBoard);
}

TEST_F(SelectionEngineTest, RejectedAcquireIsReported) {
    engine->requestOwnership(acquireRequest("e1", "userA"), kT0);

    CommandBufferWriter writer(static_cast<double>(kT0 + 1));
    writer.acquireOwnership(acquireRequest("e1", "userB"));
    const auto buffer = writer.finish();

    EXPECT_EQ(engine->applyCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size())),
              EngineError::Rejected);
    EXPECT_EQ(engine->ownership("e1", kT0 + 1)->ownerId, "userA");
}

TEST(CommandBufferParseTest, VisitsEveryCommandAndKeepsFirstError) {
    CommandBufferWriter writer(1.0);
    writer.tick().removeUser("u").tick().invalidateBounds("e1");
    EXPECT_EQ(writer.commandCount(), 4u);
    const auto buffer = writer.finish();

    CountingContext ctx;
    ctx.failOn = static_cast<std::uint32_t>(CommandOp::RemoveUser);
    EXPECT_EQ(selsync::parseCommandBuffer(buffer.data(), static_cast<std::uint32_t>(buffer.size()), countingCallback, &ctx),
              EngineError::Rejected);
    EXPECT_EQ(ctx.ops, (std::vector<std::uint32_t>{
        static_cast<std::uint32_t>(CommandOp::Tick),
        static_cast<std::uint32_t>(CommandOp::RemoveUser),
        static_cast<std::uint32_t>(CommandOp::Tick),
        static_cast<std::uint32_t>(CommandOp::InvalidateBounds),
    }));
}

TEST(CommandBufferParseTest, HeaderCarriesHostTime) {
    CommandBufferWriter writer(1234.0);
    writer.tick();
    const auto buffer = writer.finish();

    selsync::CommandBufferHeader header{};
    ASSERT_EQ(selsync::readCommandBufferHeader(buffer.data(), static_cast<std::uint32_t>(buffer.size()), header),
              EngineError::Ok);
    EXPECT_EQ(header.magic, selsync::commandMagicSscb);
    EXPECT_EQ(header.commandCount, 1u);
    EXPECT_DOUBLE_EQ(header.nowMs, 1234.0);
}

TEST(CommandBufferParseTest, DecodeRejectsOutOfRangeEnums) {
    SelectionEngine::ConflictResolutionCommand cmd;
    cmd.conflictId = "conflict:e1";
    cmd.resolverId = "u";
    cmd.resolution = ResolutionAction::Cancel;

    CommandBufferWriter writer(0.0);
    writer.resolveConflict(cmd);
    auto buffer = writer.finish();
    const std::size_t payloadOffset = selsync::commandHeaderBytes + selsync::perCommandHeaderBytes;
    patchU32(buffer, payloadOffset, 42u);

    selsync::DecodedCommand decoded;
    const auto payloadSize = static_cast<std::uint32_t>(buffer.size() - payloadOffset);
    EXPECT_EQ(selsync::decodeCommand(static_cast<std::uint32_t>(CommandOp::ResolveConflict),
                                     buffer.data() + payloadOffset, payloadSize, decoded),
              EngineError::InvalidArgument);

    patchU32(buffer, payloadOffset, static_cast<std::uint32_t>(ResolutionAction::Cancel));
    ASSERT_EQ(selsync::decodeCommand(static_cast<std::uint32_t>(CommandOp::ResolveConflict),
                                     buffer.data() + payloadOffset, payloadSize, decoded),
              EngineError::Ok);
    EXPECT_EQ(decoded.resolution.conflictId, "conflict:e1");
    EXPECT_EQ(decoded.resolution.resolution, ResolutionAction::Cancel);
}
