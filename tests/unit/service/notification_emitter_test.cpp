#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "gnb/service/notification_emitter.hpp"
#include "helpers/test_doubles.hpp"

using namespace gnb::service;
using gnb::foundation::BridgeError;
using gnb::foundation::DBusErrorInfo;
using gnb::foundation::ErrorCode;
using gnb::protocol::ImageParameters;
using gnb::protocol::Notification;
using gnb::protocol::Urgency;
using gnb::test::FakeNotificationBackend;

namespace {

ImageParameters pixel() {
    ImageParameters image;
    image.untrustedWidth = 1;
    image.untrustedHeight = 1;
    image.untrustedRowstride = 4;
    image.untrustedHasAlpha = true;
    image.untrustedBitsPerSample = 8;
    image.untrustedChannels = 4;
    image.untrustedData = {10, 20, 30, 255};
    return image;
}

Notification simple(std::string summary = "Hello") {
    Notification n;
    n.summary = std::move(summary);
    n.body = "World";
    return n;
}

} // namespace

class NotificationEmitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.summaryPrefix = "[work] ";
        createEmitter();
    }

    void createEmitter() {
        emitter_.reset();
        emitter_ = std::make_unique<NotificationEmitter>(backend_, config_);
        ASSERT_TRUE(emitter_->initialize().hasValue());
    }

    GuestId send(Notification n) {
        auto result = emitter_->sendNotification(std::move(n));
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? result.value() : GuestId();
    }

    HostConfig config_;
    FakeNotificationBackend backend_;
    std::unique_ptr<NotificationEmitter> emitter_;
};

// ---------------------------------------------------------------------------
// Initialization
// ---------------------------------------------------------------------------

TEST_F(NotificationEmitterTest, InitializeQueriesCapabilities) {
    EXPECT_EQ(backend_.capabilityQueries, 1);
    EXPECT_TRUE(emitter_->capabilities().has(Capability::Actions));
    EXPECT_FALSE(emitter_->capabilities().has(Capability::BodyMarkup));
}

TEST_F(NotificationEmitterTest, InitializeTwiceFails) {
    auto again = emitter_->initialize();
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
}

TEST_F(NotificationEmitterTest, InitializeReportsBackendFailure) {
    FakeNotificationBackend failing;
    failing.capabilitiesError = BridgeError(ErrorCode::MethodCallFailed, "no server");
    NotificationEmitter emitter(failing, config_);
    auto result = emitter.initialize();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MethodCallFailed);
}

TEST_F(NotificationEmitterTest, DestructionDisconnectsFromBackend) {
    EXPECT_EQ(backend_.signals().closed.slotCount(), 1u);
    emitter_.reset();
    EXPECT_EQ(backend_.signals().closed.slotCount(), 0u);
    EXPECT_EQ(backend_.signals().actionInvoked.slotCount(), 0u);
    EXPECT_EQ(backend_.signals().replied.slotCount(), 0u);
    EXPECT_EQ(backend_.signals().ownerChanged.slotCount(), 0u);
}

// ---------------------------------------------------------------------------
// sendNotification
// ---------------------------------------------------------------------------

TEST_F(NotificationEmitterTest, ForwardsSanitizedCall) {
    auto n = simple("Build\x1B[31m done");
    n.body = "line\r\nnext";
    n.expireTimeout = 3000;
    auto id = send(n);

    EXPECT_EQ(id, GuestId(2));
    ASSERT_EQ(backend_.calls.size(), 1u);
    const auto& call = backend_.calls[0];
    EXPECT_EQ(call.appName, "Guest Notification Bridge");
    EXPECT_TRUE(call.appIcon.empty());
    EXPECT_EQ(call.replacesId, 0u);
    EXPECT_EQ(call.summary, "[work] Build\xEF\xBF\xBD[31m done");
    EXPECT_EQ(call.body, "line\nnext");
    EXPECT_EQ(call.expireTimeout, 3000);
    EXPECT_EQ(emitter_->translateHostId(HostId(100)), GuestId(2));
    EXPECT_EQ(emitter_->activeCount(), 1u);
}

TEST_F(NotificationEmitterTest, BodyEscapedWhenServerParsesMarkup) {
    backend_.capabilities = {"body", "body-markup"};
    createEmitter();

    auto n = simple();
    n.body = "<a href=\"x\">click</a>";
    send(n);
    ASSERT_EQ(backend_.calls.size(), 1u);
    EXPECT_EQ(backend_.calls[0].body, "&lt;a href=&quot;x&quot;&gt;click&lt;/a&gt;");
}

TEST_F(NotificationEmitterTest, ActionsForwardedWithSanitizedLabels) {
    auto n = simple();
    n.actions = {"default", "Open\x07", "reply", "Reply"};
    send(n);
    ASSERT_EQ(backend_.calls.size(), 1u);
    EXPECT_EQ(backend_.calls[0].actions,
              (std::vector<std::string>{"default", "Open\xEF\xBF\xBD", "reply", "Reply"}));
}

TEST_F(NotificationEmitterTest, ActionsDroppedWithoutCapability) {
    backend_.capabilities = {"body"};
    createEmitter();

    auto n = simple();
    n.actions = {"default", "Open"};
    send(n);
    ASSERT_EQ(backend_.calls.size(), 1u);
    EXPECT_TRUE(backend_.calls[0].actions.empty());
}

TEST_F(NotificationEmitterTest, InvalidActionKeyRejected) {
    auto n = simple();
    n.actions = {"9lives", "Label"};
    auto result = emitter_->sendNotification(n);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidActionName);
    EXPECT_TRUE(backend_.calls.empty());
}

TEST_F(NotificationEmitterTest, OddActionListRejected) {
    auto n = simple();
    n.actions = {"default"};
    auto result = emitter_->sendNotification(n);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::OddActionList);
}

TEST_F(NotificationEmitterTest, TimeoutBelowMinusOneRejected) {
    auto n = simple();
    n.expireTimeout = -2;
    auto result = emitter_->sendNotification(n);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidTimeout);

    n.expireTimeout = 0;
    EXPECT_TRUE(emitter_->sendNotification(n).hasValue());
}

TEST_F(NotificationEmitterTest, UnknownReplacesIdRejected) {
    auto n = simple();
    n.replacesId = 77;
    auto result = emitter_->sendNotification(n);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownNotificationId);
    EXPECT_EQ(result.error().message(), "ID 77 not found in guest-to-host lookup map");
    EXPECT_TRUE(backend_.calls.empty());
}

TEST_F(NotificationEmitterTest, ReplacementUsesHostIdAndKeepsGuestId) {
    auto first = send(simple());
    backend_.fixedId = 555;

    auto n = simple("updated");
    n.replacesId = first.value();
    auto second = send(n);

    EXPECT_EQ(second, first);
    ASSERT_EQ(backend_.calls.size(), 2u);
    EXPECT_EQ(backend_.calls[1].replacesId, 100u);
    EXPECT_EQ(emitter_->translateHostId(HostId(555)), first);
    EXPECT_FALSE(emitter_->translateHostId(HostId(100)).has_value());
}

TEST_F(NotificationEmitterTest, CategoryValidated) {
    auto n = simple();
    n.category = "im.received";
    send(n);
    ASSERT_EQ(backend_.calls.size(), 1u);
    EXPECT_EQ(backend_.calls[0].hints.category, "im.received");

    n.category = "IM";
    auto result = emitter_->sendNotification(n);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidCategory);
    EXPECT_EQ(result.error().message(), "Invalid category");
}

TEST_F(NotificationEmitterTest, HintsFollowServerCapabilities) {
    auto n = simple();
    n.urgency = Urgency::Critical;
    n.resident = true;
    n.transient = true;
    n.suppressSound = true;
    send(n);

    ASSERT_EQ(backend_.calls.size(), 1u);
    const auto& hints = backend_.calls[0].hints;
    EXPECT_EQ(hints.urgency, uint8_t{2});
    EXPECT_TRUE(hints.resident);
    EXPECT_TRUE(hints.transient);
    // The server does not advertise "sound".
    EXPECT_FALSE(hints.suppressSound);
}

TEST_F(NotificationEmitterTest, PersistenceHintsDroppedWithoutCapability) {
    backend_.capabilities = {"body", "sound"};
    createEmitter();

    auto n = simple();
    n.resident = true;
    n.transient = true;
    n.suppressSound = true;
    send(n);
    const auto& hints = backend_.calls.at(0).hints;
    EXPECT_FALSE(hints.resident);
    EXPECT_FALSE(hints.transient);
    EXPECT_TRUE(hints.suppressSound);
}

TEST_F(NotificationEmitterTest, ImagesIgnoredByDefault) {
    auto n = simple();
    n.image = pixel();
    n.image->untrustedBitsPerSample = 1;  // invalid, but never looked at
    send(n);
    EXPECT_FALSE(backend_.calls.at(0).hints.image.has_value());
}

TEST_F(NotificationEmitterTest, ImagesValidatedWhenForwarded) {
    config_.forwardImages = true;
    createEmitter();

    auto n = simple();
    n.image = pixel();
    send(n);
    ASSERT_TRUE(backend_.calls.at(0).hints.image.has_value());
    EXPECT_EQ(backend_.calls[0].hints.image->data, (std::vector<uint8_t>{10, 20, 30, 255}));

    n.image->untrustedData.resize(2);
    auto result = emitter_->sendNotification(n);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidImage);
    EXPECT_EQ(result.error().message(), "Image too large");
}

TEST_F(NotificationEmitterTest, BackendErrorPropagated) {
    backend_.failNextNotify("org.freedesktop.Notifications.Error.Busy", "try later");
    auto result = emitter_->sendNotification(simple());
    ASSERT_TRUE(result.hasError());
    const auto* info = result.error().context<DBusErrorInfo>();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->name, "org.freedesktop.Notifications.Error.Busy");
    EXPECT_EQ(emitter_->activeCount(), 0u);
}

TEST_F(NotificationEmitterTest, ZeroHostIdIsInvalidReply) {
    backend_.fixedId = 0;
    auto result = emitter_->sendNotification(simple());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidReply);
}

// ---------------------------------------------------------------------------
// closeNotification
// ---------------------------------------------------------------------------

TEST_F(NotificationEmitterTest, CloseTranslatesId) {
    auto id = send(simple());
    ASSERT_TRUE(emitter_->closeNotification(id).hasValue());
    EXPECT_EQ(backend_.closed, (std::vector<uint32_t>{100}));
    // Mapping stays until the server confirms with NotificationClosed.
    EXPECT_EQ(emitter_->activeCount(), 1u);
}

TEST_F(NotificationEmitterTest, CloseUnknownIdFails) {
    auto result = emitter_->closeNotification(GuestId(42));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownNotificationId);
    EXPECT_TRUE(backend_.closed.empty());
}

// ---------------------------------------------------------------------------
// Server signals
// ---------------------------------------------------------------------------

TEST_F(NotificationEmitterTest, ClosedSignalTranslatedAndUnmapped) {
    auto id = send(simple());
    std::vector<std::pair<GuestId, uint32_t>> dismissed;
    emitter_->onDismissed().connect(
        [&](GuestId g, uint32_t reason) { dismissed.emplace_back(g, reason); });

    backend_.signals().closed.emit(HostId(100), 2);
    ASSERT_EQ(dismissed.size(), 1u);
    EXPECT_EQ(dismissed[0].first, id);
    EXPECT_EQ(dismissed[0].second, 2u);
    EXPECT_EQ(emitter_->activeCount(), 0u);

    // A second close for the same ID is unknown now.
    backend_.signals().closed.emit(HostId(100), 2);
    EXPECT_EQ(dismissed.size(), 1u);
}

TEST_F(NotificationEmitterTest, ActionAndReplySignalsTranslated) {
    auto id = send(simple());
    std::vector<std::string> events;
    emitter_->onActionInvoked().connect([&](GuestId g, const std::string& action) {
        events.push_back(std::to_string(g.value()) + ":" + action);
    });
    emitter_->onReplied().connect([&](GuestId g, const std::string& text) {
        events.push_back(std::to_string(g.value()) + "=" + text);
    });

    backend_.signals().actionInvoked.emit(HostId(100), "default");
    backend_.signals().replied.emit(HostId(100), "on my way");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], std::to_string(id.value()) + ":default");
    EXPECT_EQ(events[1], std::to_string(id.value()) + "=on my way");
    EXPECT_EQ(emitter_->activeCount(), 1u);
}

TEST_F(NotificationEmitterTest, SignalsForForeignNotificationsDropped) {
    int count = 0;
    emitter_->onDismissed().connect([&](GuestId, uint32_t) { ++count; });
    emitter_->onActionInvoked().connect([&](GuestId, const std::string&) { ++count; });

    backend_.signals().closed.emit(HostId(9999), 1);
    backend_.signals().actionInvoked.emit(HostId(9999), "default");
    EXPECT_EQ(count, 0);
}

TEST_F(NotificationEmitterTest, ServerRestartClearsMapsAndRequeries) {
    auto id = send(simple());
    int restarts = 0;
    emitter_->onServerRestart().connect([&] { ++restarts; });

    backend_.capabilities = {"body", "body-markup"};
    backend_.signals().ownerChanged.emit();

    EXPECT_EQ(restarts, 1);
    EXPECT_EQ(backend_.capabilityQueries, 2);
    EXPECT_EQ(emitter_->activeCount(), 0u);
    EXPECT_TRUE(emitter_->capabilities().has(Capability::BodyMarkup));
    EXPECT_TRUE(emitter_->closeNotification(id).hasError());
}

TEST_F(NotificationEmitterTest, ServerRestartKeepsCapabilitiesOnQueryFailure) {
    backend_.capabilitiesError = BridgeError(ErrorCode::MethodCallFailed, "not yet");
    int restarts = 0;
    emitter_->onServerRestart().connect([&] { ++restarts; });

    backend_.signals().ownerChanged.emit();
    EXPECT_EQ(restarts, 1);
    EXPECT_TRUE(emitter_->capabilities().has(Capability::Actions));
}
