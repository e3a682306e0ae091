#include <stdexcept>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "auth_error.hpp"
#include "signer/signer_registry.hpp"
#include "signer/signer_session.hpp"
#include "mock_signer.hpp"

using namespace nip98;
using namespace nip98::data;
using namespace nip98::signer;
using namespace std;
using namespace ::testing;

namespace nostr_test
{
class SignerSessionTest : public testing::Test
{
public:
    inline static const string testPubkey = "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca";

    inline static const shared_ptr<plog::ConsoleAppender<plog::TxtFormatter>> testAppender =
        make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();

    static shared_ptr<Event> getTestTemplate()
    {
        auto event = make_shared<Event>();
        event->kind = 27235;
        event->createdAt = 1627846261;
        event->tags = {
            { "u", "https://api.example.com/settings/abc123" },
            { "method", "GET" }
        };

        return event;
    };

protected:
    shared_ptr<NiceMock<MockSigner>> mockSigner;

    void SetUp() override
    {
        mockSigner = make_shared<NiceMock<MockSigner>>();
        ON_CALL(*mockSigner, name()).WillByDefault(Return("nos2x"));
        ON_CALL(*mockSigner, isAvailable()).WillByDefault(Return(true));
    };

    void expectAuthError(function<void()> action, AuthError expected)
    {
        try
        {
            action();
            FAIL() << "Expected AuthException " << toString(expected);
        }
        catch (const AuthException& e)
        {
            ASSERT_EQ(e.code(), expected) << e.what();
        }
    };
};

TEST_F(SignerSessionTest, Constructor_StartsDisconnected_WithDetectedSignerName)
{
    auto session = make_shared<SignerSession>(testAppender, mockSigner);

    auto state = session->currentState();
    ASSERT_FALSE(state.connected);
    ASSERT_FALSE(state.pubkey.has_value());
    ASSERT_EQ(state.signerName.value(), "nos2x");
};

TEST_F(SignerSessionTest, Constructor_StartsDisconnected_WithoutSigner)
{
    auto session = make_shared<SignerSession>(testAppender, nullptr);

    auto state = session->currentState();
    ASSERT_FALSE(session->isAvailable());
    ASSERT_FALSE(state.connected);
    ASSERT_FALSE(state.signerName.has_value());
};

TEST_F(SignerSessionTest, Connect_RecordsPublicKey)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));

    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    string pubkey = session->connect();

    auto state = session->currentState();
    ASSERT_EQ(pubkey, testPubkey);
    ASSERT_TRUE(state.connected);
    ASSERT_EQ(state.pubkey.value(), testPubkey);
    ASSERT_EQ(state.signerName.value(), "nos2x");
};

TEST_F(SignerSessionTest, Connect_Fails_WhenNoSignerIsAvailable)
{
    ON_CALL(*mockSigner, isAvailable()).WillByDefault(Return(false));
    EXPECT_CALL(*mockSigner, getPublicKey()).Times(0);

    auto session = make_shared<SignerSession>(testAppender, mockSigner);

    expectAuthError([&session]() { session->connect(); }, AuthError::NoSignerAvailable);
    ASSERT_FALSE(session->currentState().connected);
};

TEST_F(SignerSessionTest, Connect_Fails_WhenSignerRejects)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return failedFuture<string>(runtime_error("User denied the request.")); }));

    auto session = make_shared<SignerSession>(testAppender, mockSigner);

    expectAuthError([&session]() { session->connect(); }, AuthError::SignerRejected);
    ASSERT_FALSE(session->currentState().connected);
    ASSERT_FALSE(session->currentState().pubkey.has_value());
};

TEST_F(SignerSessionTest, Connect_Fails_WhenSignerReturnsEmptyKey)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(""); }));

    auto session = make_shared<SignerSession>(testAppender, mockSigner);

    expectAuthError([&session]() { session->connect(); }, AuthError::SignerRejected);
    ASSERT_FALSE(session->currentState().connected);
};

TEST_F(SignerSessionTest, Connect_Fails_WhenDisconnectedWhileWaitingForSigner)
{
    shared_ptr<SignerSession> session = make_shared<SignerSession>(testAppender, mockSigner);
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([&session]()
        {
            session->disconnect();
            return readyPublicKey(testPubkey);
        }))
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));

    expectAuthError([&session]() { session->connect(); }, AuthError::SignerRejected);
    ASSERT_FALSE(session->currentState().connected);
    ASSERT_FALSE(session->currentState().pubkey.has_value());

    // A later attempt is not affected by the earlier disconnect.
    ASSERT_EQ(session->connect(), testPubkey);
    ASSERT_TRUE(session->currentState().connected);
};

TEST_F(SignerSessionTest, Disconnect_ClearsPublicKey_AndIsIdempotent)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));

    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    session->connect();
    session->disconnect();
    session->disconnect();

    auto state = session->currentState();
    ASSERT_FALSE(state.connected);
    ASSERT_FALSE(state.pubkey.has_value());
    ASSERT_EQ(state.signerName.value(), "nos2x");
};

TEST_F(SignerSessionTest, Sign_FailsWithoutInvokingSigner_WhenDisconnected)
{
    EXPECT_CALL(*mockSigner, sign(_)).Times(0);

    auto session = make_shared<SignerSession>(testAppender, mockSigner);

    expectAuthError([&session]() { session->sign(getTestTemplate()); }, AuthError::NotConnected);
};

TEST_F(SignerSessionTest, Sign_FailsWithoutInvokingSigner_AfterDisconnect)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));
    EXPECT_CALL(*mockSigner, sign(_)).Times(0);

    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    session->connect();
    session->disconnect();

    expectAuthError([&session]() { session->sign(getTestTemplate()); }, AuthError::NotConnected);
};

TEST_F(SignerSessionTest, Sign_ReturnsSignedEvent_WhenConnected)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));
    EXPECT_CALL(*mockSigner, sign(_))
        .WillOnce(Invoke([](shared_ptr<Event> event) { return fakeSignature(event, testPubkey); }));

    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    session->connect();
    auto signedEvent = session->sign(getTestTemplate());

    ASSERT_EQ(signedEvent->pubkey, testPubkey);
    ASSERT_FALSE(signedEvent->sig.empty());
    ASSERT_EQ(signedEvent->tags, getTestTemplate()->tags);
};

TEST_F(SignerSessionTest, Sign_WrapsSignerFailure)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));
    EXPECT_CALL(*mockSigner, sign(_))
        .WillOnce(Invoke([](shared_ptr<Event>)
        {
            return failedFuture<shared_ptr<Event>>(runtime_error("User closed the approval dialog."));
        }));

    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    session->connect();

    try
    {
        session->sign(getTestTemplate());
        FAIL() << "Expected AuthException SigningFailed";
    }
    catch (const AuthException& e)
    {
        ASSERT_EQ(e.code(), AuthError::SigningFailed);
        ASSERT_THAT(e.what(), HasSubstr("User closed the approval dialog."));
    }

    // A failed signature does not end the session.
    ASSERT_TRUE(session->currentState().connected);
};

TEST_F(SignerSessionTest, Sign_Fails_WhenSignerReturnsNoEvent)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));
    EXPECT_CALL(*mockSigner, sign(_))
        .WillOnce(Invoke([](shared_ptr<Event>)
        {
            promise<shared_ptr<Event>> emptyPromise;
            emptyPromise.set_value(nullptr);
            return emptyPromise.get_future();
        }));

    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    session->connect();

    expectAuthError([&session]() { session->sign(getTestTemplate()); }, AuthError::SigningFailed);
};

TEST_F(SignerSessionTest, Sign_Disconnects_WhenSignerIsLost)
{
    bool available = true;
    ON_CALL(*mockSigner, isAvailable()).WillByDefault(Invoke([&available]() { return available; }));
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));
    EXPECT_CALL(*mockSigner, sign(_)).Times(0);

    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    session->connect();
    available = false;

    expectAuthError([&session]() { session->sign(getTestTemplate()); }, AuthError::NoSignerAvailable);
    ASSERT_FALSE(session->currentState().connected);
    ASSERT_FALSE(session->currentState().pubkey.has_value());
};

TEST_F(SignerSessionTest, StateChangedHandler_IsNotified_OnConnectAndDisconnect)
{
    EXPECT_CALL(*mockSigner, getPublicKey())
        .WillOnce(Invoke([]() { return readyPublicKey(testPubkey); }));

    vector<SessionState> notifications;
    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    session->setStateChangedHandler([&notifications](const SessionState& state)
    {
        notifications.push_back(state);
    });

    session->connect();
    session->disconnect();

    ASSERT_EQ(notifications.size(), 2u);
    ASSERT_TRUE(notifications[0].connected);
    ASSERT_EQ(notifications[0].pubkey.value(), testPubkey);
    ASSERT_FALSE(notifications[1].connected);
    ASSERT_FALSE(notifications[1].pubkey.has_value());
};

TEST_F(SignerSessionTest, SignerInfo_ListsBaseAndAdvertisedNips)
{
    ON_CALL(*mockSigner, supportedNips()).WillByDefault(Return(vector<int>{ 4, 7, 44 }));

    auto session = make_shared<SignerSession>(testAppender, mockSigner);
    auto info = session->signerInfo();

    ASSERT_EQ(info.name, "nos2x");
    ASSERT_EQ(info.nips, (vector<int>{ 1, 4, 7, 44, 98 }));
};

TEST_F(SignerSessionTest, SignerInfo_Fails_WithoutSigner)
{
    auto session = make_shared<SignerSession>(testAppender, nullptr);

    expectAuthError([&session]() { session->signerInfo(); }, AuthError::NoSignerAvailable);
};

TEST_F(SignerSessionTest, Registry_DetectsFirstAvailableSigner)
{
    auto unavailable = make_shared<NiceMock<MockSigner>>();
    ON_CALL(*unavailable, name()).WillByDefault(Return("nostr"));
    ON_CALL(*unavailable, isAvailable()).WillByDefault(Return(false));

    auto alby = make_shared<NiceMock<MockSigner>>();
    ON_CALL(*alby, name()).WillByDefault(Return("Alby"));
    ON_CALL(*alby, isAvailable()).WillByDefault(Return(true));

    SignerRegistry registry(testAppender, { unavailable, alby, mockSigner });

    ASSERT_EQ(registry.detect(), alby);
    ASSERT_EQ(registry.availableSigners(), (vector<string>{ "Alby", "nos2x" }));
};

TEST_F(SignerSessionTest, Registry_DetectsNothing_WhenNoSignerIsAvailable)
{
    ON_CALL(*mockSigner, isAvailable()).WillByDefault(Return(false));

    SignerRegistry registry(testAppender);
    registry.registerSigner(mockSigner);
    registry.registerSigner(nullptr);

    ASSERT_EQ(registry.detect(), nullptr);
    ASSERT_TRUE(registry.availableSigners().empty());
};
TEST_F(SignerSessionTest, Registry_ProbesSigners_OutsideItsLock)
{
    SignerRegistry registry(testAppender);

    auto horse = make_shared<NiceMock<MockSigner>>();
    ON_CALL(*horse, name()).WillByDefault(Return("horse"));
    ON_CALL(*horse, isAvailable()).WillByDefault(Return(true));

    // A capability that registers another one while it is being probed.
    auto flamingo = make_shared<NiceMock<MockSigner>>();
    ON_CALL(*flamingo, name()).WillByDefault(Return("Flamingo"));
    ON_CALL(*flamingo, isAvailable()).WillByDefault(Invoke([&registry, horse]()
    {
        registry.registerSigner(horse);
        return false;
    }));
    registry.registerSigner(flamingo);

    ASSERT_EQ(registry.detect(), nullptr);
    ASSERT_EQ(registry.detect(), horse);
    ASSERT_EQ(registry.availableSigners().front(), "horse");
};
} // namespace nostr_test
