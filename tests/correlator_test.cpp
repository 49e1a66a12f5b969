#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include "client/correlator.hpp"
#include "protocol/messages.hpp"
#include "test_utils.hpp"

using namespace blobdvm;
using namespace blobdvm::client;
using namespace blobdvm::protocol;
using ::testing::_;
using ::testing::Invoke;

class CorrelatorTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        init_logging();
    }

    MockTransport transport;

    Envelope make_request() {
        return encode_request(RetrieveRequest{crypto::sha256("x")}, "client", capability_address("server"));
    }

    Envelope make_response(const std::string& request_id, const std::string& status = "available") {
        Response response;
        response.request_id = request_id;
        response.request_author = "client";
        response.body = SuccessResponse{status, crypto::sha256("x"), 1u, 1u, 100u};
        return encode_response(response, "server");
    }
};

TEST_F(CorrelatorTest, SubscribesAndUnsubscribes) {
    {
        Correlator correlator(transport);
        EXPECT_EQ(transport.subscription_count(), 1u);
    }
    EXPECT_EQ(transport.subscription_count(), 0u);
}

// A reply delivered while publish is still on the stack is not lost
TEST_F(CorrelatorTest, ImmediateResponseIsMatched) {
    Correlator correlator(transport);
    Envelope request = make_request();

    EXPECT_CALL(transport, publish(_)).WillOnce(Invoke([this](const Envelope& published) {
        transport.deliver(make_response(published.id));
    }));

    Envelope reply = correlator.send(request, std::chrono::milliseconds(1000));
    EXPECT_EQ(reply.tag(TAG_REQUEST_REF), std::optional<std::string>(request.id));
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST_F(CorrelatorTest, DelayedResponseFromOtherThread) {
    Correlator correlator(transport);
    Envelope request = make_request();
    std::thread responder;

    EXPECT_CALL(transport, publish(_)).WillOnce(Invoke([this, &responder](const Envelope& published) {
        responder = std::thread([this, id = published.id] {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            transport.deliver(make_response(id));
        });
    }));

    Envelope reply = correlator.send(request, std::chrono::milliseconds(5000));
    responder.join();
    EXPECT_EQ(decode_response(reply).request_id, request.id);
}

// Responses for other requests do not satisfy the wait
TEST_F(CorrelatorTest, UnrelatedResponseIgnored) {
    Correlator correlator(transport);
    Envelope request = make_request();

    EXPECT_CALL(transport, publish(_)).WillOnce(Invoke([this](const Envelope&) {
        transport.deliver(make_response("some-other-request"));
    }));

    EXPECT_THROW(correlator.send(request, std::chrono::milliseconds(100)), TimeoutError);
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST_F(CorrelatorTest, TimeoutReleasesSlot) {
    Correlator correlator(transport);
    EXPECT_CALL(transport, publish(_)).Times(1);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(correlator.send(make_request(), std::chrono::milliseconds(80)), TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(75));
    EXPECT_EQ(correlator.pending_count(), 0u);
}

// Only the first response for a request is used
TEST_F(CorrelatorTest, DuplicateResponsesDropped) {
    Correlator correlator(transport);
    Envelope request = make_request();

    EXPECT_CALL(transport, publish(_)).WillOnce(Invoke([this](const Envelope& published) {
        transport.deliver(make_response(published.id, "stored"));
        transport.deliver(make_response(published.id, "deleted"));
    }));

    Envelope reply = correlator.send(request, std::chrono::milliseconds(1000));
    EXPECT_EQ(decode_response(reply).success().status, "stored");
}

TEST_F(CorrelatorTest, LateResponseAfterTimeoutIsHarmless) {
    Correlator correlator(transport);
    Envelope request = make_request();
    EXPECT_CALL(transport, publish(_)).Times(1);

    EXPECT_THROW(correlator.send(request, std::chrono::milliseconds(20)), TimeoutError);
    EXPECT_NO_THROW(transport.deliver(make_response(request.id)));
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST_F(CorrelatorTest, PublishFailurePropagatesAndReleasesSlot) {
    Correlator correlator(transport);
    EXPECT_CALL(transport, publish(_)).WillOnce(Invoke([](const Envelope&) {
        throw transport::TransportError("relay unreachable");
    }));

    EXPECT_THROW(correlator.send(make_request(), std::chrono::milliseconds(1000)), transport::TransportError);
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST_F(CorrelatorTest, ConcurrentRequestsResolveIndependently) {
    Correlator correlator(transport);
    std::vector<std::thread> responders;
    std::mutex responders_mutex;

    EXPECT_CALL(transport, publish(_)).Times(4).WillRepeatedly(Invoke([&](const Envelope& published) {
        std::lock_guard<std::mutex> lock(responders_mutex);
        responders.emplace_back([this, id = published.id] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            transport.deliver(make_response(id));
        });
    }));

    std::vector<std::thread> callers;
    std::atomic<int> matched{0};
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&] {
            Envelope request = make_request();
            Envelope reply = correlator.send(request, std::chrono::milliseconds(5000));
            if (decode_response(reply).request_id == request.id) {
                ++matched;
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    for (auto& responder : responders) {
        responder.join();
    }
    EXPECT_EQ(matched, 4);
}

// Responses delivered in reverse order still reach their own callers
TEST_F(CorrelatorTest, InterleavedResponsesMatchByIdentity) {
    Correlator correlator(transport);
    std::mutex mutex;
    std::vector<std::string> published_ids;

    EXPECT_CALL(transport, publish(_)).Times(2).WillRepeatedly(Invoke([&](const Envelope& published) {
        std::lock_guard<std::mutex> lock(mutex);
        published_ids.push_back(published.id);
    }));

    Envelope first = make_request();
    Envelope second = make_request();
    Envelope first_reply;
    Envelope second_reply;
    std::thread first_caller([&] { first_reply = correlator.send(first, std::chrono::milliseconds(5000)); });
    std::thread second_caller([&] { second_reply = correlator.send(second, std::chrono::milliseconds(5000)); });

    EXPECT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return published_ids.size() == 2 && correlator.pending_count() == 2;
    }));
    transport.deliver(make_response(second.id, "deleted"));
    transport.deliver(make_response(first.id, "stored"));

    first_caller.join();
    second_caller.join();
    EXPECT_EQ(decode_response(first_reply).success().status, "stored");
    EXPECT_EQ(decode_response(second_reply).success().status, "deleted");
}
