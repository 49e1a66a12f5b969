#include <gtest/gtest.h>
#include "protocol/codec.hpp"
#include "protocol/messages.hpp"
#include "test_utils.hpp"

using namespace blobdvm;
using namespace blobdvm::protocol;

class MessagesTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        init_logging();
    }

    const std::string client_identity = "client-identity";
    const std::string server_identity = "server-identity";

    // Request envelope with a hand-built field record
    Envelope raw_request(const FieldMap& fields) {
        Envelope envelope = make_envelope(MessageKind::REQUEST, client_identity);
        envelope.add_tag(TAG_CAPABILITY, capability_address(server_identity));
        envelope.content = Codec::encode_fields(fields);
        return envelope;
    }

    void expect_protocol_error(const Envelope& envelope, ErrorCode expected) {
        try {
            decode_request(envelope);
            FAIL() << "Expected ProtocolError";
        } catch (const ProtocolError& e) {
            EXPECT_EQ(e.code(), expected) << e.what();
        }
    }
};

TEST_F(MessagesTest, CapabilityAddressAppendsServiceId) {
    EXPECT_EQ(capability_address("abc"), "abc:blob-storage-v1");
}

TEST_F(MessagesTest, ActionNames) {
    EXPECT_STREQ(to_string(Action::STORE), "store");
    EXPECT_EQ(action_from_string("retrieve"), Action::RETRIEVE);
    EXPECT_EQ(action_from_string("delete"), Action::DELETE);
    EXPECT_FALSE(action_from_string("STORE").has_value());
    EXPECT_FALSE(action_from_string("list").has_value());
}

// Store requests carry data and the optional filename
TEST_F(MessagesTest, StoreRequestRoundTrip) {
    StoreRequest store{std::string("bytes\0with\0nulls", 16), std::string("photo.jpg")};
    Envelope envelope = encode_request(store, client_identity, capability_address(server_identity));

    EXPECT_EQ(envelope.kind, MessageKind::REQUEST);
    EXPECT_TRUE(envelope.has_tag(TAG_CAPABILITY, "server-identity:blob-storage-v1"));

    Request request = decode_request(envelope);
    EXPECT_EQ(request.action(), Action::STORE);
    EXPECT_EQ(request.id, envelope.id);
    EXPECT_EQ(request.author, client_identity);
    const auto& decoded = std::get<StoreRequest>(request.payload);
    EXPECT_EQ(decoded.data, store.data);
    EXPECT_EQ(decoded.filename, std::optional<std::string>("photo.jpg"));
}

TEST_F(MessagesTest, StoreRequestWithoutFilename) {
    Envelope envelope = encode_request(StoreRequest{"x", std::nullopt}, client_identity, "cap");
    const auto& decoded = std::get<StoreRequest>(decode_request(envelope).payload);
    EXPECT_FALSE(decoded.filename.has_value());
}

TEST_F(MessagesTest, RetrieveAndDeleteCarryHash) {
    crypto::Digest hash = crypto::sha256("content");
    Request retrieve = decode_request(encode_request(RetrieveRequest{hash}, client_identity, "cap"));
    EXPECT_EQ(retrieve.action(), Action::RETRIEVE);
    EXPECT_EQ(std::get<RetrieveRequest>(retrieve.payload).hash, hash);

    Request remove = decode_request(encode_request(DeleteRequest{hash}, client_identity, "cap"));
    EXPECT_EQ(remove.action(), Action::DELETE);
    EXPECT_EQ(std::get<DeleteRequest>(remove.payload).hash, hash);
}

TEST_F(MessagesTest, UnknownActionIsInvalidAction) {
    expect_protocol_error(raw_request({{"action", "list"}}), ErrorCode::INVALID_ACTION);
}

TEST_F(MessagesTest, MissingActionIsInvalidFormat) {
    expect_protocol_error(raw_request({{"hash", std::string(64, 'a')}}), ErrorCode::INVALID_REQUEST_FORMAT);
}

TEST_F(MessagesTest, MissingDataIsInvalidFormat) {
    expect_protocol_error(raw_request({{"action", "store"}}), ErrorCode::INVALID_REQUEST_FORMAT);
}

TEST_F(MessagesTest, BadHashIsInvalidHash) {
    expect_protocol_error(raw_request({{"action", "retrieve"}, {"hash", "xyz"}}), ErrorCode::INVALID_HASH);
    expect_protocol_error(raw_request({{"action", "delete"}, {"hash", std::string(64, 'G')}}),
                          ErrorCode::INVALID_HASH);
}

TEST_F(MessagesTest, UnparsableContentIsInvalidFormat) {
    Envelope envelope = raw_request({});
    envelope.content = "garbage";
    expect_protocol_error(envelope, ErrorCode::INVALID_REQUEST_FORMAT);
}

TEST_F(MessagesTest, WrongKindIsInvalidFormat) {
    Envelope envelope = raw_request({{"action", "store"}, {"data", "x"}});
    envelope.kind = MessageKind::CHUNK;
    expect_protocol_error(envelope, ErrorCode::INVALID_REQUEST_FORMAT);
}

// Success responses reference the request and expose the file hash as a tag
TEST_F(MessagesTest, SuccessResponseRoundTrip) {
    crypto::Digest hash = crypto::sha256("file");
    Response response;
    response.request_id = "request-1";
    response.request_author = client_identity;
    response.body = SuccessResponse{"stored", hash, 70000u, 3u, 1700086400u};

    Envelope envelope = encode_response(response, server_identity);
    EXPECT_EQ(envelope.kind, MessageKind::RESPONSE);
    EXPECT_EQ(envelope.tag(TAG_REQUEST_REF), std::optional<std::string>("request-1"));
    EXPECT_EQ(envelope.tag(TAG_REQUEST_AUTHOR), std::optional<std::string>(client_identity));
    EXPECT_EQ(envelope.tag(TAG_FILE_HASH), std::optional<std::string>(crypto::to_hex(hash)));
    EXPECT_EQ(envelope.tag(TAG_EXPIRES), std::optional<std::string>("1700086400"));

    Response decoded = decode_response(envelope);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.request_id, "request-1");
    EXPECT_EQ(decoded.success().status, "stored");
    EXPECT_EQ(decoded.success().hash, hash);
    EXPECT_EQ(decoded.success().size, std::optional<uint64_t>(70000));
    EXPECT_EQ(decoded.success().chunk_count, std::optional<uint64_t>(3));
    EXPECT_EQ(decoded.success().expires_at, std::optional<uint64_t>(1700086400));
}

TEST_F(MessagesTest, DeletedResponseHasNoSizeFields) {
    Response response;
    response.request_id = "request-2";
    response.body = SuccessResponse{"deleted", crypto::sha256("x"), std::nullopt, std::nullopt, std::nullopt};

    Response decoded = decode_response(encode_response(response, server_identity));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.success().status, "deleted");
    EXPECT_FALSE(decoded.success().size.has_value());
    EXPECT_FALSE(decoded.success().chunk_count.has_value());
}

TEST_F(MessagesTest, ErrorResponseRoundTrip) {
    Response response;
    response.request_id = "request-3";
    response.body = ErrorResponse{ErrorCode::FILE_TOO_LARGE, "File exceeds maximum size limit"};

    Envelope envelope = encode_response(response, server_identity);
    EXPECT_FALSE(envelope.tag(TAG_FILE_HASH).has_value());

    Response decoded = decode_response(envelope);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, ErrorCode::FILE_TOO_LARGE);
    EXPECT_EQ(decoded.error().message, "File exceeds maximum size limit");
}

TEST_F(MessagesTest, UnknownErrorCodeMapsToInternalError) {
    Envelope envelope = make_envelope(MessageKind::RESPONSE, server_identity);
    envelope.add_tag(TAG_REQUEST_REF, "request-4");
    envelope.content = Codec::encode_fields({{"status", "error"}, {"error", "SOMETHING_NEW"}});

    Response decoded = decode_response(envelope);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, ErrorCode::INTERNAL_ERROR);
    EXPECT_FALSE(decoded.error().message.empty());
}

TEST_F(MessagesTest, ResponseWithoutRequestReferenceIsRejected) {
    Envelope envelope = make_envelope(MessageKind::RESPONSE, server_identity);
    envelope.content = Codec::encode_fields({{"status", "deleted"}, {"hash", crypto::to_hex(crypto::sha256(""))}});
    EXPECT_THROW(decode_response(envelope), ProtocolError);
}

TEST_F(MessagesTest, ChunkRoundTripCarriesRawBytes) {
    auto chunks = chunker::Chunker::split(make_payload(3000), 1000);
    ChunkMessage message;
    message.file_hash = crypto::sha256(make_payload(3000));
    message.index = 1;
    message.total = chunks.size();
    message.chunk_hash = chunks[1].hash;
    message.expires_at = 1700086400;
    message.data = chunks[1].data;

    Envelope envelope = encode_chunk(message, server_identity);
    EXPECT_EQ(envelope.content, chunks[1].data);
    EXPECT_EQ(envelope.tag(TAG_CHUNK_INDEX), std::optional<std::string>("1"));
    EXPECT_EQ(envelope.tag(TAG_CHUNK_TOTAL), std::optional<std::string>("3"));

    ChunkMessage decoded = decode_chunk(envelope);
    EXPECT_EQ(decoded.file_hash, message.file_hash);
    EXPECT_EQ(decoded.index, 1u);
    EXPECT_EQ(decoded.total, 3u);
    EXPECT_EQ(decoded.expires_at, 1700086400u);

    chunker::Chunk chunk = decoded.to_chunk();
    EXPECT_TRUE(chunker::Chunker::verify_chunk(chunk));
    EXPECT_EQ(chunk.size, 1000u);
}

TEST_F(MessagesTest, ChunkIndexOutsideTotalIsRejected) {
    ChunkMessage message;
    message.file_hash = crypto::sha256("f");
    message.index = 3;
    message.total = 3;
    message.chunk_hash = crypto::sha256("c");
    EXPECT_THROW(decode_chunk(encode_chunk(message, server_identity)), ProtocolError);
}

TEST_F(MessagesTest, ChunkWithNonNumericIndexIsRejected) {
    ChunkMessage message;
    message.file_hash = crypto::sha256("f");
    message.total = 1;
    message.chunk_hash = crypto::sha256("c");
    Envelope envelope = encode_chunk(message, server_identity);
    for (auto& tag : envelope.tags) {
        if (tag.name == TAG_CHUNK_INDEX) {
            tag.value = "-1";
        }
    }
    EXPECT_THROW(decode_chunk(envelope), ProtocolError);
}

TEST_F(MessagesTest, AnnouncementRoundTrip) {
    ServerAnnouncement announcement;
    announcement.identity = server_identity;
    announcement.accepted_actions = {Action::STORE, Action::RETRIEVE, Action::DELETE};
    announcement.max_file_size = 10 * 1024 * 1024;
    announcement.chunk_size = 32768;
    announcement.retention_seconds = 86400;
    announcement.name = "BlobDVM Storage";
    announcement.about = "Content-addressed file storage";

    Envelope envelope = encode_announcement(announcement);
    EXPECT_EQ(envelope.kind, MessageKind::ANNOUNCEMENT);
    EXPECT_EQ(envelope.author, server_identity);
    EXPECT_TRUE(envelope.has_tag(TAG_SERVICE, SERVICE_ID));
    EXPECT_TRUE(envelope.has_tag(TAG_ACCEPTED_KIND, "24210"));

    ServerAnnouncement decoded = decode_announcement(envelope);
    EXPECT_EQ(decoded.identity, server_identity);
    EXPECT_EQ(decoded.accepted_actions, announcement.accepted_actions);
    EXPECT_EQ(decoded.max_file_size, announcement.max_file_size);
    EXPECT_EQ(decoded.chunk_size, 32768u);
    EXPECT_EQ(decoded.retention_seconds, 86400u);
    EXPECT_EQ(decoded.name, announcement.name);
    EXPECT_EQ(decoded.capability_address(), "server-identity:blob-storage-v1");
}

TEST_F(MessagesTest, AnnouncementForOtherServiceIsRejected) {
    ServerAnnouncement announcement;
    announcement.identity = server_identity;
    Envelope envelope = encode_announcement(announcement);
    envelope.tags.clear();
    envelope.add_tag(TAG_SERVICE, "other-service-v2");
    EXPECT_THROW(decode_announcement(envelope), ProtocolError);
}
