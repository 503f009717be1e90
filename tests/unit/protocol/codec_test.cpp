#include <gtest/gtest.h>
#include <ankidirect/core/number.h>
#include <ankidirect/protocol/codec.h>

#include "../../common/fake_transport.h"

#include <memory>
#include <vector>

using namespace ankidirect;
using namespace ankidirect::protocol;
using ankidirect::test::FakeTransport;

namespace {

class CodecTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    EnvelopeCodec codec_{transport_, "http://127.0.0.1:8765", 6};
};

} // namespace

TEST_F(CodecTest, PostsEnvelopeToEndpoint) {
    transport_->queuePost(R"({"result":[1496198395707],"error":null})");

    auto res = codec_.send<std::vector<Number>>("findNotes", ordered_json{{"query", "deck:x"}});
    ASSERT_TRUE(res);
    ASSERT_TRUE(res.value().has_value());
    EXPECT_EQ(res.value()->front(), Number{1496198395707});

    auto posts = transport_->posts();
    ASSERT_EQ(posts.size(), 1u);
    EXPECT_EQ(posts[0].url, "http://127.0.0.1:8765");
    EXPECT_EQ(posts[0].contentType, "application/json");
    EXPECT_EQ(posts[0].body,
              R"({"action":"findNotes","version":6,"params":{"query":"deck:x"}})");
}

TEST_F(CodecTest, ParameterlessActionOmitsParams) {
    transport_->queuePost(R"({"result":6,"error":null})");
    auto res = codec_.send<int>("version");
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().value_or(0), 6);
    EXPECT_FALSE(transport_->lastRequest().contains("params"));
}

TEST_F(CodecTest, TransportFailurePropagates) {
    transport_->queuePostError(Error{ErrorCode::Transport, "Couldn't connect to server"});
    auto res = codec_.send<int>("version");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::Transport);
    EXPECT_EQ(res.error().message, "Couldn't connect to server");
}

TEST_F(CodecTest, RemoteErrorIsRejected) {
    transport_->queuePost(R"({"result":null,"error":"cannot create note because it is empty"})");
    auto res = codec_.send<Number>("addNote", ordered_json::object());
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::RemoteRejected);
    EXPECT_EQ(res.error().message, "cannot create note because it is empty");
}

TEST_F(CodecTest, SanitizesBeforeDecoding) {
    transport_->queuePost(
        R"({"result":[{"noteId":1,"modelName":"Basic","tags":[],"fields":{}},{}],"error":null})");
    auto raw = codec_.exchange("notesInfo", ordered_json{{"notes", {1, 2}}});
    ASSERT_TRUE(raw);
    EXPECT_EQ(raw.value()["result"].size(), 1u);
}

TEST_F(CodecTest, GarbageBodyIsMalformed) {
    transport_->queuePost("not json at all");
    auto res = codec_.send<int>("version");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::MalformedResponse);
    ASSERT_TRUE(res.error().malformed.has_value());
    EXPECT_EQ(res.error().malformed->received, "not json at all");
}

TEST(CodecStandaloneTest, MissingTransportIsInternalError) {
    EnvelopeCodec codec{nullptr, "http://127.0.0.1:8765", 6};
    auto res = codec.send<int>("version");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InternalError);
}

TEST_F(CodecTest, InvalidUtf8ParamsAreRejectedBeforeSending) {
    auto res =
        codec_.send<std::vector<Number>>("findNotes", ordered_json{{"query", "deck:\xff\xfe"}});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(res.error().message.find("findNotes"), std::string::npos);
    EXPECT_TRUE(transport_->posts().empty());
}
