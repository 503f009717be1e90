#include <gtest/gtest.h>
#include <ankidirect/media/media.h>
#include <ankidirect/media/media_resolver.h>

#include "../../common/fake_transport.h"
#include "../../common/test_helpers.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
using namespace ankidirect;
using namespace ankidirect::media;
using ankidirect::test::FakeTransport;
using ankidirect::test::toBytes;
using ankidirect::test::toString;

namespace {

Media buildMedia(MediaBuilder& builder) {
    auto built = builder.build();
    EXPECT_TRUE(built) << (built ? "" : built.error().describe());
    return std::move(built).value();
}

Media urlMedia(const std::string& filename, const std::string& url) {
    MediaBuilder builder;
    builder.filename(filename).field("Front").url(MediaSource{RemoteUrl{url}});
    return buildMedia(builder);
}

} // namespace

TEST(MediaBuilderTest, FilenameIsRequired) {
    MediaBuilder builder;
    builder.field("Back").inlineData(toBytes("x"));
    auto built = builder.build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, ErrorCode::ValidationFailed);
    EXPECT_EQ(built.error().message, "filename");
}

TEST(MediaBuilderTest, StringSettersCoerce) {
    MediaBuilder builder;
    builder.filename("hello.mp3").url("https://example.com/hello.mp3").path("raw text payload");
    auto media = buildMedia(builder);
    ASSERT_TRUE(media.url().has_value());
    EXPECT_EQ(media.url()->kind(), MediaSource::Kind::Url);
    ASSERT_TRUE(media.path().has_value());
    EXPECT_EQ(media.path()->kind(), MediaSource::Kind::Data);
    EXPECT_TRUE(media.data().empty());
}

TEST(MediaResolveTest, UrlTakesPrecedenceOverPath) {
    auto dir = test::make_temp_dir("ankidirect_media_");
    auto file = test::write_file(dir / "local.mp3", "LOCAL");

    FakeTransport transport;
    transport.setGet("https://example.com/remote.mp3", toBytes("REMOTE"));

    MediaBuilder builder;
    builder.filename("clip.mp3").url("https://example.com/remote.mp3").path(file.string());
    auto media = buildMedia(builder);
    ASSERT_EQ(media.path()->kind(), MediaSource::Kind::Path);

    // The path must never be read once a url is present
    fs::remove(file);

    ASSERT_TRUE(media.resolveData(transport));
    EXPECT_EQ(toString(media.data()), "REMOTE");
    EXPECT_EQ(transport.getCount(), 1);
    EXPECT_EQ(transport.gets(), std::vector<std::string>{"https://example.com/remote.mp3"});

    fs::remove_all(dir);
}

TEST(MediaResolveTest, PathUsedWithoutUrl) {
    auto dir = test::make_temp_dir("ankidirect_media_");
    auto file = test::write_file(dir / "pic.png", "PNGBYTES");

    FakeTransport transport;
    MediaBuilder builder;
    builder.filename("pic.png").path(file.string()).inlineData(toBytes("ignored"));
    auto media = buildMedia(builder);

    ASSERT_TRUE(media.resolveData(transport));
    EXPECT_EQ(toString(media.data()), "PNGBYTES");
    EXPECT_EQ(transport.getCount(), 0);

    fs::remove_all(dir);
}

TEST(MediaResolveTest, InlineDataKeptWithoutSources) {
    FakeTransport transport;
    MediaBuilder builder;
    builder.filename("a.txt").inlineData(toBytes("inline"));
    auto media = buildMedia(builder);
    ASSERT_TRUE(media.resolveData(transport));
    EXPECT_EQ(toString(media.data()), "inline");
}

TEST(MediaResolveTest, NoSourceIsMissingMediaSource) {
    FakeTransport transport;
    MediaBuilder builder;
    builder.filename("nothing.mp3").field("Front");
    auto media = buildMedia(builder);
    auto r = media.resolveData(transport);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MissingMediaSource);
    EXPECT_EQ(r.error().message, "nothing.mp3");
}

TEST(MediaResolveTest, EmptyPayloadIsMissingMediaSource) {
    FakeTransport transport;
    transport.setGet("https://example.com/empty.mp3", ByteVector{});
    auto media = urlMedia("empty.mp3", "https://example.com/empty.mp3");
    auto r = media.resolveData(transport);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MissingMediaSource);
    EXPECT_EQ(r.error().message, "empty.mp3");
}

TEST(MediaWireTest, SerializesResolvedPayload) {
    MediaBuilder builder;
    builder.filename("foo.txt")
        .fields({"Front", "Back"})
        .url("https://example.com/foo.txt")
        .inlineData(toBytes("foobar"))
        .skipHash("7e2c2f954ef6051373ba916f000168dc");
    auto media = buildMedia(builder);

    nlohmann::ordered_json j = media;
    EXPECT_EQ(j.dump(), R"({"filename":"foo.txt","data":"Zm9vYmFy","fields":["Front","Back"],)"
                        R"("skipHash":"7e2c2f954ef6051373ba916f000168dc"})");
    EXPECT_FALSE(j.contains("url"));
    EXPECT_FALSE(j.contains("path"));
}

TEST(MediaWireTest, SkipHashOmittedWhenUnset) {
    MediaBuilder builder;
    builder.filename("a.png").inlineData(toBytes("f"));
    nlohmann::ordered_json j = buildMedia(builder);
    EXPECT_FALSE(j.contains("skipHash"));
    EXPECT_EQ(j["fields"], nlohmann::ordered_json::array());
}

TEST(MediaResolverTest, ResolvesEveryItemConcurrently) {
    FakeTransport transport;
    std::vector<Media> items;
    for (int i = 0; i < 6; ++i) {
        const auto url = "https://example.com/" + std::to_string(i) + ".mp3";
        transport.setGet(url, toBytes("payload-" + std::to_string(i)));
        items.push_back(urlMedia(std::to_string(i) + ".mp3", url));
    }
    std::vector<Media*> pointers;
    for (auto& m : items)
        pointers.push_back(&m);

    ResolveOptions options;
    options.concurrency = 3;
    ASSERT_TRUE(resolveAll(pointers, transport, options));
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(toString(items[i].data()), "payload-" + std::to_string(i));
    }
    EXPECT_EQ(transport.getCount(), 6);
}

TEST(MediaResolverTest, ReportsFirstRealFailureNotCancellation) {
    FakeTransport transport;
    transport.setGet("https://example.com/ok.mp3", toBytes("ok"));
    std::vector<Media> items;
    items.push_back(urlMedia("ok.mp3", "https://example.com/ok.mp3"));
    items.push_back(urlMedia("missing.mp3", "https://example.com/missing.mp3"));
    items.push_back(urlMedia("ok2.mp3", "https://example.com/ok.mp3"));
    std::vector<Media*> pointers{&items[0], &items[1], &items[2]};

    for (std::size_t concurrency : {std::size_t{1}, std::size_t{4}}) {
        ResolveOptions options;
        options.concurrency = concurrency;
        auto r = resolveAll(pointers, transport, options);
        ASSERT_FALSE(r) << concurrency;
        EXPECT_EQ(r.error().code, ErrorCode::Transport) << concurrency;
    }
}

TEST(MediaResolverTest, CallerCancellation) {
    FakeTransport transport;
    std::vector<Media> items;
    items.push_back(urlMedia("a.mp3", "https://example.com/a.mp3"));
    items.push_back(urlMedia("b.mp3", "https://example.com/b.mp3"));
    std::vector<Media*> pointers{&items[0], &items[1]};

    ResolveOptions options;
    options.shouldCancel = [] { return true; };
    auto r = resolveAll(pointers, transport, options);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(transport.getCount(), 0);
}

TEST(MediaResolverTest, EmptyListSucceeds) {
    FakeTransport transport;
    EXPECT_TRUE(resolveAll({}, transport));
}
