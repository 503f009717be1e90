#include <gtest/gtest.h>
#include <ankidirect/media/media_source.h>

#include "../../common/fake_transport.h"
#include "../../common/test_helpers.h"

#include <filesystem>
#include <string>
#include <utility>

namespace fs = std::filesystem;
using namespace ankidirect;
using namespace ankidirect::media;
using ankidirect::test::FakeTransport;
using ankidirect::test::toBytes;
using ankidirect::test::toString;

namespace {

class MediaSourceTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = test::make_temp_dir("ankidirect_media_"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

} // namespace

TEST_F(MediaSourceTest, ExistingPathWins) {
    auto file = test::write_file(dir_ / "clip.mp3", "ID3");
    auto source = MediaSource::fromString(file.string());
    EXPECT_EQ(source.kind(), MediaSource::Kind::Path);
    ASSERT_NE(source.localPath(), nullptr);
    EXPECT_EQ(source.localPath()->path().string(), file.string());
}

TEST_F(MediaSourceTest, UrlWhenNotAPath) {
    auto source = MediaSource::fromString("https://example.com/audio/hello.mp3");
    EXPECT_EQ(source.kind(), MediaSource::Kind::Url);
    ASSERT_NE(source.remoteUrl(), nullptr);
    EXPECT_EQ(source.remoteUrl()->url, "https://example.com/audio/hello.mp3");
}

TEST_F(MediaSourceTest, FallsBackToRawBytes) {
    auto source = MediaSource::fromString("just some text");
    EXPECT_EQ(source.kind(), MediaSource::Kind::Data);
    ASSERT_NE(source.inlineData(), nullptr);
    EXPECT_EQ(toString(source.inlineData()->bytes), "just some text");

    auto missing = MediaSource::fromString((dir_ / "nope.png").string());
    EXPECT_EQ(missing.kind(), MediaSource::Kind::Data);
}

TEST_F(MediaSourceTest, LocalPathRequiresExistingFile) {
    auto missing = LocalPath::from(dir_ / "absent.wav");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::Io);

    auto present = LocalPath::from(test::write_file(dir_ / "present.wav", "RIFF"));
    EXPECT_TRUE(present);
}

TEST_F(MediaSourceTest, MoveLeavesSourceEmpty) {
    MediaSource source{RemoteUrl{"https://example.com/a.png"}};
    MediaSource moved = std::move(source);
    EXPECT_EQ(moved.kind(), MediaSource::Kind::Url);
    EXPECT_TRUE(source.empty()); // NOLINT(bugprone-use-after-move)
}

TEST_F(MediaSourceTest, ResolveEachKind) {
    FakeTransport transport;
    transport.setGet("https://example.com/a.png", toBytes("PNGDATA"));

    auto fromData = resolve(MediaSource{InlineData{toBytes("abc")}}, transport);
    ASSERT_TRUE(fromData);
    EXPECT_EQ(toString(fromData.value()), "abc");

    auto fromUrl = resolve(MediaSource{RemoteUrl{"https://example.com/a.png"}}, transport);
    ASSERT_TRUE(fromUrl);
    EXPECT_EQ(toString(fromUrl.value()), "PNGDATA");

    auto path = LocalPath::from(test::write_file(dir_ / "b.txt", "file bytes"));
    ASSERT_TRUE(path);
    auto fromPath = resolve(MediaSource{path.value()}, transport);
    ASSERT_TRUE(fromPath);
    EXPECT_EQ(toString(fromPath.value()), "file bytes");

    EXPECT_EQ(transport.getCount(), 1);
}

TEST_F(MediaSourceTest, ResolveFailures) {
    FakeTransport transport;
    auto badUrl = resolve(MediaSource{RemoteUrl{"https://example.com/404"}}, transport);
    ASSERT_FALSE(badUrl);
    EXPECT_EQ(badUrl.error().code, ErrorCode::Transport);

    auto file = test::write_file(dir_ / "gone.txt", "x");
    auto path = LocalPath::from(file);
    ASSERT_TRUE(path);
    fs::remove(file);
    auto gone = resolve(MediaSource{path.value()}, transport);
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.error().code, ErrorCode::Io);

    auto empty = resolve(MediaSource{}, transport);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InternalError);
}

TEST_F(MediaSourceTest, LocalReadStopsWhenCancelled) {
    auto file = test::write_file(dir_ / "large.bin", std::string(300 * 1024, 'x'));

    auto whole = readFileBytes(file);
    ASSERT_TRUE(whole);
    EXPECT_EQ(whole.value().size(), 300u * 1024u);

    int polls = 0;
    auto partial = readFileBytes(file, [&polls] { return ++polls > 2; });
    ASSERT_FALSE(partial);
    EXPECT_EQ(partial.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(polls, 3);

    auto source = MediaSource::fromString(file.string());
    ASSERT_EQ(source.kind(), MediaSource::Kind::Path);
    FakeTransport transport;
    auto resolved = resolve(source, transport, [] { return true; });
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, ErrorCode::OperationCancelled);
}

TEST(UrlCheckTest, WellFormed) {
    EXPECT_TRUE(isWellFormedUrl("https://example.com/a.mp3"));
    EXPECT_TRUE(isWellFormedUrl("http://127.0.0.1:8765"));
    EXPECT_FALSE(isWellFormedUrl(""));
    EXPECT_FALSE(isWellFormedUrl("hello world"));
}
