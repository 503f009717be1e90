#include <gtest/gtest.h>
#include <ankidirect/core/types.h>

#include <string>

using namespace ankidirect;

TEST(ErrorTest, DescribeIncludesMessage) {
    Error e{ErrorCode::RemoteRejected, "model was not found: Basicc"};
    EXPECT_EQ(e.describe(), "Rejected by service: model was not found: Basicc");

    Error bare{ErrorCode::Transport};
    EXPECT_EQ(bare.message, "Transport error");
    EXPECT_EQ(bare.describe(), "Transport error");
}

TEST(ErrorTest, MalformedCarriesContext) {
    auto e = makeMalformedResponse("std::vector<int>", nlohmann::json{{"result", "x"}},
                                   "type must be array");
    EXPECT_EQ(e.code, ErrorCode::MalformedResponse);
    ASSERT_TRUE(e.malformed.has_value());
    EXPECT_EQ(e.malformed->expectedShape, "std::vector<int>");
    EXPECT_EQ(e.malformed->received.at("result"), "x");
    EXPECT_NE(e.describe().find("type must be array"), std::string::npos);
}

TEST(ErrorTest, ResultValueAndError) {
    Result<int> ok = 5;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 5);
    EXPECT_THROW(ok.error(), std::runtime_error);

    Result<int> failed = Error{ErrorCode::NoDataFound, "none"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error(), ErrorCode::NoDataFound);
    EXPECT_THROW(failed.value(), std::runtime_error);

    Result<void> done;
    EXPECT_TRUE(done);
    Result<void> cancelled = ErrorCode::OperationCancelled;
    EXPECT_FALSE(cancelled);
    EXPECT_EQ(cancelled.error().code, ErrorCode::OperationCancelled);
}
