#include <gtest/gtest.h>
#include <web_tiles/data/fetch_executor.h>
#include "test_support.h"

namespace web_tiles::tests {

class FetchExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<FakeHttpClient>();
        decoder_ = std::make_shared<RawImageDecoder>();
        executor_ = std::make_unique<FetchExecutor>(client_, decoder_);
    }

    const std::string url_ = "https://tiles.example.com/3/1/2.png";
    const TileImage image_ = MakeSolidImage(4, 4, {50, 100, 150, 255});

    std::shared_ptr<FakeHttpClient> client_;
    std::shared_ptr<RawImageDecoder> decoder_;
    std::unique_ptr<FetchExecutor> executor_;
};

TEST_F(FetchExecutorTest, NullCollaboratorsThrow) {
    EXPECT_THROW(FetchExecutor(nullptr, decoder_), std::invalid_argument);
    EXPECT_THROW(FetchExecutor(client_, nullptr), std::invalid_argument);
}

TEST_F(FetchExecutorTest, FirstAttemptSucceeds) {
    client_->SetResponse(url_, FakeHttpClient::Ok(image_));

    const FetchOutcome outcome = executor_->Fetch(url_, 20.0, 3);
    EXPECT_EQ(outcome.kind, FetchOutcomeKind::SUCCESS);
    EXPECT_TRUE(outcome.IsSuccess());
    ASSERT_TRUE(outcome.image.has_value());
    EXPECT_EQ(*outcome.image, image_);
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_EQ(client_->GetTotalCalls(), 1u);
}

TEST_F(FetchExecutorTest, RequestsBypassCacheWithAttemptTimeout) {
    client_->SetResponse(url_, FakeHttpClient::Ok(image_));

    RetryBudget budget;
    budget.retry_count = 4;
    budget.total_timeout_seconds = 60.0;
    executor_->Fetch(url_, budget);

    const auto requests = client_->GetRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, url_);
    EXPECT_DOUBLE_EQ(requests[0].timeout_seconds, 15.0);
    EXPECT_TRUE(requests[0].bypass_cache);
}

TEST_F(FetchExecutorTest, RetriesTransientFailuresThenSucceeds) {
    client_->SetResponses(url_, {FakeHttpClient::Status(503),
                                 FakeHttpClient::Transient(),
                                 FakeHttpClient::Ok(image_)});

    const FetchOutcome outcome = executor_->Fetch(url_, 1.0, 3);
    EXPECT_EQ(outcome.kind, FetchOutcomeKind::SUCCESS);
    EXPECT_EQ(outcome.attempts, 3u);
    EXPECT_EQ(client_->GetCallCount(url_), 3u);
}

TEST_F(FetchExecutorTest, NeverExceedsRetryCount) {
    client_->SetResponse(url_, FakeHttpClient::Status(500));

    const FetchOutcome outcome = executor_->Fetch(url_, 1.0, 3);
    EXPECT_EQ(outcome.kind, FetchOutcomeKind::FAILURE);
    EXPECT_EQ(outcome.attempts, 3u);
    EXPECT_EQ(client_->GetCallCount(url_), 3u);
    EXPECT_FALSE(outcome.error_message.empty());
}

TEST_F(FetchExecutorTest, NotFoundStopsImmediately) {
    client_->SetResponse(url_, FakeHttpClient::Status(404));

    const FetchOutcome outcome = executor_->Fetch(url_, 1.0, 5);
    EXPECT_EQ(outcome.kind, FetchOutcomeKind::NOT_FOUND);
    EXPECT_EQ(outcome.status_code, 404u);
    EXPECT_EQ(client_->GetCallCount(url_), 1u);
}

TEST_F(FetchExecutorTest, NoContentIsEmptyNotFailure) {
    client_->SetResponse(url_, FakeHttpClient::Status(204));

    const FetchOutcome outcome = executor_->Fetch(url_, 1.0, 5);
    EXPECT_EQ(outcome.kind, FetchOutcomeKind::EMPTY);
    EXPECT_FALSE(outcome.image.has_value());
    EXPECT_EQ(client_->GetCallCount(url_), 1u);
}

TEST_F(FetchExecutorTest, ClientErrorIsNotRetried) {
    client_->SetResponse(url_, FakeHttpClient::Status(403));

    const FetchOutcome outcome = executor_->Fetch(url_, 1.0, 5);
    EXPECT_EQ(outcome.kind, FetchOutcomeKind::FAILURE);
    EXPECT_EQ(client_->GetCallCount(url_), 1u);
}

TEST_F(FetchExecutorTest, UndecodableBodyIsRetried) {
    client_->SetResponses(url_, {FakeHttpClient::OkBody({'j', 'u', 'n', 'k'}),
                                 FakeHttpClient::OkBody({}),
                                 FakeHttpClient::Ok(image_)});

    const FetchOutcome outcome = executor_->Fetch(url_, 1.0, 3);
    EXPECT_EQ(outcome.kind, FetchOutcomeKind::SUCCESS);
    EXPECT_EQ(outcome.attempts, 3u);
}

TEST_F(FetchExecutorTest, UndecodableBodyExhaustsAttempts) {
    client_->SetResponse(url_, FakeHttpClient::OkBody({'j', 'u', 'n', 'k'}));

    const FetchOutcome outcome = executor_->Fetch(url_, 1.0, 2);
    EXPECT_EQ(outcome.kind, FetchOutcomeKind::FAILURE);
    EXPECT_EQ(client_->GetCallCount(url_), 2u);
}

TEST_F(FetchExecutorTest, ZeroAttemptsMeansOne) {
    client_->SetResponse(url_, FakeHttpClient::Status(500));

    executor_->Fetch(url_, 1.0, 0);
    EXPECT_EQ(client_->GetCallCount(url_), 1u);
}

TEST(RetryBudgetTest, SplitsTimeoutEvenly) {
    RetryBudget budget;
    budget.retry_count = 3;
    budget.total_timeout_seconds = 60.0;
    EXPECT_DOUBLE_EQ(budget.GetAttemptTimeout(), 20.0);

    budget.retry_count = 1;
    EXPECT_DOUBLE_EQ(budget.GetAttemptTimeout(), 60.0);
}

} // namespace web_tiles::tests
