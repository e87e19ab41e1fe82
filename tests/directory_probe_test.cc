#include "test_http_server.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <core/discovery/probe/directory_probe.h>
#include <gtest/gtest.h>

namespace net = boost::asio;
namespace http = boost::beast::http;
using namespace bridgefinder::core;
using bridgefinder::test::TestHttpServer;
using namespace std::chrono_literals;

namespace {

constexpr std::string_view kListing =
    R"([{"id": "001788fffe4a2b3c", "internalipaddress": "192.168.1.2", "port": 443}])";

TestHttpServer::Route answer(http::status status, std::string_view body = "") {
    return {status, "application/json", std::string(body)};
}

} // namespace

// =============================================================================
// Response parsing
// =============================================================================

TEST(ParseDirectoryResponse, ReadsEveryBridge) {
    auto records = ParseDirectoryResponse(R"([
        {"id": "001788fffe4a2b3c", "internalipaddress": "192.168.1.2", "port": 443},
        {"id": "001788fffe100491", "internalipaddress": "192.168.1.7"}
    ])");

    ASSERT_TRUE(records);
    ASSERT_EQ(records->size(), 2u);
    EXPECT_EQ((*records)[0].id, "001788fffe4a2b3c");
    EXPECT_EQ((*records)[0].normalized_id, "001788FFFE4A2B3C");
    EXPECT_EQ((*records)[0].address, "192.168.1.2");
    EXPECT_EQ((*records)[0].port, 443);
    EXPECT_EQ((*records)[1].address, "192.168.1.7");
    EXPECT_FALSE((*records)[1].port);
}

TEST(ParseDirectoryResponse, EmptyArrayMeansNoBridges) {
    auto records = ParseDirectoryResponse("[]");

    ASSERT_TRUE(records);
    EXPECT_TRUE(records->empty());
}

TEST(ParseDirectoryResponse, IncompleteEntriesAreSkipped) {
    auto records = ParseDirectoryResponse(R"([
        "192.168.1.2",
        {"internalipaddress": "192.168.1.3"},
        {"id": "001788fffe4a2b3c"},
        {"id": "", "internalipaddress": "192.168.1.4"},
        {"id": 17, "internalipaddress": "192.168.1.5"},
        {"id": "001788fffe100491", "internalipaddress": "192.168.1.6", "port": 70000},
        {"id": "001788fffe100492", "internalipaddress": "192.168.1.8", "name": "Upstairs"}
    ])");

    ASSERT_TRUE(records);
    ASSERT_EQ(records->size(), 2u);
    EXPECT_EQ((*records)[0].address, "192.168.1.6");
    EXPECT_FALSE((*records)[0].port);
    EXPECT_EQ((*records)[1].display_name, "Upstairs");
}

TEST(ParseDirectoryResponse, NonArrayBodyIsAnError) {
    EXPECT_FALSE(ParseDirectoryResponse(""));
    EXPECT_FALSE(ParseDirectoryResponse("<html>502 Bad Gateway</html>"));
    EXPECT_FALSE(ParseDirectoryResponse(R"({"error": "rate limited"})"));
}

// =============================================================================
// Retry policy
// =============================================================================

class DirectoryLookupTest : public ::testing::Test {
protected:
    DirectoryOptions options() const {
        DirectoryOptions local;
        local.host = "127.0.0.1";
        local.port = server_.port();
        local.tls = false;
        local.attempts = 3;
        local.request_timeout = 2s;
        local.retry_backoff = 10ms;
        local.deadline = 5s;
        return local;
    }

    std::vector<CandidateRecord> run(DirectoryOptions directory) {
        DirectoryProbe lookup(std::move(directory), nullptr);

        std::vector<CandidateRecord> result;
        bool done = false;
        server_.Start();
        started_ = std::chrono::steady_clock::now();
        net::co_spawn(ioc_,
                      lookup.Run(StopSignal{}),
                      [&](std::exception_ptr e, std::vector<CandidateRecord> found) {
                          server_.Stop();
                          if (e) {
                              std::rethrow_exception(e);
                          }
                          result = std::move(found);
                          done = true;
                      });
        ioc_.run_for(10s);
        elapsed_ = std::chrono::steady_clock::now() - started_;

        EXPECT_TRUE(done);
        return result;
    }

    net::io_context ioc_;
    TestHttpServer server_{ioc_};
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::duration elapsed_{};
};

TEST_F(DirectoryLookupTest, FirstAnswerIsUsed) {
    server_.AddRoute("/", answer(http::status::ok, kListing));

    auto found = run(options());

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].address, "192.168.1.2");
    EXPECT_EQ(server_.requests(), 1);
}

TEST_F(DirectoryLookupTest, RetriesAfterServerError) {
    server_.AddRoutes("/",
                      {answer(http::status::service_unavailable),
                       answer(http::status::ok, kListing)});

    auto found = run(options());

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(server_.requests(), 2);
}

TEST_F(DirectoryLookupTest, RetriesAfterRequestTimeoutStatus) {
    server_.AddRoutes("/",
                      {answer(http::status::request_timeout), answer(http::status::ok, kListing)});

    EXPECT_EQ(run(options()).size(), 1u);
    EXPECT_EQ(server_.requests(), 2);
}

TEST_F(DirectoryLookupTest, RetriesAfterMalformedBody) {
    server_.AddRoutes("/",
                      {answer(http::status::ok, R"({"error": "busy"})"),
                       answer(http::status::ok, kListing)});

    EXPECT_EQ(run(options()).size(), 1u);
    EXPECT_EQ(server_.requests(), 2);
}

TEST_F(DirectoryLookupTest, GivesUpOnClientError) {
    server_.AddRoutes("/",
                      {answer(http::status::too_many_requests),
                       answer(http::status::ok, kListing)});

    EXPECT_TRUE(run(options()).empty());
    EXPECT_EQ(server_.requests(), 1);
}

TEST_F(DirectoryLookupTest, StopsAfterTheLastAttempt) {
    server_.AddRoute("/", answer(http::status::bad_gateway));

    EXPECT_TRUE(run(options()).empty());
    EXPECT_EQ(server_.requests(), 3);
}

TEST_F(DirectoryLookupTest, BackoffGrowsWithTheAttempt) {
    server_.AddRoute("/", answer(http::status::service_unavailable));
    auto slow = options();
    slow.retry_backoff = 100ms;

    EXPECT_TRUE(run(slow).empty());
    // 100 ms after the first attempt, 200 ms after the second.
    EXPECT_GE(elapsed_, 300ms);
}

TEST_F(DirectoryLookupTest, UnreachableDirectoryIsRetried) {
    auto unreachable = options();
    unreachable.host = "127.0.0.2";

    EXPECT_TRUE(run(unreachable).empty());
    EXPECT_EQ(server_.requests(), 0);
}

TEST_F(DirectoryLookupTest, DeadlineCutsTheBackoffShort) {
    server_.AddRoute("/", answer(http::status::service_unavailable));
    auto impatient = options();
    impatient.retry_backoff = 10s;
    impatient.deadline = 200ms;

    EXPECT_TRUE(run(impatient).empty());
    EXPECT_EQ(server_.requests(), 1);
    EXPECT_LT(elapsed_, 3s);
}
