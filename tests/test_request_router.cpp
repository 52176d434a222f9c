#include "fake_backend.hpp"

#include "sandpool/core/sandbox_pool.hpp"
#include "sandpool/remote/remote_dispatcher.hpp"
#include "sandpool/service/json_codec.hpp"
#include "sandpool/service/request_router.hpp"
#include "sandpool/service/sandbox_service.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>

using json = nlohmann::json;
using namespace sandpool::core;
using namespace sandpool::service;
using sandpool::remote::DispatchResult;
using sandpool::remote::RemoteDispatcher;
using sandpool::testing::FakeBackend;

namespace {

// ============================================================================
// CODEC
// ============================================================================

TEST(JsonCodecTest, SuccessfulExecutionHasNullError) {
    ExecutionResult result;
    result.stdout_output = "hi\n";
    result.exit_code = 0;
    result.duration = std::chrono::milliseconds(42);

    auto j = ExecutionToJson(result);
    EXPECT_EQ(j["stdout"], "hi\n");
    EXPECT_EQ(j["stderr"], "");
    EXPECT_EQ(j["exitCode"], 0);
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_TRUE(j["errorKind"].is_null());
    EXPECT_EQ(j["truncated"], false);
    EXPECT_EQ(j["durationMs"], 42);
}

TEST(JsonCodecTest, TimeoutHasNullExitCode) {
    ExecutionResult result;
    result.error_kind = ErrorKind::TIMEOUT;
    result.error_message = "Execution timed out after 30 s";

    auto j = ExecutionToJson(result);
    EXPECT_TRUE(j["exitCode"].is_null());
    EXPECT_EQ(j["errorKind"], "timeout");
    EXPECT_EQ(j["error"], "Execution timed out after 30 s");
}

TEST(JsonCodecTest, ErrorsCarryRetryability) {
    auto exhausted = ErrorToJson(SandpoolError(ErrorKind::POOL_EXHAUSTED, "busy"));
    EXPECT_EQ(exhausted["error"], "busy");
    EXPECT_EQ(exhausted["errorKind"], "pool_exhausted");
    EXPECT_EQ(exhausted["retryable"], true);

    auto escape = ErrorToJson(ErrorKind::PATH_ESCAPE, "outside");
    EXPECT_EQ(escape["retryable"], false);
}

TEST(JsonCodecTest, StatsAndDispatchShapes) {
    PoolStats stats;
    stats.target = 3;
    stats.idle = 2;
    stats.in_use = 1;
    stats.created_total = 4;
    stats.destroyed_total = 1;
    EXPECT_EQ(StatsToJson(stats),
              (json{{"target", 3}, {"idle", 2}, {"inUse", 1}, {"unhealthy", 0},
                    {"created", 4}, {"destroyed", 1}}));

    DispatchResult dispatched;
    dispatched.output = "up 3 days\n";
    EXPECT_EQ(DispatchToJson(dispatched), (json{{"output", "up 3 days\n"}, {"error", nullptr}}));
}

TEST(JsonCodecTest, InvalidUtf8IsReplacedOnDump) {
    ExecutionResult result;
    result.stdout_output = std::string("bad \xFF byte");
    result.exit_code = 0;

    std::string line = DumpLine(ExecutionToJson(result));
    EXPECT_NE(line.find("bad \xEF\xBF\xBD byte"), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

// ============================================================================
// ROUTER
// ============================================================================

class RequestRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FakeBackend>();
        pool_ = std::make_unique<SandboxPool>(
            PoolConfigBuilder()
                .WithPoolSize(1)
                .WithHealthCheckInterval(std::chrono::seconds(3600))
                .WithAcquireTimeout(std::chrono::seconds(1))
                .WithShutdownGrace(std::chrono::seconds(1))
                .Build(),
            backend_, std::make_unique<FirstSelection>());
        pool_->Start();
        service_ = std::make_unique<SandboxService>(*pool_, backend_);
        router_ = std::make_unique<RequestRouter>(service_.get(), nullptr);
    }

    void TearDown() override {
        router_.reset();
        service_.reset();
        pool_->Shutdown(std::chrono::milliseconds(100));
    }

    std::shared_ptr<FakeBackend> backend_;
    std::unique_ptr<SandboxPool> pool_;
    std::unique_ptr<SandboxService> service_;
    std::unique_ptr<RequestRouter> router_;
};

TEST_F(RequestRouterTest, ExecuteReturnsExecutionShape) {
    auto response = router_->Handle({{"op", "execute"}, {"code", "print(1)"}, {"id", 7}});
    EXPECT_EQ(response["stdout"], "ok\n");
    EXPECT_EQ(response["exitCode"], 0);
    EXPECT_EQ(response["id"], 7);
}

TEST_F(RequestRouterTest, FileOperationsRoundTrip) {
    auto written = router_->Handle({{"op", "write"}, {"path", "a.txt"}, {"content", "abc"}});
    EXPECT_EQ(written["ok"], true);
    EXPECT_EQ(written["bytesWritten"], 3);
    EXPECT_EQ(written["path"], "/workspace/a.txt");

    EXPECT_EQ(router_->Handle({{"op", "read"}, {"path", "a.txt"}})["content"], "abc");
    EXPECT_EQ(router_->Handle({{"op", "list"}})["entries"], json::array({"a.txt"}));
    EXPECT_EQ(router_->Handle({{"op", "reset"}})["removed"], 1);
    EXPECT_EQ(router_->Handle({{"op", "stats"}})["target"], 1);
}

TEST_F(RequestRouterTest, ContractErrorsBecomeErrorResponses) {
    auto escape = router_->Handle({{"op", "read"}, {"path", "../../etc/passwd"}});
    EXPECT_EQ(escape["errorKind"], "path_escape");
    EXPECT_EQ(escape["retryable"], false);

    auto missing = router_->Handle({{"op", "write"}, {"path", "a.txt"}});
    EXPECT_EQ(missing["errorKind"], "invalid_request");
    EXPECT_EQ(missing["error"], "Missing string field 'content'");

    auto unknown = router_->Handle({{"op", "format_disk"}});
    EXPECT_EQ(unknown["errorKind"], "invalid_request");

    auto wrong_type = router_->Handle({{"op", "execute"}, {"code", 12}});
    EXPECT_EQ(wrong_type["errorKind"], "invalid_request");

    auto not_object = router_->Handle(json::array({1, 2}));
    EXPECT_EQ(not_object["errorKind"], "invalid_request");
}

TEST_F(RequestRouterTest, MalformedLineIsRejected) {
    auto response = json::parse(router_->HandleLine("{\"op\": "));
    EXPECT_EQ(response["errorKind"], "invalid_request");
    EXPECT_EQ(response["error"].get<std::string>().rfind("Invalid JSON", 0), 0u);
}

TEST_F(RequestRouterTest, HandleLineProducesSingleLine) {
    std::string line = router_->HandleLine(R"json({"op": "execute", "code": "print(1)", "language": "sh"})json");
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(line)["exitCode"], 0);
}

TEST(RemoteRouterTest, ExecuteGoesToRemoteAndPoolOpsAreUnavailable) {
    RemoteConfig config;
    config.hosts = {"10.1.2.3"};
    config.app_user = "runner";
    config.ssh_binary = "echo";
    RemoteDispatcher dispatcher(config);
    RequestRouter router(nullptr, &dispatcher);

    auto executed = router.Handle({{"op", "execute"}, {"code", "uptime"}});
    EXPECT_TRUE(executed["error"].is_null());
    EXPECT_NE(executed["output"].get<std::string>().find("runner@remote_host uptime"),
              std::string::npos);

    auto read = router.Handle({{"op", "read"}, {"path", "a.txt"}});
    EXPECT_EQ(read["errorKind"], "invalid_request");
}

} // namespace
