#include "fake_backend.hpp"

#include "sandpool/core/errors.hpp"
#include "sandpool/core/sandbox_pool.hpp"
#include "sandpool/service/sandbox_service.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <thread>

using namespace sandpool::core;
using sandpool::backend::BackendExecResult;
using sandpool::service::SandboxService;
using sandpool::testing::FakeBackend;
using sandpool::testing::HangUntilCancelled;
using sandpool::utils::CancellationToken;

namespace {

using Clock = std::chrono::steady_clock;

bool WaitUntil(const std::function<bool()>& condition) {
    auto deadline = Clock::now() + std::chrono::seconds(5);
    while (Clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

class SandboxServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FakeBackend>();
        pool_ = std::make_unique<SandboxPool>(
            PoolConfigBuilder()
                .WithPoolSize(1)
                .WithExecTimeout(std::chrono::seconds(1))
                .WithMaxOutputChars(64)
                .WithHealthCheckInterval(std::chrono::seconds(3600))
                .WithAcquireTimeout(std::chrono::seconds(1))
                .WithShutdownGrace(std::chrono::seconds(1))
                .Build(),
            backend_, std::make_unique<FirstSelection>());
        pool_->Start();
        service_ = std::make_unique<SandboxService>(*pool_, backend_);
    }

    void TearDown() override {
        service_.reset();
        pool_->Shutdown(std::chrono::milliseconds(100));
    }

    ErrorKind KindOf(const std::function<void()>& action) {
        try {
            action();
        }
        catch (const SandpoolError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected SandpoolError";
        return ErrorKind::ENVIRONMENT_FAILURE;
    }

    std::shared_ptr<FakeBackend> backend_;
    std::unique_ptr<SandboxPool> pool_;
    std::unique_ptr<SandboxService> service_;
};

// ============================================================================
// EXECUTION
// ============================================================================

TEST_F(SandboxServiceTest, ExecutesWithDefaultLanguage) {
    auto result = service_->ExecuteCode("print('ok')");

    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "ok\n");

    auto argv = backend_->ExecArgv();
    ASSERT_EQ(argv.size(), 1u);
    EXPECT_EQ(argv[0][0], "python");
    EXPECT_EQ(pool_->Stats().idle, 1u);
}

TEST_F(SandboxServiceTest, LanguageNameIsCaseInsensitive) {
    service_->ExecuteCode("echo hi", "Bash");
    auto argv = backend_->ExecArgv();
    ASSERT_EQ(argv.size(), 1u);
    EXPECT_EQ(argv[0], (std::vector<std::string>{"bash", "-c", "echo hi"}));
}

TEST_F(SandboxServiceTest, BlankCodeLeavesPoolUntouched) {
    auto before = pool_->Stats();

    EXPECT_EQ(KindOf([&] { service_->ExecuteCode(" \n\t"); }), ErrorKind::INVALID_REQUEST);

    auto after = pool_->Stats();
    EXPECT_EQ(backend_->ExecCalls(), 0);
    EXPECT_EQ(after.idle, before.idle);
    EXPECT_EQ(after.created_total, before.created_total);
    EXPECT_EQ(after.destroyed_total, before.destroyed_total);
}

TEST_F(SandboxServiceTest, UnknownLanguageNamesSupportedOnes) {
    try {
        service_->ExecuteCode("puts 1", "ruby");
        FAIL() << "ruby accepted";
    }
    catch (const SandpoolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_REQUEST);
        std::string message = e.what();
        EXPECT_NE(message.find("ruby"), std::string::npos);
        EXPECT_NE(message.find("python"), std::string::npos);
    }
    EXPECT_EQ(backend_->ExecCalls(), 0);
}

TEST_F(SandboxServiceTest, TimeoutRecyclesEnvironment) {
    backend_->SetExecHandler(HangUntilCancelled("tick\n"));
    std::string first_id = pool_->Snapshot().front().id;

    auto result = service_->ExecuteCode("while True: pass");

    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::TIMEOUT);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_EQ(result.stdout_output, "tick\n");

    EXPECT_TRUE(WaitUntil([&] {
        auto handles = pool_->Snapshot();
        return handles.size() == 1 && handles.front().id != first_id &&
               handles.front().state == HandleState::IDLE;
    }));
}

TEST_F(SandboxServiceTest, ApplicationErrorKeepsEnvironment) {
    backend_->SetExecHandler([](const std::string&, const std::vector<std::string>&,
                                const CancellationToken&) {
        BackendExecResult result;
        result.stderr_output = "NameError\n";
        result.exit_code = 1;
        return result;
    });
    std::string first_id = pool_->Snapshot().front().id;

    auto result = service_->ExecuteCode("undefined_name");

    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 1);
    EXPECT_EQ(pool_->Snapshot().front().id, first_id);
    EXPECT_EQ(pool_->Stats().idle, 1u);
}

// ============================================================================
// FILES
// ============================================================================

TEST_F(SandboxServiceTest, WriteReadListCycle) {
    auto outcome = service_->WriteFile("notes/todo.txt", "buy milk");
    EXPECT_EQ(outcome.bytes_written, 8u);
    EXPECT_EQ(outcome.path, "/workspace/notes/todo.txt");

    EXPECT_EQ(service_->ReadFile("notes/todo.txt"), "buy milk");
    EXPECT_EQ(service_->ListFiles(), (std::vector<std::string>{"notes"}));
    EXPECT_EQ(service_->ListFiles("notes"), (std::vector<std::string>{"todo.txt"}));
    EXPECT_EQ(pool_->Stats().idle, 1u);
}

TEST_F(SandboxServiceTest, EscapeIsRejectedBeforeAcquire) {
    // Hold the only handle: a pre-acquire rejection cannot be exhaustion
    auto lease = pool_->Acquire();

    EXPECT_EQ(KindOf([&] { service_->ReadFile("../../etc/passwd"); }), ErrorKind::PATH_ESCAPE);
    EXPECT_EQ(KindOf([&] { service_->WriteFile("/etc/passwd", "x"); }), ErrorKind::PATH_ESCAPE);
    EXPECT_EQ(KindOf([&] { service_->ListFiles("/"); }), ErrorKind::PATH_ESCAPE);
    EXPECT_EQ(backend_->FileCalls(), 0);

    lease.Release(ReleaseOutcome::REUSABLE);
}

TEST_F(SandboxServiceTest, MissingFileKeepsEnvironmentReusable) {
    std::string first_id = pool_->Snapshot().front().id;

    EXPECT_EQ(KindOf([&] { service_->ReadFile("absent.txt"); }), ErrorKind::FILE_NOT_FOUND);

    EXPECT_EQ(pool_->Stats().idle, 1u);
    EXPECT_EQ(pool_->Snapshot().front().id, first_id);
}

TEST_F(SandboxServiceTest, ResetClearsWorkspace) {
    service_->WriteFile("a.txt", "a");
    service_->WriteFile("b/c.txt", "c");

    EXPECT_EQ(service_->ResetWorkspace(), 2u);
    EXPECT_TRUE(service_->ListFiles().empty());
}

TEST_F(SandboxServiceTest, StatsReflectPool) {
    auto stats = service_->Stats();
    EXPECT_EQ(stats.target, 1u);
    EXPECT_EQ(stats.idle, 1u);
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(service_->GetSandboxRoot(), "/workspace");
}

TEST_F(SandboxServiceTest, ClosedPoolRejectsRequests) {
    pool_->Shutdown(std::chrono::milliseconds(10));
    EXPECT_EQ(KindOf([&] { service_->ExecuteCode("print(1)"); }), ErrorKind::POOL_CLOSED);
    EXPECT_EQ(KindOf([&] { service_->ReadFile("a.txt"); }), ErrorKind::POOL_CLOSED);
}

} // namespace
