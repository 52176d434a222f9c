#include "fake_backend.hpp"

#include "sandpool/core/errors.hpp"
#include "sandpool/core/executor.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace sandpool::core;
using sandpool::backend::BackendExecResult;
using sandpool::testing::FakeBackend;
using sandpool::testing::HangUntilCancelled;
using sandpool::utils::CancellationToken;

namespace {

const std::string kMarker = "\n... [output truncated]";

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FakeBackend>();
        sandpool::backend::EnvironmentSpec spec;
        spec.workspace_root = "/workspace";
        handle_.id = backend_->Create(spec);
        handle_.workspace_root = "/workspace";
    }

    ExecutionResult Run(const Executor& executor, const std::string& payload,
                        Language language = Language::PYTHON,
                        std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        ExecutionRequest request;
        request.payload = payload;
        request.language = language;
        return executor.Run(handle_, request, timeout, CancellationToken());
    }

    void ReturnOutput(const std::string& out, const std::string& err, int exit_code) {
        backend_->SetExecHandler([out, err, exit_code](const std::string&,
                                                      const std::vector<std::string>&,
                                                      const CancellationToken&) {
            BackendExecResult result;
            result.stdout_output = out;
            result.stderr_output = err;
            result.exit_code = exit_code;
            return result;
        });
    }

    std::shared_ptr<FakeBackend> backend_;
    EnvironmentHandle handle_;
};

TEST_F(ExecutorTest, BuildsInterpreterInvocation) {
    EXPECT_EQ(Executor::BuildInvocation(Language::PYTHON, "print(1)"),
              (std::vector<std::string>{"python", "-c", "print(1)"}));
    EXPECT_EQ(Executor::BuildInvocation(Language::BASH, "ls"),
              (std::vector<std::string>{"bash", "-c", "ls"}));
    EXPECT_EQ(Executor::BuildInvocation(Language::SH, "ls"),
              (std::vector<std::string>{"sh", "-c", "ls"}));
    EXPECT_EQ(Executor::BuildInvocation(Language::NODE, "1"),
              (std::vector<std::string>{"node", "-e", "1"}));
}

TEST_F(ExecutorTest, SuccessfulRunCarriesExitCode) {
    ReturnOutput("hi\n", "", 0);
    Executor executor(backend_, 100, kMarker);

    auto result = Run(executor, "print('hi')");

    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hi\n");
    EXPECT_FALSE(result.has_error());
    EXPECT_EQ(OutcomeFor(result), ReleaseOutcome::REUSABLE);

    auto argv = backend_->ExecArgv();
    ASSERT_EQ(argv.size(), 1u);
    EXPECT_EQ(argv[0], (std::vector<std::string>{"python", "-c", "print('hi')"}));
}

// The payload failing is not the environment failing
TEST_F(ExecutorTest, NonZeroExitIsApplicationLevel) {
    ReturnOutput("", "Traceback: ZeroDivisionError\n", 1);
    Executor executor(backend_, 100, kMarker);

    auto result = Run(executor, "1/0");

    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 1);
    EXPECT_FALSE(result.has_error());
    EXPECT_EQ(result.stderr_output, "Traceback: ZeroDivisionError\n");
    EXPECT_EQ(OutcomeFor(result), ReleaseOutcome::REUSABLE);
}

TEST_F(ExecutorTest, TimeoutYieldsTimeoutWithoutExitCode) {
    backend_->SetExecHandler(HangUntilCancelled("partial\n"));
    Executor executor(backend_, 100, kMarker);

    auto start = std::chrono::steady_clock::now();
    auto result = Run(executor, "while True: pass", Language::PYTHON,
                      std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(result.stdout_output, "partial\n");
    EXPECT_EQ(OutcomeFor(result), ReleaseOutcome::COMPROMISED);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ExecutorTest, TimeoutCancelsOnlyItsOwnToken) {
    backend_->SetExecHandler(HangUntilCancelled());
    Executor executor(backend_, 100, kMarker);

    CancellationToken mine;
    CancellationToken other;
    ExecutionRequest request;
    request.payload = "sleep 60";
    request.language = Language::SH;

    executor.Run(handle_, request, std::chrono::milliseconds(100), mine);

    EXPECT_TRUE(mine.IsCancelled());
    EXPECT_FALSE(other.IsCancelled());
}

TEST_F(ExecutorTest, BackendFaultIsEnvironmentFailure) {
    backend_->SetExecHandler([](const std::string&, const std::vector<std::string>&,
                                const CancellationToken&) -> BackendExecResult {
        throw SandpoolError(ErrorKind::ENVIRONMENT_FAILURE, "container crashed");
    });
    Executor executor(backend_, 100, kMarker);

    auto result = Run(executor, "print(1)");

    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::ENVIRONMENT_FAILURE);
    EXPECT_NE(result.error_message.find("container crashed"), std::string::npos);
    EXPECT_EQ(OutcomeFor(result), ReleaseOutcome::COMPROMISED);
}

TEST_F(ExecutorTest, ExternalCancellationIsEnvironmentFailure) {
    backend_->SetExecHandler(HangUntilCancelled());
    Executor executor(backend_, 100, kMarker);

    CancellationToken token;
    token.Cancel();
    ExecutionRequest request;
    request.payload = "sleep 60";
    request.language = Language::SH;

    auto result = executor.Run(handle_, request, std::chrono::seconds(5), token);

    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::ENVIRONMENT_FAILURE);
    EXPECT_FALSE(result.exit_code.has_value());
}

TEST_F(ExecutorTest, LongOutputTruncatedToLimitPlusMarker) {
    ReturnOutput(std::string(500, 'a'), std::string(20, 'e'), 0);
    Executor executor(backend_, 100, kMarker);

    auto result = Run(executor, "print('a' * 500)");

    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_output, std::string(100, 'a') + kMarker);
    EXPECT_EQ(result.stderr_output, std::string(20, 'e'));
}

TEST_F(ExecutorTest, OutputBelowLimitIsByteIdentical) {
    std::string output = "caf\xC3\xA9\n\ttab\r\nend";
    ReturnOutput(output, "", 0);
    Executor executor(backend_, 100, kMarker);

    auto result = Run(executor, "print('cafe')");

    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(result.stdout_output, output);
}

// The capture cap must leave enough bytes to fill the limit with
// multibyte characters and still detect overflow
TEST_F(ExecutorTest, MultibyteOutputTruncatesByCharacters) {
    std::string output;
    for (int i = 0; i < 50; ++i) {
        output += "\xF0\x9F\x98\x80";  // 4-byte emoji
    }
    ReturnOutput(output, "", 0);
    Executor executor(backend_, 10, kMarker);

    auto result = Run(executor, "print('emoji')");

    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_output, output.substr(0, 40) + kMarker);
}

// Raw bytes that are not UTF-8 still count toward the limit
TEST_F(ExecutorTest, NonUtf8OutputIsTruncatedWithMarker) {
    ReturnOutput(std::string(100000, '\x80'), "", 0);
    Executor executor(backend_, 10, kMarker);

    auto result = Run(executor, "import sys; sys.stdout.buffer.write(b'\\x80' * 100000)");

    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_output, std::string(10, '\x80') + kMarker);
}

TEST_F(ExecutorTest, CaptureOverflowAlwaysMarksTruncation) {
    backend_->SetExecHandler([](const std::string&, const std::vector<std::string>&,
                                const CancellationToken&) {
        BackendExecResult result;
        result.stdout_output = "short";
        result.stdout_overflow = true;
        return result;
    });
    Executor executor(backend_, 100, kMarker);

    auto result = Run(executor, "print('x')");

    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_output, "short" + kMarker);
    EXPECT_EQ(result.stderr_output, "");
}

TEST_F(ExecutorTest, BlankPayloadNeverReachesEnvironment) {
    Executor executor(backend_, 100, kMarker);

    ExecutionRequest request;
    request.payload = "  \n\t ";
    try {
        executor.Run(handle_, request, std::chrono::seconds(1), CancellationToken());
        FAIL() << "blank payload accepted";
    }
    catch (const SandpoolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_REQUEST);
    }
    EXPECT_EQ(backend_->ExecCalls(), 0);
}

} // namespace
