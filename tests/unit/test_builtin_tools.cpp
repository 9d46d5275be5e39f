#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "policy/policy_guard.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_invoker.hpp"
#include "tools/tool_registry.hpp"
#include "test_support.hpp"

namespace {

using strand::core::errors::ErrorCategory;
using strand::core::errors::get_error;
using strand::core::errors::get_value;
using strand::core::errors::is_error;
using strand::policy::PolicyGuard;
using strand::protocol::ToolCall;
using strand::protocol::ToolErrorKind;
using strand::testing::TempWorkspace;
using strand::testing::write_file;
using strand::tools::BuiltinToolOptions;
using strand::tools::calculate;
using strand::tools::ReadFileTool;
using strand::tools::RunCommandTool;
using strand::tools::ToolContext;
using strand::tools::ToolInvoker;
using strand::tools::ToolRegistry;
using nlohmann::json;

ToolContext make_context(int budget_ms = 5000) {
    return ToolContext{"call-test", std::make_shared<std::atomic_bool>(false),
                       std::chrono::steady_clock::now() + std::chrono::milliseconds(budget_ms)};
}

PolicyGuard guard_for(const TempWorkspace& workspace) {
    auto guard = PolicyGuard::for_workspace(workspace.root());
    EXPECT_FALSE(is_error(guard));
    return get_value(guard);
}

TEST(CalculatorToolTest, IntegerArithmeticStaysInteger) {
    auto sum = calculate(json{{"op", "add"}, {"a", 2}, {"b", 2}}, make_context());
    ASSERT_FALSE(is_error(sum));
    EXPECT_TRUE(get_value(sum).is_number_integer());
    EXPECT_EQ(get_value(sum), 4);

    auto product = calculate(json{{"op", "mul"}, {"a", 6}, {"b", 7}}, make_context());
    ASSERT_FALSE(is_error(product));
    EXPECT_EQ(get_value(product), 42);

    auto difference = calculate(json{{"op", "sub"}, {"a", 1}, {"b", 3}}, make_context());
    ASSERT_FALSE(is_error(difference));
    EXPECT_EQ(get_value(difference), -2);
}

TEST(CalculatorToolTest, DivisionReturnsDouble) {
    auto quotient = calculate(json{{"op", "div"}, {"a", 7}, {"b", 2}}, make_context());
    ASSERT_FALSE(is_error(quotient));
    EXPECT_DOUBLE_EQ(get_value(quotient).get<double>(), 3.5);
}

TEST(CalculatorToolTest, DivisionByZeroFails) {
    auto result = calculate(json{{"op", "div"}, {"a", 1}, {"b", 0}}, make_context());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "division_by_zero");
    EXPECT_EQ(get_error(result).category, ErrorCategory::ToolExecution);
}

TEST(CalculatorToolTest, InvokerRejectsUnknownOperation) {
    ToolRegistry registry;
    BuiltinToolOptions options;
    options.enable_read_file = false;
    auto registered = strand::tools::register_builtin_tools(registry, options);
    ASSERT_FALSE(is_error(registered));
    EXPECT_EQ(get_value(registered), 1u);

    ToolCall call;
    call.id = "call-1";
    call.tool_name = "calculator";
    call.arguments = json{{"op", "pow"}, {"a", 2}, {"b", 8}};
    const auto result = ToolInvoker(registry.snapshot(), 1000).invoke(call);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ToolErrorKind::InvalidArguments);
}

TEST(ReadFileToolTest, ReadsFileInsideWorkspace) {
    TempWorkspace workspace("read_file");
    write_file(workspace.root() / "notes/todo.txt", "buy milk");

    ReadFileTool tool(guard_for(workspace));
    auto result = tool.invoke(json{{"path", "notes/todo.txt"}}, make_context());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"], "buy milk");
}

TEST(ReadFileToolTest, RejectsEscapeAndMissingFiles) {
    TempWorkspace workspace("read_file");
    ReadFileTool tool(guard_for(workspace));

    auto escape = tool.invoke(json{{"path", "../../etc/passwd"}}, make_context());
    ASSERT_TRUE(is_error(escape));
    EXPECT_EQ(get_error(escape).code, "path_outside_workspace");

    auto missing = tool.invoke(json{{"path", "absent.txt"}}, make_context());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "file_not_found");
}

TEST(ReadFileToolTest, RejectsBinaryFile) {
    TempWorkspace workspace("read_file");
    write_file(workspace.root() / "blob.bin", std::string("ab\0cd", 5));

    ReadFileTool tool(guard_for(workspace));
    auto result = tool.invoke(json{{"path", "blob.bin"}}, make_context());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "binary_file");
}

TEST(RunCommandToolTest, CapturesOutputAndExitCode) {
    TempWorkspace workspace("run_command");
    RunCommandTool tool(guard_for(workspace));

    auto result = tool.invoke(json{{"command", "echo hello && exit 3"}}, make_context());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["exit_code"], 3);
    EXPECT_EQ(get_value(result)["stdout"], "hello\n");
}

TEST(RunCommandToolTest, BlockedCommandNeverRuns) {
    TempWorkspace workspace("run_command");
    RunCommandTool tool(guard_for(workspace));

    auto result = tool.invoke(json{{"command", "sudo touch marker"}}, make_context());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "blocked_command");
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "marker"));
}

TEST(RunCommandToolTest, StopsAtDeadline) {
    TempWorkspace workspace("run_command");
    RunCommandTool tool(guard_for(workspace));

    auto result = tool.invoke(json{{"command", "sleep 5"}}, make_context(100));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_timed_out");
}

TEST(RunCommandToolTest, StopsWhenCancelled) {
    TempWorkspace workspace("run_command");
    RunCommandTool tool(guard_for(workspace));

    ToolContext context = make_context();
    context.cancel_token->store(true);
    auto result = tool.invoke(json{{"command", "sleep 5"}}, context);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_cancelled");
}

TEST(BuiltinToolsTest, RegistersEnabledTools) {
    TempWorkspace workspace("builtin_tools");
    ToolRegistry registry;
    BuiltinToolOptions options;
    options.workspace_root = workspace.root();
    options.enable_run_command = true;

    auto registered = strand::tools::register_builtin_tools(registry, options);
    ASSERT_FALSE(is_error(registered));
    EXPECT_EQ(get_value(registered), 3u);
    EXPECT_TRUE(registry.has("calculator"));
    EXPECT_TRUE(registry.has("read_file"));
    EXPECT_TRUE(registry.has("run_command"));
}

TEST(BuiltinToolsTest, MissingWorkspaceFailsRegistration) {
    TempWorkspace workspace("builtin_tools");
    ToolRegistry registry;
    BuiltinToolOptions options;
    options.workspace_root = workspace.root() / "absent";

    auto registered = strand::tools::register_builtin_tools(registry, options);
    ASSERT_TRUE(is_error(registered));
    EXPECT_EQ(get_error(registered).code, "invalid_workspace_root");
}

}  // namespace
