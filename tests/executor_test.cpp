#include "adminq/executor/composite_executor.hpp"
#include "adminq/executor/ollama_executor.hpp"
#include "adminq/storage/state_strings.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace adminq;
using namespace adminq::test;
using json = nlohmann::json;

TEST(ExecutionOutcomeTest, Factories_SetKind) {
  EXPECT_TRUE(ExecutionOutcome::success().ok());
  EXPECT_EQ(ExecutionOutcome::retryable("x").kind, ExecutionOutcome::Kind::Retryable);
  EXPECT_EQ(ExecutionOutcome::fatal("y").reason, "y");
  EXPECT_FALSE(ExecutionOutcome::fatal("y").ok());
}

TEST(TaskKindNamesTest, ParseAndName_Agree) {
  for (auto kind : {TaskKind::DockerPush, TaskKind::DockerBuild,
                    TaskKind::DockerPull, TaskKind::DockerTag,
                    TaskKind::OllamaPull, TaskKind::OllamaRun}) {
    auto parsed = parse_task_kind(task_kind_name(kind));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, kind);
  }
  EXPECT_FALSE(parse_task_kind("docker_compose").has_value());
}

TEST(NoopExecutorTest, CompletesInline) {
  auto noop = create_noop_executor();

  auto outcome = run_attempt(*noop, make_request(TaskKind::OllamaRun, json::object()));

  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->ok());
  EXPECT_EQ(outcome->result["dry_run"], true);
  EXPECT_EQ(outcome->result["kind"], "ollama_run");
}

TEST(NoopExecutorTest, DerivesKeysLikeRealExecutors) {
  auto noop = create_noop_executor();

  EXPECT_EQ(noop->derive_key(TaskKind::DockerPush, json{{"image_name", "web"}}),
            "web:latest");
  EXPECT_EQ(noop->derive_key(TaskKind::OllamaPull, json{{"model_name", "llama3"}}),
            "ollama:llama3");
  EXPECT_EQ(noop->derive_key(TaskKind::DockerBuild, json::object()), "docker_build");
  EXPECT_FALSE(noop->validate(TaskKind::DockerPush, json::array()).has_value());
}

TEST(CompositeExecutorTest, RoutesByKind) {
  CompositeExecutor composite;
  composite.register_executor(create_ollama_executor(ExecutorsConfig{}));

  EXPECT_TRUE(composite.supports(TaskKind::OllamaPull));
  EXPECT_FALSE(composite.supports(TaskKind::DockerPush));
  EXPECT_EQ(composite.derive_key(TaskKind::OllamaPull, json{{"model_name", "m"}}),
            "ollama:m");
  EXPECT_EQ(composite.derive_key(TaskKind::DockerPush, json{{"image_name", "w"}}),
            "");

  auto rejected = composite.validate(TaskKind::DockerPush, json{{"image_name", "w"}});
  ASSERT_FALSE(rejected.has_value());
  EXPECT_NE(rejected.error().find("no executor"), std::string::npos);
}

TEST(CompositeExecutorTest, UnroutableStart_CompletesFatal) {
  CompositeExecutor composite;

  auto outcome = run_attempt(composite, make_request(TaskKind::DockerPush, json::object()));

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->kind, ExecutionOutcome::Kind::Fatal);
}

TEST(CompositeExecutorTest, Cancel_ReachesOwningExecutor) {
  auto scripted = std::make_unique<ScriptedExecutor>();
  auto* inner = scripted.get();
  Gate gate;
  inner->set_handler([&](const ExecutorRequest& req, int) {
    return gate.wait(req.cancel) ? ExecutionOutcome::success()
                                 : ExecutionOutcome::retryable("interrupted");
  });

  CompositeExecutor composite;
  composite.register_executor(std::move(scripted));

  ExecutionSink sink;
  std::atomic<bool> done{false};
  sink.on_complete = [&](const AttemptId&, ExecutionOutcome) { done = true; };
  composite.start(make_request(TaskKind::DockerPush, json::object()), std::move(sink));

  composite.cancel(AttemptId{"attempt-1"});
  EXPECT_EQ(inner->cancel_count(), 1u);

  gate.open();
  EXPECT_TRUE(wait_until([&] { return done.load(); }));
  inner->join();

  // Routing entry is gone after completion.
  composite.cancel(AttemptId{"attempt-1"});
  EXPECT_EQ(inner->cancel_count(), 1u);
}

TEST(CompositeExecutorTest, DryRunConfig_UsesNoop) {
  ExecutorsConfig config;
  config.dry_run = true;
  auto executor = create_composite_executor(config);

  auto outcome = run_attempt(
      *executor, make_request(TaskKind::DockerPush, json{{"image_name", "web"}}));

  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->ok());
  EXPECT_EQ(outcome->result["dry_run"], true);
}

TEST(CompositeExecutorTest, DefaultConfig_SupportsEveryKind) {
  auto executor = create_composite_executor(ExecutorsConfig{});

  for (auto kind : {TaskKind::DockerPush, TaskKind::DockerBuild,
                    TaskKind::DockerPull, TaskKind::DockerTag,
                    TaskKind::OllamaPull, TaskKind::OllamaRun}) {
    EXPECT_TRUE(executor->supports(kind)) << task_kind_name(kind);
  }
}

class OllamaExecutorTest : public ::testing::Test {
protected:
  auto interpret(TaskKind kind, json params, int exit_code, std::string output)
      -> ExecutionOutcome {
    ProcessResult result;
    result.exit_code = exit_code;
    result.output = std::move(output);
    return executor_.interpret(make_request(kind, std::move(params)), result);
  }

  OllamaExecutor executor_{ExecutorsConfig{}};
};

TEST_F(OllamaExecutorTest, Validate_RequiresModelAndPrompt) {
  EXPECT_TRUE(executor_.validate(TaskKind::OllamaPull, json{{"model_name", "llama3"}})
                  .has_value());
  EXPECT_FALSE(executor_.validate(TaskKind::OllamaPull, json::object()).has_value());
  EXPECT_FALSE(executor_.validate(TaskKind::OllamaRun, json{{"model_name", "llama3"}})
                   .has_value());
  EXPECT_TRUE(executor_
                  .validate(TaskKind::OllamaRun,
                            json{{"model_name", "llama3"}, {"prompt", "hi"},
                                 {"max_tokens", 64}, {"temperature", 0.2}})
                  .has_value());
  EXPECT_FALSE(executor_
                   .validate(TaskKind::OllamaRun,
                             json{{"model_name", "llama3"}, {"prompt", "hi"},
                                  {"max_tokens", 0}})
                   .has_value());
}

TEST_F(OllamaExecutorTest, DeriveKey_PerModel) {
  EXPECT_EQ(executor_.derive_key(TaskKind::OllamaPull, json{{"model_name", "qwen"}}),
            "ollama:qwen");
  EXPECT_EQ(executor_.derive_key(TaskKind::OllamaRun, json{{"model_name", "qwen"}}),
            "ollama-run:qwen");
}

TEST_F(OllamaExecutorTest, BuildCommand_Pull) {
  ExecutorsConfig config;
  config.ollama_models_path = "/models";
  OllamaExecutor executor(config);

  auto spec = executor.build_command(
      make_request(TaskKind::OllamaPull, json{{"model_name", "llama3"}}));

  ASSERT_TRUE(spec.has_value());
  EXPECT_EQ(spec->argv, (std::vector<std::string>{"ollama", "pull", "llama3"}));
  ASSERT_EQ(spec->env.size(), 1u);
  EXPECT_EQ(spec->env[0].first, "OLLAMA_MODELS");
  EXPECT_EQ(spec->env[0].second, "/models");
}

TEST_F(OllamaExecutorTest, BuildCommand_RunPostsGenerateRequest) {
  auto spec = executor_.build_command(make_request(
      TaskKind::OllamaRun,
      json{{"model_name", "llama3"}, {"prompt", "hello"}, {"max_tokens", 32}}));

  ASSERT_TRUE(spec.has_value());
  EXPECT_EQ(spec->argv.front(), "curl");
  EXPECT_NE(std::ranges::find(spec->argv,
                              std::string("http://localhost:11434/api/generate")),
            spec->argv.end());
  auto body = json::parse(spec->argv.back());
  EXPECT_EQ(body["model"], "llama3");
  EXPECT_EQ(body["prompt"], "hello");
  EXPECT_EQ(body["stream"], false);
  EXPECT_EQ(body["options"]["num_predict"], 32);
}

TEST_F(OllamaExecutorTest, Interpret_RunSuccess) {
  auto outcome = interpret(TaskKind::OllamaRun, json{{"model_name", "llama3"}}, 0,
                           R"({"response":"hi there","prompt_eval_count":4,)"
                           R"("eval_count":10,"eval_duration":2000000000})");

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.result["generated_text"], "hi there");
  EXPECT_EQ(outcome.result["prompt_tokens"], 4);
  EXPECT_EQ(outcome.result["generated_tokens"], 10);
  EXPECT_DOUBLE_EQ(outcome.result["tokens_per_second"].get<double>(), 5.0);
}

TEST_F(OllamaExecutorTest, Interpret_Failures) {
  EXPECT_EQ(interpret(TaskKind::OllamaRun, json{{"model_name", "m"}}, 7,
                      "curl: (7) Failed to connect")
                .kind,
            ExecutionOutcome::Kind::Retryable);
  EXPECT_EQ(interpret(TaskKind::OllamaRun, json{{"model_name", "m"}}, 0, "not json")
                .kind,
            ExecutionOutcome::Kind::Fatal);
  EXPECT_EQ(interpret(TaskKind::OllamaRun, json{{"model_name", "m"}}, 0,
                      R"({"error":"model 'm' not found"})")
                .kind,
            ExecutionOutcome::Kind::Fatal);
  EXPECT_EQ(interpret(TaskKind::OllamaPull, json{{"model_name", "m"}}, 1,
                      "pulling manifest\nError: file does not exist\n")
                .kind,
            ExecutionOutcome::Kind::Fatal);
  EXPECT_EQ(interpret(TaskKind::OllamaPull, json{{"model_name", "m"}}, 1,
                      "Error: connection refused\n")
                .kind,
            ExecutionOutcome::Kind::Retryable);
}

TEST_F(OllamaExecutorTest, Interpret_PullSuccess) {
  auto outcome = interpret(TaskKind::OllamaPull, json{{"model_name", "llama3"}}, 0,
                           "success\n");

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.result["model_name"], "llama3");
}
