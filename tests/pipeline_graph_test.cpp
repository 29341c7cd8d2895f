#include "orchestra/graph/pipeline_graph.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>

using namespace orchestra;
using namespace orchestra::test;

namespace {

auto compile_error(const PipelineSpec& spec) -> std::error_code {
  auto graph = PipelineGraph::compile(spec);
  return graph ? std::error_code{} : graph.error();
}

auto mentions(const std::vector<std::string>& messages, std::string_view text)
    -> bool {
  return std::ranges::any_of(messages, [&](const std::string& m) {
    return m.find(text) != std::string::npos;
  });
}

}  // namespace

TEST(PipelineGraphTest, CompilesLinearPipeline) {
  auto graph = PipelineGraph::compile(linear_pipeline());
  ASSERT_TRUE(graph.has_value());

  const auto& g = **graph;
  EXPECT_EQ(g.name(), "linear");
  EXPECT_EQ(g.size(), 3);
  EXPECT_EQ(g.index_of(task_id("A")), 0u);
  EXPECT_EQ(g.index_of(task_id("C")), 2u);
  EXPECT_EQ(g.component(1).name, "step");
  EXPECT_EQ(g.upstream(1).size(), 1);
  EXPECT_EQ(g.downstream(0).size(), 1);
}

TEST(PipelineGraphTest, EdgesFollowArgumentBindings) {
  auto graph = PipelineGraph::compile(diamond_pipeline());
  ASSERT_TRUE(graph.has_value());

  const auto& g = **graph;
  auto d = g.index_of(task_id("D"));
  EXPECT_EQ(g.upstream(d).size(), 2);
  EXPECT_EQ(g.downstream(g.index_of(task_id("A"))).size(), 2);
}

TEST(PipelineGraphTest, SeveralPortsOfOneProducerMakeOneEdge) {
  auto p = diamond_pipeline();
  p.tasks[3].arguments = {{"left", from("A", "out")},
                          {"right", from("A", "out")}};
  auto graph = PipelineGraph::compile(p);
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ((*graph)->upstream(3).size(), 1);
}

TEST(PipelineGraphTest, RejectsCycle) {
  auto p = linear_pipeline();
  p.tasks[0] = task("A", "step", {{"in", from("C", "out")}});

  std::vector<std::string> messages;
  auto graph = PipelineGraph::compile(p, &messages);
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::CycleDetected));
  EXPECT_TRUE(is_graph_validation_error(graph.error()));
  EXPECT_TRUE(mentions(messages, "cycle"));
}

TEST(PipelineGraphTest, RejectsSelfReference) {
  auto p = linear_pipeline();
  p.tasks[1] = task("B", "step", {{"in", from("B", "out")}});
  EXPECT_EQ(compile_error(p), make_error_code(Error::CycleDetected));
}

TEST(PipelineGraphTest, RejectsReferenceToUnknownTask) {
  auto p = linear_pipeline();
  p.tasks[2] = task("C", "step", {{"in", from("Z", "out")}});
  EXPECT_EQ(compile_error(p), make_error_code(Error::DanglingReference));
}

TEST(PipelineGraphTest, RejectsReferenceToUnknownPort) {
  auto p = linear_pipeline();
  p.tasks[2] = task("C", "step", {{"in", from("B", "missing")}});

  std::vector<std::string> messages;
  auto graph = PipelineGraph::compile(p, &messages);
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::DanglingReference));
  EXPECT_TRUE(mentions(messages, "B.missing"));
}

TEST(PipelineGraphTest, RejectsArgumentForUndeclaredInput) {
  auto p = linear_pipeline();
  p.tasks[1].arguments.emplace("bogus", constant("x"));
  EXPECT_EQ(compile_error(p), make_error_code(Error::DanglingReference));
}

TEST(PipelineGraphTest, RejectsUnknownComponent) {
  auto p = linear_pipeline();
  p.tasks[0].component = "nonexistent";
  EXPECT_EQ(compile_error(p), make_error_code(Error::UnknownComponent));
}

TEST(PipelineGraphTest, RejectsMissingRequiredArgument) {
  auto p = linear_pipeline();
  p.tasks[1].arguments.clear();
  EXPECT_EQ(compile_error(p), make_error_code(Error::MissingArgument));
}

TEST(PipelineGraphTest, OptionalAndDefaultedInputsNeedNoArgument) {
  auto p = linear_pipeline();
  auto c = component("tolerant", {optional_input("maybe"), input("flag")},
                     {output("out")});
  c.inputs[1].default_value = "on";
  p.components.push_back(c);
  p.tasks.push_back(task("D", "tolerant"));
  EXPECT_TRUE(PipelineGraph::compile(p).has_value());
}

TEST(PipelineGraphTest, RejectsDuplicateTaskIds) {
  auto p = linear_pipeline();
  p.tasks.push_back(task("A", "source"));
  EXPECT_EQ(compile_error(p), make_error_code(Error::DuplicateTask));
}

TEST(PipelineGraphTest, RejectsTypeMismatch) {
  PipelineSpec p;
  p.name = "typed";
  p.components = {
      component("produce", {}, {output("n", "Integer")}),
      component("consume", {input("s", "String")}, {}),
  };
  p.tasks = {task("P", "produce"), task("C", "consume", {{"s", from("P", "n")}})};
  EXPECT_EQ(compile_error(p), make_error_code(Error::TypeMismatch));
}

TEST(PipelineGraphTest, TypeNamesCompareCaseInsensitively) {
  PipelineSpec p;
  p.name = "typed";
  p.components = {
      component("produce", {}, {output("n", "integer")}),
      component("consume", {input("n", "Integer")}, {}),
  };
  p.tasks = {task("P", "produce"), task("C", "consume", {{"n", from("P", "n")}})};
  EXPECT_TRUE(PipelineGraph::compile(p).has_value());
}

TEST(PipelineGraphTest, CollectionItemsCheckedAgainstElementType) {
  PipelineSpec p;
  p.name = "fanin";
  p.components = {
      component("produce", {}, {output("model", "Model")}),
      component("pick", {input("models", "List<Model>")}, {}),
  };
  p.tasks = {
      task("m1", "produce"),
      task("m2", "produce"),
      task("best", "pick",
           {{"models", CollectionArgument{{ref("m1", "model"),
                                           ref("m2", "model")}}}}),
  };
  auto graph = PipelineGraph::compile(p);
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ((*graph)->upstream(2).size(), 2);

  p.components[1].inputs[0].type = "List<Dataset>";
  EXPECT_EQ(compile_error(p), make_error_code(Error::TypeMismatch));
}

TEST(PipelineGraphTest, RejectsUnknownPipelineInput) {
  auto p = linear_pipeline();
  p.components.push_back(component("echo", {input("text")}, {output("out")}));
  p.tasks.push_back(task("E", "echo", {{"text", graph_input("message")}}));
  EXPECT_EQ(compile_error(p), make_error_code(Error::DanglingReference));

  p.inputs.push_back(PipelineInput{.name = "message"});
  EXPECT_TRUE(PipelineGraph::compile(p).has_value());
}

TEST(PipelineGraphTest, RejectsPlaceholderForUndeclaredPort) {
  auto p = linear_pipeline();
  p.components[0].container.args = {CommandArgument::output_path("nope")};
  EXPECT_EQ(compile_error(p), make_error_code(Error::DanglingReference));
}

TEST(PipelineGraphTest, RejectsPipelineOutputToUnknownPort) {
  auto p = linear_pipeline();
  p.outputs.emplace("result", ref("C", "out"));
  EXPECT_TRUE(PipelineGraph::compile(p).has_value());

  p.outputs["result"] = ref("C", "missing");
  EXPECT_EQ(compile_error(p), make_error_code(Error::DanglingReference));
}

TEST(PipelineGraphTest, ReportsEveryProblem) {
  auto p = linear_pipeline();
  p.tasks[0].component = "nonexistent";
  p.tasks[2] = task("C", "step", {{"in", from("Z", "out")}});

  auto report = PipelineGraph::validate(p);
  EXPECT_FALSE(report.ok());
  EXPECT_GE(report.messages.size(), 2);
  EXPECT_EQ(report.code, make_error_code(Error::UnknownComponent));
}

TEST(PipelineGraphTest, EmptyPipelineIsInvalid) {
  PipelineSpec p;
  p.name = "empty";
  auto report = PipelineGraph::validate(p);
  EXPECT_FALSE(report.ok());
}

TEST(PipelineGraphTest, TypesCompatible) {
  EXPECT_TRUE(types_compatible("", "String"));
  EXPECT_TRUE(types_compatible("Model", ""));
  EXPECT_TRUE(types_compatible("model", "MODEL"));
  EXPECT_FALSE(types_compatible("Model", "Dataset"));
}

TEST(PipelineGraphTest, RejectsOutputsSharingAStorageName) {
  auto p = linear_pipeline();
  p.components.push_back(
      component("writer", {}, {output("model/v1"), output("model_v1")}));
  p.tasks.push_back(task("W", "writer"));

  std::vector<std::string> messages;
  auto graph = PipelineGraph::compile(p, &messages);
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::AlreadyExists));
  EXPECT_TRUE(mentions(messages, "model_v1"));
}

TEST(PipelineGraphTest, ValidationErrorsAreClassified) {
  EXPECT_TRUE(is_graph_validation_error(make_error_code(Error::MissingArgument)));
  EXPECT_TRUE(is_graph_validation_error(make_error_code(Error::DuplicateTask)));
  EXPECT_FALSE(is_graph_validation_error(make_error_code(Error::AlreadyExists)));
  EXPECT_FALSE(
      is_graph_validation_error(make_error_code(Error::DatabaseQueryFailed)));
  EXPECT_FALSE(is_graph_validation_error(
      std::make_error_code(std::errc::no_such_file_or_directory)));
}
