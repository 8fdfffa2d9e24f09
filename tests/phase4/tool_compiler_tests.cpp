#include <cassert>
#include <cmath>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "arbor/tool_compiler.h"
#include "arbor/wire.h"

namespace {

using arbor::Value;

std::shared_ptr<arbor::LocalToolRegistry> calculator() {
  auto registry = std::make_shared<arbor::LocalToolRegistry>();
  arbor::register_calculator_tools(*registry);
  return registry;
}

arbor::EvalOptions options_for(bool parallel) {
  arbor::EvalOptions options;
  options.parallel = parallel;
  options.program_result = arbor::ProgramResult::Last;
  return options;
}

void assert_close(double lhs, double rhs, double tol = 1e-9) { assert(std::fabs(lhs - rhs) <= tol); }

// add(a=1, multiply(a=2, b=3))
struct TwoLeafTree {
  arbor::Tree tree;
  arbor::NodeId outer_a = arbor::kNoNode;
  arbor::NodeId inner_a = arbor::kNoNode;
  arbor::NodeId b = arbor::kNoNode;

  TwoLeafTree() {
    outer_a = tree.add_value("a", Value::int_value_of(1));
    inner_a = tree.add_value("a", Value::int_value_of(2));
    b = tree.add_value("b", Value::int_value_of(3));
    const auto product = tree.add_function("multiply", {inner_a, b});
    tree.add_function("add", {outer_a, product});
  }
};

std::string expect_binding_error(const std::function<void()>& op) {
  try {
    op();
  } catch (const arbor::BindingError& err) {
    return err.what();
  }
  return std::string();
}

void test_identity_override_disambiguates_leaves() {
  for (const bool parallel : {false, true}) {
    TwoLeafTree fixture;
    arbor::ToolCompiler compiler(calculator(), options_for(parallel));
    const auto tool = compiler.compile(fixture.tree, {"a", "c"}, {{fixture.inner_a, "c"}});

    assert(tool.bindings("a") == std::vector<arbor::NodeId>{fixture.outer_a});
    assert(tool.bindings("c") == std::vector<arbor::NodeId>{fixture.inner_a});
    assert_close(tool({{"a", Value::int_value_of(10)}, {"c", Value::int_value_of(20)}}).number(), 70.0);
    // Constants keep their value and the source tree is untouched.
    assert_close(tool({{"a", Value::int_value_of(0)}, {"c", Value::int_value_of(1)}}).number(), 3.0);
    assert(fixture.tree.node(fixture.inner_a).as<arbor::ValueNode>().value.int_value == 2);
  }
}

void test_name_binding_feeds_every_matching_leaf() {
  TwoLeafTree fixture;
  arbor::ToolCompiler compiler(calculator(), options_for(false));
  const auto tool = compiler.compile(fixture.tree, {"a"});
  assert(tool.bindings("a").size() == 2);
  assert_close(tool({{"a", Value::int_value_of(10)}}).number(), 40.0);
  assert_close(tool.call_positional({Value::int_value_of(1)}).number(), 4.0);
}

void test_call_argument_errors() {
  TwoLeafTree fixture;
  arbor::ToolCompiler compiler(calculator(), options_for(false));
  const auto tool = compiler.compile(fixture.tree, {"a", "c"}, {{fixture.inner_a, "c"}});

  auto message = expect_binding_error([&] { (void)tool({{"a", Value::int_value_of(1)}}); });
  assert(message.find("missing argument 'c'") != std::string::npos);

  message = expect_binding_error([&] {
    (void)tool({{"a", Value::int_value_of(1)}, {"c", Value::int_value_of(2)}, {"z", Value::int_value_of(3)}});
  });
  assert(message.find("unexpected argument 'z'") != std::string::npos);

  message = expect_binding_error([&] { (void)tool.call_positional({Value::int_value_of(1)}); });
  assert(message.find("expects 2 argument(s), got 1") != std::string::npos);

  message = expect_binding_error([&] { (void)tool.bindings("nope"); });
  assert(message.find("unknown parameter") != std::string::npos);
}

void test_compile_time_errors() {
  TwoLeafTree fixture;
  arbor::ToolCompiler compiler(calculator(), options_for(false));

  assert(expect_binding_error([&] { (void)compiler.compile(fixture.tree, {"zeta"}); })
             .find("matches no value leaf") != std::string::npos);
  assert(expect_binding_error([&] { (void)compiler.compile(fixture.tree, {"a", "a"}); })
             .find("duplicate parameter") != std::string::npos);
  assert(expect_binding_error([&] { (void)compiler.compile(fixture.tree, {"a", "c"}, {{fixture.inner_a, "q"}}); })
             .find("undeclared parameter") != std::string::npos);
  assert(expect_binding_error([&] { (void)compiler.compile(fixture.tree, {"c"}, {{fixture.tree.root(), "c"}}); })
             .find("not a value leaf") != std::string::npos);
  assert(expect_binding_error([&] { (void)compiler.compile(arbor::Tree(), {}); }).find("tree is empty") !=
         std::string::npos);

  // A placeholder nobody feeds is rejected up front.
  arbor::Tree open;
  const auto x = open.add_placeholder("x");
  const auto y = open.add_placeholder("y");
  open.add_function("add", {x, y});
  const auto message = expect_binding_error([&] { (void)compiler.compile(open, {"x"}); });
  assert(message.find("placeholder 'y'") != std::string::npos);
}

void test_placeholder_inference() {
  const auto tree = arbor::WireParser().parse_text(R"({
    "type": "program", "name": "scaled_sum", "description": "sum of squares times k", "body": [
      {"type": "function", "name": "multiply", "params": [
        {"type": "reduce",
         "function": {"type": "lambda", "params": ["acc", "x"],
                      "body": {"name": "add", "params": [
                        {"type": "value", "name": "acc"},
                        {"type": "function", "name": "power", "params": [
                          {"type": "value", "name": "x"}, {"type": "value", "name": "b", "value": 2}]}]}},
         "iterable": {"type": "value", "name": "numbers"},
         "initial": {"type": "value", "name": "zero", "value": 0}},
        {"type": "value", "name": "k"}]}]})");

  arbor::ToolCompiler compiler(calculator(), options_for(true));
  const auto tool = compiler.compile(tree);
  assert(tool.name() == "scaled_sum");
  assert(tool.description() == "sum of squares times k");
  // Lambda parameters are not tool parameters.
  assert((tool.params() == std::vector<std::string>{"numbers", "k"}));

  const auto definition = tool.definition();
  assert(definition.parameters.size() == 2);
  assert(definition.parameters[0].name == "numbers");

  const auto numbers = Value::list_value_of({Value::int_value_of(1), Value::int_value_of(2), Value::int_value_of(3)});
  assert_close(tool({{"numbers", numbers}, {"k", Value::int_value_of(2)}}).number(), 28.0);
}

void test_positional_lambda_leaf_is_not_a_tool_parameter() {
  // "a" is filled by the lambda argument, so only "numbers" is left open.
  const auto tree = arbor::WireParser().parse_text(R"({
    "type": "map",
    "function": {"type": "lambda", "params": ["x"], "body": {
      "name": "sqrt", "params": [{"type": "value", "name": "a"}]}},
    "iterable": {"type": "value", "name": "numbers"}})");

  arbor::ToolCompiler compiler(calculator(), options_for(false));
  const auto tool = compiler.compile(tree);
  assert((tool.params() == std::vector<std::string>{"numbers"}));
  const auto result =
      tool({{"numbers", Value::list_value_of({Value::int_value_of(16), Value::int_value_of(25)})}});
  assert(result.kind == Value::Kind::List);
  assert_close(result.list_value[0].number(), 4.0);
  assert_close(result.list_value[1].number(), 5.0);
}

void test_default_tool_name() {
  arbor::Tree tree;
  const auto x = tree.add_placeholder("x");
  tree.add_function("sqrt", {x});
  arbor::ToolCompiler compiler(calculator(), options_for(false));
  const auto tool = compiler.compile(tree);
  assert(tool.name() == "compiled_tool");
  assert_close(tool({{"x", Value::int_value_of(81)}}).number(), 9.0);
}

void test_registered_compiled_tool_is_callable_from_trees() {
  arbor::Tree hypot_tree;
  const auto a = hypot_tree.add_placeholder("a");
  const auto two = hypot_tree.add_value("exp", Value::int_value_of(2));
  const auto a2 = hypot_tree.add_function("power", {a, two});
  const auto b = hypot_tree.add_placeholder("b");
  const auto also_two = hypot_tree.add_value("exp", Value::int_value_of(2));
  const auto b2 = hypot_tree.add_function("power", {b, also_two});
  const auto sum = hypot_tree.add_function("add", {a2, b2});
  const auto root = hypot_tree.add_function("sqrt", {sum});
  hypot_tree.add_program({root}, "hypot", "length of the hypotenuse");

  for (const bool parallel : {false, true}) {
    arbor::ToolCompiler compiler(calculator(), options_for(parallel));
    const auto hypot = compiler.compile(hypot_tree);
    assert((hypot.params() == std::vector<std::string>{"a", "b"}));
    assert(hypot.bindings("b") == std::vector<arbor::NodeId>{b});

    auto host = calculator();
    arbor::register_compiled_tool(*host, hypot);
    const auto listed = host->find_tool("hypot");
    assert(listed.has_value());
    assert(listed->description == "length of the hypotenuse");

    const auto outer = arbor::WireParser().parse_text(R"({
      "type": "map",
      "function": {"type": "lambda", "params": ["side"],
                   "body": {"name": "hypot", "params": [
                     {"type": "value", "name": "side"}, {"type": "value", "name": "other", "value": 4}]}},
      "iterable": {"type": "value", "name": "sides", "value": [3, 0]}})");
    arbor::Evaluator evaluator(host, options_for(parallel));
    const auto out = evaluator.evaluate(outer);
    assert(out.kind == Value::Kind::List);
    assert(out.list_value.size() == 2);
    assert_close(out.list_value[0].number(), 5.0);
    assert_close(out.list_value[1].number(), 4.0);
  }
}

}  // namespace

int main() {
  test_identity_override_disambiguates_leaves();
  test_name_binding_feeds_every_matching_leaf();
  test_call_argument_errors();
  test_compile_time_errors();
  test_placeholder_inference();
  test_positional_lambda_leaf_is_not_a_tool_parameter();
  test_default_tool_name();
  test_registered_compiled_tool_is_callable_from_trees();
  return 0;
}
