#include <cassert>
#include <memory>
#include <string>

#include "../phase3_support.h"

namespace phase3_test {

namespace {

void test_short_circuit_skips_literal_branch(const arbor::EvalOptions& options) {
  auto provider = make_calculator();
  arbor::Evaluator evaluator(provider, options);
  const auto tree = build_short_circuit_tree();

  const auto result = evaluator.evaluate(tree);
  assert(result.kind == arbor::Value::Kind::Double);
  assert_close(result.double_value, 93.0);
  for (const auto* tool : {"subtract", "divide", "sqrt", "power", "multiply", "add", "greater_than"}) {
    assert(provider->calls(tool) == 1);
  }
  assert(provider->total_calls() == 7);
  assert(provider->list_calls() == 1);
}

void test_true_predicate_skips_false_branch() {
  auto provider = make_calculator();
  arbor::Evaluator evaluator(provider, sequential_options());

  arbor::Tree tree;
  const auto a = tree.add_value("a", arbor::Value::int_value_of(5));
  const auto b = tree.add_value("b", arbor::Value::int_value_of(1));
  const auto predicate = tree.add_function("greater_than", {a, b});
  const auto consequent = tree.add_value("yes", arbor::Value::string_value_of("taken"));
  const auto x = tree.add_value("a", arbor::Value::int_value_of(1));
  const auto y = tree.add_value("b", arbor::Value::int_value_of(0));
  const auto alternate = tree.add_function("divide", {x, y});
  tree.add_conditional(predicate, consequent, alternate);

  const auto result = evaluator.evaluate(tree);
  assert(result.kind == arbor::Value::Kind::String);
  assert(result.string_value == "taken");
  assert(provider->calls("divide") == 0);
}

void test_missing_alternate_yields_nil() {
  auto provider = make_calculator();
  arbor::Evaluator evaluator(provider, sequential_options());

  arbor::Tree tree;
  const auto predicate = tree.add_value("flag", arbor::Value::bool_value_of(false));
  const auto consequent = tree.add_value("x", arbor::Value::int_value_of(1));
  tree.add_conditional(predicate, consequent);
  assert(evaluator.evaluate(tree).kind == arbor::Value::Kind::Nil);
}

void test_arithmetic_chain() {
  // sqrt(multiply(add(25, 10), 4)) + power(3, 2) - 8
  const auto tree = parse_wire(R"({
    "type": "function", "name": "subtract", "params": [
      {"type": "function", "name": "add", "params": [
        {"type": "function", "name": "sqrt", "params": [
          {"type": "function", "name": "multiply", "params": [
            {"type": "function", "name": "add", "params": [
              {"type": "value", "name": "a", "value": 25},
              {"type": "value", "name": "b", "value": 10}]},
            {"type": "value", "name": "b", "value": 4}]}]},
        {"type": "function", "name": "power", "params": [
          {"type": "value", "name": "a", "value": 3},
          {"type": "value", "name": "b", "value": 2}]}]},
      {"type": "value", "name": "b", "value": 8}]})");

  for (const auto& options : {sequential_options(), parallel_options()}) {
    arbor::Evaluator evaluator(make_calculator(), options);
    assert_close(as_number(evaluator.evaluate(tree)), 12.83215956619923);
  }
}

void test_shared_node_evaluated_once() {
  const auto tree = parse_wire(R"({
    "type": "function", "name": "multiply", "params": [
      {"type": "function", "name": "add", "id": "add_1", "params": [
        {"type": "value", "name": "a", "value": 2},
        {"type": "value", "name": "b", "value": 3}]},
      {"ref": "add_1"}]})");

  for (const auto& options : {sequential_options(), parallel_options()}) {
    auto provider = make_calculator();
    arbor::Evaluator evaluator(provider, options);
    const auto report = evaluator.evaluate_with_report(std::make_shared<const arbor::Tree>(tree));
    assert_close(as_number(report.value), 25.0);
    assert(provider->calls("add") == 1);
    assert(report.stats.tool_calls == 2);
    assert(report.stats.memo_hits == 1);
  }
}

void test_program_results() {
  auto provider = make_calculator();

  arbor::Tree tree;
  const auto a = tree.add_value("a", arbor::Value::int_value_of(1));
  const auto b = tree.add_value("b", arbor::Value::int_value_of(2));
  const auto sum = tree.add_function("add", {a, b});
  const auto c = tree.add_value("a", arbor::Value::int_value_of(3));
  const auto d = tree.add_value("b", arbor::Value::int_value_of(4));
  const auto product = tree.add_function("multiply", {c, d});
  tree.add_program({sum, product}, "pair", "two statements");

  arbor::Evaluator collect(provider, sequential_options());
  const auto both = as_number_list(collect.evaluate(tree));
  assert(both.size() == 2);
  assert_close(both[0], 3.0);
  assert_close(both[1], 12.0);

  auto last_options = sequential_options();
  last_options.program_result = arbor::ProgramResult::Last;
  arbor::Evaluator last(provider, last_options);
  assert_close(as_number(last.evaluate(tree)), 12.0);

  auto concurrent = parallel_options();
  concurrent.concurrent_statements = true;
  arbor::Evaluator together(provider, concurrent);
  const auto parallel_both = as_number_list(together.evaluate(tree));
  assert(parallel_both.size() == 2);
  assert_close(parallel_both[0], 3.0);
  assert_close(parallel_both[1], 12.0);

  arbor::Tree single;
  const auto x = single.add_value("x", arbor::Value::int_value_of(7));
  single.add_program({x});
  assert(collect.evaluate(single).equals(arbor::Value::int_value_of(7)));

  arbor::Tree empty_program;
  empty_program.add_program({});
  assert(collect.evaluate(empty_program).kind == arbor::Value::Kind::Nil);
}

void test_determinism() {
  const auto tree = build_short_circuit_tree();
  arbor::Evaluator evaluator(make_calculator(), parallel_options());
  const auto first = evaluator.evaluate(tree);
  for (int i = 0; i < 20; ++i) {
    assert(evaluator.evaluate(tree).equals(first));
  }
}

void test_truthiness() {
  using arbor::Evaluator;
  using arbor::Value;
  assert(!Evaluator::truthy(Value::nil()));
  assert(!Evaluator::truthy(Value::bool_value_of(false)));
  assert(!Evaluator::truthy(Value::int_value_of(0)));
  assert(!Evaluator::truthy(Value::double_value_of(0.0)));
  assert(!Evaluator::truthy(Value::string_value_of("")));
  assert(!Evaluator::truthy(Value::string_value_of("False")));
  assert(!Evaluator::truthy(Value::list_value_of({})));
  assert(!Evaluator::truthy(Value::object_value_of({})));
  assert(Evaluator::truthy(Value::string_value_of("no")));
  assert(Evaluator::truthy(Value::double_value_of(-0.5)));
  assert(Evaluator::truthy(Value::list_value_of({Value::nil()})));
}

}  // namespace

void run_phase3_eval_tests() {
  test_short_circuit_skips_literal_branch(sequential_options());
  test_short_circuit_skips_literal_branch(parallel_options());
  test_true_predicate_skips_false_branch();
  test_missing_alternate_yields_nil();
  test_arithmetic_chain();
  test_shared_node_evaluated_once();
  test_program_results();
  test_determinism();
  test_truthiness();
}

}  // namespace phase3_test
