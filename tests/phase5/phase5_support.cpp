#include <cassert>
#include <cstdio>
#include <sstream>
#include <string>

#include "phase5_support.h"

namespace phase5_test {

namespace {

minipy::InterpreterOptions test_options() {
  return minipy::InterpreterOptions{};
}

}  // namespace

minipy::Value run_and_get(std::string_view source, std::string_view name) {
  std::ostringstream out;
  minipy::Interpreter interpreter(out, test_options());
  minipy::Parser parser{std::string(source)};
  auto program = parser.parse_program();
  interpreter.run(*program);
  return interpreter.global(std::string(name));
}

std::string run_and_capture(std::string_view source) {
  std::ostringstream out;
  minipy::Interpreter interpreter(out, test_options());
  interpreter.run_source(std::string(source));
  return out.str();
}

minipy::ErrorKind run_and_get_error(std::string_view source) {
  std::ostringstream out;
  minipy::Interpreter interpreter(out, test_options());
  try {
    interpreter.run_source(std::string(source));
  } catch (const minipy::EvalException& err) {
    return err.kind;
  }
  std::fprintf(stderr, "phase5 expected a runtime error\nsource:\n%.*s\n",
               static_cast<int>(source.size()), source.data());
  assert(false && "program finished without a runtime error");
  return minipy::ErrorKind::TypeError;
}

void expect_global_int(std::string_view source, std::string_view name, long long expected) {
  const auto actual = run_and_get(source, name);
  if (actual.kind != minipy::Value::Kind::Int || actual.int_value != expected) {
    std::fprintf(stderr,
                 "phase5 int assert failed: name=%.*s expected=%lld kind=%s value=%s\nsource:\n%.*s\n",
                 static_cast<int>(name.size()), name.data(), expected,
                 minipy::value_kind_name(actual.kind), actual.to_string().c_str(),
                 static_cast<int>(source.size()), source.data());
  }
  assert(actual.kind == minipy::Value::Kind::Int);
  assert(actual.int_value == expected);
}

void expect_global_bool(std::string_view source, std::string_view name, bool expected) {
  const auto actual = run_and_get(source, name);
  assert(actual.kind == minipy::Value::Kind::Bool);
  assert(actual.bool_value == expected);
}

void expect_global_string(std::string_view source, std::string_view name, const std::string& expected) {
  const auto actual = run_and_get(source, name);
  assert(actual.kind == minipy::Value::Kind::String);
  assert(actual.string_value == expected);
}

void expect_global_list(std::string_view source, std::string_view name,
                        const std::vector<long long>& expected) {
  const auto actual = run_and_get(source, name);
  assert(actual.kind == minipy::Value::Kind::List);
  assert(actual.list_size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    const auto& element = (*actual.list_value)[i];
    assert(element.kind == minipy::Value::Kind::Int);
    assert(element.int_value == expected[i]);
  }
}

void expect_error_kind(std::string_view source, minipy::ErrorKind expected) {
  const auto actual = run_and_get_error(source);
  if (actual != expected) {
    std::fprintf(stderr, "phase5 error assert failed: expected=%s actual=%s\nsource:\n%.*s\n",
                 minipy::error_kind_name(expected), minipy::error_kind_name(actual),
                 static_cast<int>(source.size()), source.data());
  }
  assert(actual == expected);
}

}  // namespace phase5_test
