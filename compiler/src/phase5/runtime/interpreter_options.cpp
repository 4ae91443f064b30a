#include <cstdio>
#include <cstdlib>
#include <string>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace minipy {

namespace {

CallScope call_scope_from_env(CallScope fallback) {
  const char* raw = std::getenv("MINIPY_CALL_SCOPE");
  if (!raw || *raw == '\0') {
    return fallback;
  }
  const std::string value(raw);
  if (value == "caller") {
    return CallScope::CallerCopy;
  }
  if (value == "params") {
    return CallScope::ParametersOnly;
  }
  std::fprintf(stderr, "[minipy-config] ignoring MINIPY_CALL_SCOPE=%s (expected params|caller)\n", raw);
  return fallback;
}

std::size_t max_call_depth_from_env(std::size_t fallback) {
  const char* raw = std::getenv("MINIPY_MAX_CALL_DEPTH");
  if (!raw || *raw == '\0') {
    return fallback;
  }
  char* end = nullptr;
  const auto parsed = std::strtoull(raw, &end, 10);
  if (end == raw || *end != '\0' || parsed == 0) {
    std::fprintf(stderr, "[minipy-config] ignoring MINIPY_MAX_CALL_DEPTH=%s (expected positive integer)\n", raw);
    return fallback;
  }
  return static_cast<std::size_t>(parsed);
}

}  // namespace

InterpreterOptions InterpreterOptions::from_env() {
  InterpreterOptions options;
  options.call_scope = call_scope_from_env(options.call_scope);
  options.short_circuit_or = env_flag_enabled("MINIPY_OR_SHORT_CIRCUIT", options.short_circuit_or);
  options.trace_calls = env_flag_enabled("MINIPY_TRACE_CALLS", options.trace_calls);
  options.max_call_depth = max_call_depth_from_env(options.max_call_depth);
  return options;
}

}  // namespace minipy
