constexpr const char* kMinipyVersion = "0.1.0";

// Command-line overrides applied on top of InterpreterOptions::from_env().
struct RunFlags {
  bool caller_scope = false;
  bool eager_or = false;
  bool trace = false;
};

std::string read_file(const std::string& path) {
  std::ifstream source_file(path);
  if (!source_file) {
    throw std::runtime_error("failed to open source file: " + path);
  }
  return std::string((std::istreambuf_iterator<char>(source_file)),
                     std::istreambuf_iterator<char>());
}

minipy::InterpreterOptions resolve_options(const RunFlags& flags) {
  auto options = minipy::InterpreterOptions::from_env();
  if (flags.caller_scope) {
    options.call_scope = minipy::CallScope::CallerCopy;
  }
  if (flags.eager_or) {
    options.short_circuit_or = false;
  }
  if (flags.trace) {
    options.trace_calls = true;
  }
  return options;
}
