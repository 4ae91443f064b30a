int run_mode_main(const std::string& file_path, const RunFlags& flags) {
  const std::string source = read_file(file_path);
  minipy::Parser parser(source);
  auto program = parser.parse_program();
  minipy::Interpreter interpreter(std::cout, resolve_options(flags));
  interpreter.run(*program);
  std::cout.flush();
  return 0;
}
