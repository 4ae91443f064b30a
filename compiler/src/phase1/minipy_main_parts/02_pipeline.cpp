int parse_mode_main(const std::string& file_path, bool dump_ast) {
  const auto source = read_file(file_path);
  minipy::Parser parser(source);
  auto program = parser.parse_program();
  if (!dump_ast) {
    std::cout << "parsed: " << file_path << "\n";
    return 0;
  }
  std::cout << minipy::to_source(*program);
  return 0;
}
