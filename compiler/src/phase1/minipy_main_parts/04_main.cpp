void print_usage() {
  std::cerr << "usage:\n"
            << "  minipy run [--caller-scope] [--eager-or] [--trace] <file.py>\n"
            << "  minipy parse <file.py> [--dump-ast]\n"
            << "  minipy --version\n"
            << "  minipy --help\n"
            << "  minipy <file.py>               (legacy: run)\n";
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  try {
    if (command == "--help" || command == "-h") {
      print_usage();
      return 0;
    }

    if (command == "--version") {
      std::cout << "minipy " << kMinipyVersion << "\n";
      return 0;
    }

    if (command == "parse") {
      bool dump_ast = false;
      std::string file_path;
      for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--dump-ast") {
          dump_ast = true;
          continue;
        }
        if (!file_path.empty()) {
          std::cerr << "unexpected extra argument: " << arg << "\n";
          print_usage();
          return 1;
        }
        file_path = arg;
      }
      if (file_path.empty()) {
        print_usage();
        return 1;
      }
      return parse_mode_main(file_path, dump_ast);
    }

    if (command == "run") {
      RunFlags flags;
      std::string file_path;
      for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--caller-scope") {
          flags.caller_scope = true;
          continue;
        }
        if (arg == "--eager-or") {
          flags.eager_or = true;
          continue;
        }
        if (arg == "--trace") {
          flags.trace = true;
          continue;
        }
        if (arg.rfind("--", 0) == 0) {
          std::cerr << "unknown option: " << arg << "\n";
          print_usage();
          return 1;
        }
        if (!file_path.empty()) {
          std::cerr << "unexpected extra argument: " << arg << "\n";
          print_usage();
          return 1;
        }
        file_path = arg;
      }
      if (file_path.empty()) {
        print_usage();
        return 1;
      }
      return run_mode_main(file_path, flags);
    }

    if (command.rfind("--", 0) == 0 || argc != 2) {
      print_usage();
      return 1;
    }

    // Legacy: minipy <file.py> as run.
    return run_mode_main(command, RunFlags{});
  } catch (const minipy::ParseException& err) {
    std::cout.flush();
    std::cerr << "error: ParseError: " << err.what() << "\n";
  } catch (const minipy::EvalException& err) {
    std::cout.flush();
    std::cerr << "error: " << err.what() << "\n";
  } catch (const std::exception& err) {
    std::cout.flush();
    std::cerr << "error: " << err.what() << "\n";
  }
  return 1;
}
