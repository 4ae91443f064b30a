#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "minipy/ast.h"
#include "minipy/evaluator.h"
#include "minipy/parser.h"

// CLI split into single-responsibility parts: shared helpers, parse-only
// pipeline, run flow, and command-line parsing.
namespace {

#include "minipy_main_parts/01_common.cpp"
#include "minipy_main_parts/02_pipeline.cpp"
#include "minipy_main_parts/03_execute.cpp"

}  // namespace

#include "minipy_main_parts/04_main.cpp"
