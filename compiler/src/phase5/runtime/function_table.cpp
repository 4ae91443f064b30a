#include <algorithm>
#include <string>
#include <vector>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace minipy {

bool FunctionTable::is_builtin_name(const std::string& name) {
  return is_builtin_function(name);
}

// A later definition of the same name replaces the earlier one.
void FunctionTable::define(const FunctionDefStmt& def) {
  if (sealed) {
    throw EvalException(ErrorKind::NameError, "function table is sealed; cannot define " + def.name);
  }
  if (is_builtin_name(def.name)) {
    throw EvalException(ErrorKind::NameError, "cannot redefine builtin function " + def.name);
  }
  entries.insert_or_assign(def.name, FunctionEntry{def.name, def.params, &def.body});
}

const FunctionEntry* FunctionTable::find(const std::string& name) const {
  const auto it = entries.find(name);
  return it != entries.end() ? &it->second : nullptr;
}

bool FunctionTable::contains(const std::string& name) const {
  return entries.find(name) != entries.end();
}

std::vector<std::string> FunctionTable::names() const {
  std::vector<std::string> out;
  out.reserve(entries.size());
  for (const auto& pair : entries) {
    out.push_back(pair.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

void FunctionTable::clear() {
  entries.clear();
  sealed = false;
}

}  // namespace minipy
