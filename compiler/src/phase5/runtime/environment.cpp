#include <memory>
#include <utility>
#include <vector>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace minipy {

void Environment::define(std::string name, const Value& value) {
  values.insert_or_assign(std::move(name), value);
}

void Environment::define(std::string name, Value&& value) {
  values.insert_or_assign(std::move(name), std::move(value));
}

bool Environment::contains(const std::string& name) const {
  return values.find(name) != values.end();
}

Value Environment::get(const std::string& name) const {
  const auto it = values.find(name);
  if (it != values.end()) {
    return it->second;
  }
  throw EvalException(ErrorKind::NameError, "undefined variable: " + name);
}

Value* Environment::get_ptr(const std::string& name) {
  auto it = values.find(name);
  return it != values.end() ? &it->second : nullptr;
}

const Value* Environment::get_ptr(const std::string& name) const {
  const auto it = values.find(name);
  return it != values.end() ? &it->second : nullptr;
}

std::vector<std::string> Environment::keys() const {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto& pair : values) {
    out.push_back(pair.first);
  }
  return out;
}

std::shared_ptr<Environment> Environment::clone() const {
  auto copy = std::make_shared<Environment>();
  copy->values = values;
  return copy;
}

}  // namespace minipy
