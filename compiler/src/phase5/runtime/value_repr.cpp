#include <string>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace minipy {

namespace {

int three_way(long long lhs, long long rhs) {
  return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
}

}  // namespace

const char* value_kind_name(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::None:
      return "None";
    case Value::Kind::Bool:
      return "Bool";
    case Value::Kind::Int:
      return "Int";
    case Value::Kind::String:
      return "String";
    case Value::Kind::List:
      return "List";
  }
  return "?";
}

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NameError:
      return "NameError";
    case ErrorKind::TypeError:
      return "TypeError";
    case ErrorKind::ArityError:
      return "ArityError";
    case ErrorKind::IndexError:
      return "IndexError";
    case ErrorKind::DivisionError:
      return "DivisionError";
    case ErrorKind::ValueError:
      return "ValueError";
    case ErrorKind::ReturnError:
      return "ReturnError";
    case ErrorKind::RecursionError:
      return "RecursionError";
  }
  return "Error";
}

std::string Value::to_string() const {
  switch (kind) {
    case Kind::None:
      return "None";
    case Kind::Bool:
      return bool_value ? "True" : "False";
    case Kind::Int:
      return std::to_string(int_value);
    case Kind::String:
      return string_value;
    case Kind::List: {
      std::string out = "[";
      if (list_value) {
        for (std::size_t i = 0; i < list_value->size(); ++i) {
          if (i > 0) {
            out += ", ";
          }
          out += (*list_value)[i].to_string();
        }
      }
      out += "]";
      return out;
    }
  }
  return "";
}

bool Value::equals(const Value& other) const {
  if (kind != other.kind) {
    return false;
  }

  switch (kind) {
    case Kind::None:
      return true;
    case Kind::Bool:
      return bool_value == other.bool_value;
    case Kind::Int:
      return int_value == other.int_value;
    case Kind::String:
      return string_value == other.string_value;
    case Kind::List: {
      if (list_value == other.list_value) {
        return true;
      }
      const auto lhs_size = list_size();
      if (lhs_size != other.list_size()) {
        return false;
      }
      for (std::size_t i = 0; i < lhs_size; ++i) {
        if (!(*list_value)[i].equals((*other.list_value)[i])) {
          return false;
        }
      }
      return true;
    }
  }
  return false;
}

// Mismatched tags order by tag rank. Lists compare by length first, then
// element by element.
int Value::compare(const Value& other) const {
  if (kind != other.kind) {
    return three_way(static_cast<long long>(kind), static_cast<long long>(other.kind));
  }

  switch (kind) {
    case Kind::None:
      return 0;
    case Kind::Bool:
      return three_way(bool_value ? 1 : 0, other.bool_value ? 1 : 0);
    case Kind::Int:
      return three_way(int_value, other.int_value);
    case Kind::String: {
      const int cmp = string_value.compare(other.string_value);
      return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    case Kind::List: {
      const auto lhs_size = list_size();
      const auto rhs_size = other.list_size();
      if (lhs_size != rhs_size) {
        return lhs_size < rhs_size ? -1 : 1;
      }
      for (std::size_t i = 0; i < lhs_size; ++i) {
        const int cmp = (*list_value)[i].compare((*other.list_value)[i]);
        if (cmp != 0) {
          return cmp;
        }
      }
      return 0;
    }
  }
  return 0;
}

}  // namespace minipy
