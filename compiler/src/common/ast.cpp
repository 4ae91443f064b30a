#include <string>

#include "minipy/ast.h"

namespace minipy {

namespace {

std::string indent_line(std::size_t level) {
  return std::string(level * 4, ' ');
}

std::string escape_string_literal(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  for (const char ch : value) {
    switch (ch) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
  return out;
}

// Mirrors the parser's binding levels; pipe binds loosest of all.
int expr_precedence(const Expr& expr) {
  switch (expr.kind) {
    case Expr::Kind::Pipe:
      return 0;
    case Expr::Kind::Binary:
      switch (static_cast<const BinaryExpr&>(expr).op) {
        case BinaryOp::Or:
          return 1;
        case BinaryOp::And:
          return 2;
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        case BinaryOp::Lt:
        case BinaryOp::Lte:
        case BinaryOp::Gt:
        case BinaryOp::Gte:
          return 4;
        case BinaryOp::Add:
        case BinaryOp::Sub:
          return 5;
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Mod:
          return 6;
      }
      return 6;
    case Expr::Kind::Unary:
      return static_cast<const UnaryExpr&>(expr).op == UnaryOp::Not ? 3 : 7;
    case Expr::Kind::Call:
    case Expr::Kind::Index:
      return 8;
    default:
      return 9;
  }
}

const char* binary_op_text(BinaryOp op) {
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Lte:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Gte:
      return ">=";
    case BinaryOp::And:
      return "and";
    case BinaryOp::Or:
      return "or";
  }
  return "?";
}

std::string source_of_expr(const Expr& expr, int parent_precedence = 0);
std::string source_of_block(const StmtList& body, std::size_t indent_level);

std::string wrap_if(const std::string& text, bool wrap) {
  return wrap ? "(" + text + ")" : text;
}

std::string join_exprs(const std::vector<ExprPtr>& exprs) {
  std::string result;
  for (std::size_t i = 0; i < exprs.size(); ++i) {
    if (i > 0) {
      result += ", ";
    }
    result += source_of_expr(*exprs[i], 0);
  }
  return result;
}

std::string source_of_expr(const Expr& expr, int parent_precedence) {
  const int current = expr_precedence(expr);
  switch (expr.kind) {
    case Expr::Kind::Int: {
      const auto& int_expr = static_cast<const IntExpr&>(expr);
      const std::string text = std::to_string(int_expr.value);
      return wrap_if(text, int_expr.value < 0);
    }
    case Expr::Kind::String:
      return "\"" + escape_string_literal(static_cast<const StringExpr&>(expr).value) + "\"";
    case Expr::Kind::Bool:
      return static_cast<const BoolExpr&>(expr).value ? "True" : "False";
    case Expr::Kind::None:
      return "None";
    case Expr::Kind::Variable:
      return static_cast<const VariableExpr&>(expr).name;
    case Expr::Kind::List:
      return "[" + join_exprs(static_cast<const ListExpr&>(expr).elements) + "]";
    case Expr::Kind::Unary: {
      const auto& unary = static_cast<const UnaryExpr&>(expr);
      const std::string inner = source_of_expr(*unary.operand, current);
      const std::string text = unary.op == UnaryOp::Neg ? "-" + inner : "not " + inner;
      return wrap_if(text, current < parent_precedence);
    }
    case Expr::Kind::Binary: {
      const auto& binary = static_cast<const BinaryExpr&>(expr);
      // Comparisons do not chain, so a comparison on the left keeps its parentheses.
      const int lhs_parent = current == 4 ? current + 1 : current;
      const std::string lhs = source_of_expr(*binary.left, lhs_parent);
      const std::string rhs = source_of_expr(*binary.right, current + 1);
      return wrap_if(lhs + " " + binary_op_text(binary.op) + " " + rhs, current < parent_precedence);
    }
    case Expr::Kind::Call: {
      const auto& call = static_cast<const CallExpr&>(expr);
      return call.callee + "(" + join_exprs(call.args) + ")";
    }
    case Expr::Kind::Index: {
      const auto& index = static_cast<const IndexExpr&>(expr);
      return source_of_expr(*index.target, current) + "[" + source_of_expr(*index.index, 0) + "]";
    }
    case Expr::Kind::Pipe: {
      const auto& pipe = static_cast<const PipeExpr&>(expr);
      return wrap_if(source_of_expr(*pipe.input, current) + " | " + pipe.callee, current < parent_precedence);
    }
  }

  return "";
}

std::string source_of_stmt(const Stmt& stmt, std::size_t indent_level) {
  const std::string indent = indent_line(indent_level);

  switch (stmt.kind) {
    case Stmt::Kind::Expression:
      return indent + source_of_expr(*static_cast<const ExpressionStmt&>(stmt).expression) + "\n";
    case Stmt::Kind::Print:
      return indent + "print(" + source_of_expr(*static_cast<const PrintStmt&>(stmt).value) + ")\n";
    case Stmt::Kind::Assign: {
      const auto& assign = static_cast<const AssignStmt&>(stmt);
      return indent + source_of_expr(*assign.target) + " = " + source_of_expr(*assign.value) + "\n";
    }
    case Stmt::Kind::Return:
      return indent + "return " + source_of_expr(*static_cast<const ReturnStmt&>(stmt).value) + "\n";
    case Stmt::Kind::If: {
      // An else branch holding exactly one if prints as an elif chain.
      const auto* ifs = &static_cast<const IfStmt&>(stmt);
      std::string result = indent + "if " + source_of_expr(*ifs->condition) + ":\n";
      while (true) {
        result += source_of_block(ifs->then_body, indent_level + 1);
        if (ifs->else_body.size() == 1 && ifs->else_body.front()->kind == Stmt::Kind::If) {
          ifs = &static_cast<const IfStmt&>(*ifs->else_body.front());
          result += indent + "elif " + source_of_expr(*ifs->condition) + ":\n";
          continue;
        }
        if (!ifs->else_body.empty()) {
          result += indent + "else:\n";
          result += source_of_block(ifs->else_body, indent_level + 1);
        }
        break;
      }
      return result;
    }
    case Stmt::Kind::For: {
      const auto& for_stmt = static_cast<const ForStmt&>(stmt);
      return indent + "for " + for_stmt.name + " in " + source_of_expr(*for_stmt.iterable) + ":\n" +
             source_of_block(for_stmt.body, indent_level + 1);
    }
    case Stmt::Kind::FunctionDef: {
      const auto& fn = static_cast<const FunctionDefStmt&>(stmt);
      std::string result = indent + "def " + fn.name + "(";
      for (std::size_t i = 0; i < fn.params.size(); ++i) {
        if (i > 0) {
          result += ", ";
        }
        result += fn.params[i];
      }
      result += "):\n";
      return result + source_of_block(fn.body, indent_level + 1);
    }
  }

  return "";
}

std::string source_of_block(const StmtList& body, std::size_t indent_level) {
  std::string result;
  for (const auto& child : body) {
    result += source_of_stmt(*child, indent_level);
  }
  return result;
}

}  // namespace

std::string to_source(const Program& program) {
  return source_of_block(program.body, 0);
}

}  // namespace minipy
