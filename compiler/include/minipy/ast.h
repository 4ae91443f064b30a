#pragma once

#include <memory>
#include <string>
#include <vector>

namespace minipy {

struct Expr;
struct Stmt;
struct Program;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

struct Node {
  virtual ~Node() = default;
};

struct Expr : Node {
  enum class Kind {
    Int,
    String,
    Bool,
    None,
    Variable,
    List,
    Unary,
    Binary,
    Call,
    Index,
    Pipe,
  };

  Kind kind;
  explicit Expr(Kind kind) : kind(kind) {}
};

struct IntExpr : Expr {
  long long value;
  std::string raw_text;

  explicit IntExpr(long long v, std::string raw = "")
      : Expr(Kind::Int), value(v), raw_text(std::move(raw)) {}
};

struct StringExpr : Expr {
  std::string value;

  explicit StringExpr(std::string text)
      : Expr(Kind::String), value(std::move(text)) {}
};

struct BoolExpr : Expr {
  bool value;

  explicit BoolExpr(bool v) : Expr(Kind::Bool), value(v) {}
};

struct NoneExpr : Expr {
  NoneExpr() : Expr(Kind::None) {}
};

struct VariableExpr : Expr {
  std::string name;

  explicit VariableExpr(std::string value) : Expr(Kind::Variable), name(std::move(value)) {}
};

struct ListExpr : Expr {
  std::vector<ExprPtr> elements;

  explicit ListExpr(std::vector<ExprPtr> elems) : Expr(Kind::List), elements(std::move(elems)) {}
};

enum class UnaryOp {
  Neg,
  Not,
};

struct UnaryExpr : Expr {
  UnaryOp op;
  ExprPtr operand;

  UnaryExpr(UnaryOp unary_op, ExprPtr child)
      : Expr(Kind::Unary), op(unary_op), operand(std::move(child)) {}
};

enum class BinaryOp {
  Add,
  Sub,
  Mul,
  Div,
  Mod,
  Eq,
  Ne,
  Lt,
  Lte,
  Gt,
  Gte,
  And,
  Or,
};

struct BinaryExpr : Expr {
  BinaryOp op;
  ExprPtr left;
  ExprPtr right;

  BinaryExpr(BinaryOp binary_op, ExprPtr lhs, ExprPtr rhs)
      : Expr(Kind::Binary), op(binary_op), left(std::move(lhs)), right(std::move(rhs)) {}
};

// Functions are not values, so the callee is always a plain name.
struct CallExpr : Expr {
  std::string callee;
  std::vector<ExprPtr> args;

  CallExpr(std::string callee_name, std::vector<ExprPtr> call_args)
      : Expr(Kind::Call), callee(std::move(callee_name)), args(std::move(call_args)) {}
};

struct IndexExpr : Expr {
  ExprPtr target;
  ExprPtr index;

  IndexExpr(ExprPtr target_expr, ExprPtr index_expr)
      : Expr(Kind::Index), target(std::move(target_expr)), index(std::move(index_expr)) {}
};

// `input | callee`. A list literal on the left spreads into separate arguments;
// anything else is passed as the single argument.
struct PipeExpr : Expr {
  ExprPtr input;
  std::string callee;

  PipeExpr(ExprPtr input_expr, std::string callee_name)
      : Expr(Kind::Pipe), input(std::move(input_expr)), callee(std::move(callee_name)) {}
};

struct Stmt : Node {
  enum class Kind {
    Expression,
    Print,
    Assign,
    Return,
    If,
    For,
    FunctionDef,
  };

  Kind kind;
  explicit Stmt(Kind k) : kind(k) {}
};

struct ExpressionStmt : Stmt {
  ExprPtr expression;

  explicit ExpressionStmt(ExprPtr value)
      : Stmt(Kind::Expression), expression(std::move(value)) {}
};

struct PrintStmt : Stmt {
  ExprPtr value;

  explicit PrintStmt(ExprPtr printed) : Stmt(Kind::Print), value(std::move(printed)) {}
};

// Target is either a VariableExpr (binding) or an IndexExpr (element store).
struct AssignStmt : Stmt {
  ExprPtr target;
  ExprPtr value;

  AssignStmt(ExprPtr target_expr, ExprPtr rhs)
      : Stmt(Kind::Assign), target(std::move(target_expr)), value(std::move(rhs)) {}
};

struct ReturnStmt : Stmt {
  ExprPtr value;

  explicit ReturnStmt(ExprPtr result) : Stmt(Kind::Return), value(std::move(result)) {}
};

struct IfStmt : Stmt {
  ExprPtr condition;
  StmtList then_body;
  StmtList else_body;

  IfStmt(ExprPtr cond, StmtList then, StmtList otherwise)
      : Stmt(Kind::If), condition(std::move(cond)), then_body(std::move(then)),
        else_body(std::move(otherwise)) {}
};

struct ForStmt : Stmt {
  std::string name;
  ExprPtr iterable;
  StmtList body;

  ForStmt(std::string target_name, ExprPtr it_expr, StmtList loop_body)
      : Stmt(Kind::For), name(std::move(target_name)), iterable(std::move(it_expr)),
        body(std::move(loop_body)) {}
};

struct FunctionDefStmt : Stmt {
  std::string name;
  std::vector<std::string> params;
  StmtList body;

  FunctionDefStmt(std::string name_value, std::vector<std::string> parameters, StmtList block)
      : Stmt(Kind::FunctionDef), name(std::move(name_value)), params(std::move(parameters)),
        body(std::move(block)) {}
};

struct Program {
  StmtList body;

  explicit Program(StmtList stmts = {}) : body(std::move(stmts)) {}
};

// Pretty printer for debugging and AST dumps.
std::string to_source(const Program& program);

}  // namespace minipy
