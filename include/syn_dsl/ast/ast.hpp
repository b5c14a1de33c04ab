// syn_dsl/ast/ast.hpp - AST node class definitions for the pipeline language
//
// Nodes follow the LLVM/Clang style: a NodeKind tag plus classof() so that
// isa/cast/dyn_cast work without RTTI. All nodes are arena-allocated by
// AstContext and must stay trivially destructible.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "syn_dsl/ast/ast_enums.hpp"
#include "syn_dsl/basic/casting.hpp"
#include "syn_dsl/basic/source_manager.hpp"

namespace syn_dsl
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base that supplies classof() for a concrete node.
 *
 * @tparam Derived The concrete node class
 * @tparam Base The category class to inherit from
 * @tparam K The NodeKind of Derived
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind_value = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/// Base class for statements.
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Values
// ============================================================================

/**
 * Right-hand side of a filter condition: either an integer or a string.
 *
 * A raw token becomes an Integer only when it is entirely a base-10
 * integer ("8", "-3"); anything else, including "8.5", stays a String.
 */
class FilterValue
{
public:
  enum class Kind : uint8_t { String, Integer };

  constexpr FilterValue() noexcept = default;

  [[nodiscard]] static constexpr FilterValue string(std::string_view s) noexcept
  {
    FilterValue v;
    v.kind_ = Kind::String;
    v.string_ = s;
    return v;
  }

  [[nodiscard]] static constexpr FilterValue integer(int64_t i) noexcept
  {
    FilterValue v;
    v.kind_ = Kind::Integer;
    v.integer_ = i;
    return v;
  }

  [[nodiscard]] constexpr Kind get_kind() const noexcept { return kind_; }
  [[nodiscard]] constexpr bool is_string() const noexcept { return kind_ == Kind::String; }
  [[nodiscard]] constexpr bool is_integer() const noexcept { return kind_ == Kind::Integer; }

  /// Only meaningful when is_string().
  [[nodiscard]] constexpr std::string_view as_string() const noexcept { return string_; }
  /// Only meaningful when is_integer().
  [[nodiscard]] constexpr int64_t as_integer() const noexcept { return integer_; }

  [[nodiscard]] constexpr bool operator==(const FilterValue & other) const noexcept
  {
    if (kind_ != other.kind_) return false;
    return kind_ == Kind::String ? string_ == other.string_ : integer_ == other.integer_;
  }

private:
  Kind kind_ = Kind::String;
  std::string_view string_;
  int64_t integer_ = 0;
};

/// One `subfield op value` entry of a FilterBlock.
struct FilterCondition
{
  std::string_view field;
  FilterOp op = FilterOp::Eq;
  FilterValue value;
  SourceRange range;
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Brace-delimited statement list: `{ stmt* }`.
class Block : public NodeBase<Block, AstNode, NodeKind::Block>
{
public:
  gsl::span<Stmt *> stmts;

  explicit Block(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), stmts(s) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// FROM dataset [ { ... } ]
class FromStmt : public NodeBase<FromStmt, Stmt, NodeKind::FromStmt>
{
public:
  std::string_view dataset;  ///< quote-stripped, never empty
  Block * block = nullptr;   ///< nullptr when written without braces

  FromStmt(std::string_view ds, Block * b, SourceRange r = {})
  : NodeBase(r), dataset(ds), block(b)
  {
  }
};

/// WITH CONCURRENCY n [ { ... } ]  |  WITH STREAM [ { ... } ]
class WithStmt : public NodeBase<WithStmt, Stmt, NodeKind::WithStmt>
{
public:
  WithKind option;
  int64_t value = 0;  ///< concurrency level; 1 for STREAM
  Block * block = nullptr;

  WithStmt(WithKind o, int64_t v, Block * b, SourceRange r = {})
  : NodeBase(r), option(o), value(v), block(b)
  {
  }
};

/// FIELDS [a, b]  |  FIELDS a
class FieldsStmt : public NodeBase<FieldsStmt, Stmt, NodeKind::FieldsStmt>
{
public:
  gsl::span<std::string_view> fields;  ///< at least one entry

  explicit FieldsStmt(gsl::span<std::string_view> f, SourceRange r = {}) : NodeBase(r), fields(f)
  {
  }
};

/// USING MODEL|KEY|URL value
class UsingStmt : public NodeBase<UsingStmt, Stmt, NodeKind::UsingStmt>
{
public:
  UsingKind target;
  std::string_view value;

  UsingStmt(UsingKind t, std::string_view v, SourceRange r = {}) : NodeBase(r), target(t), value(v)
  {
  }
};

/// USING { MODEL x KEY y ... }
class UsingBlock : public NodeBase<UsingBlock, Stmt, NodeKind::UsingBlock>
{
public:
  gsl::span<UsingStmt *> entries;

  explicit UsingBlock(gsl::span<UsingStmt *> e, SourceRange r = {}) : NodeBase(r), entries(e) {}
};

/// FILTER field op value
class FilterStmt : public NodeBase<FilterStmt, Stmt, NodeKind::FilterStmt>
{
public:
  std::string_view field;
  FilterOp op;
  FilterValue value;

  FilterStmt(std::string_view f, FilterOp o, FilterValue v, SourceRange r = {})
  : NodeBase(r), field(f), op(o), value(v)
  {
  }
};

/// FILTER field { sub op value; ... }
class FilterBlock : public NodeBase<FilterBlock, Stmt, NodeKind::FilterBlock>
{
public:
  std::string_view field;
  gsl::span<FilterCondition> conditions;

  FilterBlock(std::string_view f, gsl::span<FilterCondition> c, SourceRange r = {})
  : NodeBase(r), field(f), conditions(c)
  {
  }
};

/// MERGE [a, b, ...]  |  MERGE a, b
class MergeStmt : public NodeBase<MergeStmt, Stmt, NodeKind::MergeStmt>
{
public:
  gsl::span<std::string_view> datasets;  ///< at least two entries, source order

  explicit MergeStmt(gsl::span<std::string_view> d, SourceRange r = {}) : NodeBase(r), datasets(d)
  {
  }
};

/// SAVE filename
class SaveStmt : public NodeBase<SaveStmt, Stmt, NodeKind::SaveStmt>
{
public:
  std::string_view filename;

  explicit SaveStmt(std::string_view f, SourceRange r = {}) : NodeBase(r), filename(f) {}
};

/// GENERATE src AS|TO dst [ { MODEL m TEMPERATURE t TOKENS n PROMPT p } ]
class GenerateStmt : public NodeBase<GenerateStmt, Stmt, NodeKind::GenerateStmt>
{
public:
  static constexpr double k_default_temperature = 0.7;
  static constexpr int64_t k_default_max_tokens = 1024;

  std::string_view sourceField;
  std::string_view targetField;
  std::optional<std::string_view> model;
  double temperature = k_default_temperature;
  int64_t maxTokens = k_default_max_tokens;
  gsl::span<std::string_view> prompts;  ///< PROMPT names in source order

  GenerateStmt(std::string_view src, std::string_view dst, SourceRange r = {})
  : NodeBase(r), sourceField(src), targetField(dst)
  {
  }
};

/// [SYSTEM|USER] PROMPT name { [FIELDS ...] text }  |  PROMPT name text
class PromptStmt : public NodeBase<PromptStmt, Stmt, NodeKind::PromptStmt>
{
public:
  std::string_view name;
  std::string_view templateText;
  gsl::span<std::string_view> fields;  ///< substitution fields, may be empty
  PromptRole role;

  PromptStmt(
    std::string_view n, std::string_view text, gsl::span<std::string_view> f, PromptRole ro,
    SourceRange r = {})
  : NodeBase(r), name(n), templateText(text), fields(f), role(ro)
  {
  }
};

/// PRAGMA AUTOSAVE  |  PRAGMA CONCURRENCY n
class PragmaStmt : public NodeBase<PragmaStmt, Stmt, NodeKind::PragmaStmt>
{
public:
  PragmaKind directive;
  int64_t value = 0;  ///< concurrency level; 1 (enabled) for AUTOSAVE

  PragmaStmt(PragmaKind d, int64_t v, SourceRange r = {}) : NodeBase(r), directive(d), value(v) {}
};

// ============================================================================
// Top-level
// ============================================================================

/// Root node: the ordered top-level statements of one source.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> stmts;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

}  // namespace syn_dsl
