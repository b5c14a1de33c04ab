// syn_dsl/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds (generated from ast_nodes.def) and the small closed value sets
// carried by statements.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace syn_dsl
{

// ============================================================================
// NodeKind
// ============================================================================

enum class NodeKind : uint8_t {
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "syn_dsl/ast/ast_nodes.def"
};

namespace detail
{
inline constexpr NodeKind k_first_stmt_kind = NodeKind::FromStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::PragmaStmt;
}  // namespace detail

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

// ============================================================================
// Statement attributes
// ============================================================================

/// Target of a USING statement.
enum class UsingKind : uint8_t {
  Model,  ///< USING MODEL name
  Key,    ///< USING KEY secret
  Url,    ///< USING URL endpoint
};

/// Comparison operator of a FILTER condition.
enum class FilterOp : uint8_t {
  Eq,  ///< =
  Gt,  ///< >
  Lt,  ///< <
  Ge,  ///< >=
  Le,  ///< <=
  Ne,  ///< !=
};

enum class PromptRole : uint8_t {
  User,
  System,
};

enum class PragmaKind : uint8_t {
  Autosave,     ///< PRAGMA AUTOSAVE
  Concurrency,  ///< PRAGMA CONCURRENCY n
};

enum class WithKind : uint8_t {
  Concurrency,  ///< WITH CONCURRENCY n
  Stream,       ///< WITH STREAM
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "syn_dsl/ast/ast_nodes.def"
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UsingKind kind) noexcept
{
  switch (kind) {
    case UsingKind::Model:
      return "MODEL";
    case UsingKind::Key:
      return "KEY";
    case UsingKind::Url:
      return "URL";
  }
  return "";
}

/// DSL spelling of the operator.
[[nodiscard]] constexpr std::string_view to_string(FilterOp op) noexcept
{
  switch (op) {
    case FilterOp::Eq:
      return "=";
    case FilterOp::Gt:
      return ">";
    case FilterOp::Lt:
      return "<";
    case FilterOp::Ge:
      return ">=";
    case FilterOp::Le:
      return "<=";
    case FilterOp::Ne:
      return "!=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(PromptRole role) noexcept
{
  switch (role) {
    case PromptRole::User:
      return "user";
    case PromptRole::System:
      return "system";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(PragmaKind kind) noexcept
{
  switch (kind) {
    case PragmaKind::Autosave:
      return "AUTOSAVE";
    case PragmaKind::Concurrency:
      return "CONCURRENCY";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(WithKind kind) noexcept
{
  switch (kind) {
    case WithKind::Concurrency:
      return "CONCURRENCY";
    case WithKind::Stream:
      return "STREAM";
  }
  return "";
}

}  // namespace syn_dsl
