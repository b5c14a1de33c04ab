// syn_dsl/ast/visitor.hpp - CRTP visitor for AST traversal
#pragma once

#include <type_traits>

#include "syn_dsl/ast/ast.hpp"
#include "syn_dsl/ast/ast_enums.hpp"
#include "syn_dsl/basic/casting.hpp"

namespace syn_dsl
{

namespace detail
{

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

/**
 * Static-dispatch visitor.
 *
 * `visit(node)` switches on the node kind and calls `visit_<snake>(Class *)`
 * on the derived class. Unimplemented statement visits fall back to
 * `visit_stmt`, everything else to `visit_node`.
 *
 * @code
 *   class Counter : public ConstAstVisitor<Counter, int> {
 *   public:
 *     int visit_save_stmt(const SaveStmt *) { return 1; }
 *     int visit_node(const AstNode *) { return 0; }
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "syn_dsl/ast/ast_nodes.def"
    }

    return ReturnType();
  }

#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "syn_dsl/ast/ast_nodes.def"

  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

}  // namespace syn_dsl
