// syn_dsl/ast/json_visitor.cpp - JSON serialization implementation
//
#include "syn_dsl/ast/json_visitor.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "syn_dsl/ast/ast_enums.hpp"
#include "syn_dsl/ast/visitor.hpp"
#include "syn_dsl/basic/source_manager.hpp"

namespace syn_dsl
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

json j_node(const AstNode * n)
{
  return json{{"type", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
}

json j_strings(gsl::span<const std::string_view> items)
{
  json arr = json::array();
  for (const auto & s : items) {
    arr.push_back(std::string(s));
  }
  return arr;
}

json j_filter_value(const FilterValue & v)
{
  if (v.is_integer()) {
    return v.as_integer();
  }
  return std::string(v.as_string());
}

// ============================================================================
// Visitor
// ============================================================================

class JsonVisitor : public ConstAstVisitor<JsonVisitor, json>
{
public:
  json visit_program(const Program * p)
  {
    json j = j_node(p);
    j["statements"] = stmts(p->stmts);
    return j;
  }

  json visit_block(const Block * b)
  {
    json j = j_node(b);
    j["statements"] = stmts(b->stmts);
    return j;
  }

  json visit_from_stmt(const FromStmt * s)
  {
    json j = j_node(s);
    j["dataset"] = std::string(s->dataset);
    j["block"] = visit(s->block);
    return j;
  }

  json visit_with_stmt(const WithStmt * s)
  {
    json j = j_node(s);
    j["option"] = std::string(to_string(s->option));
    j["value"] = s->value;
    j["block"] = visit(s->block);
    return j;
  }

  json visit_fields_stmt(const FieldsStmt * s)
  {
    json j = j_node(s);
    j["fields"] = j_strings(s->fields);
    return j;
  }

  json visit_using_stmt(const UsingStmt * s)
  {
    json j = j_node(s);
    j["target"] = std::string(to_string(s->target));
    j["value"] = std::string(s->value);
    return j;
  }

  json visit_using_block(const UsingBlock * s)
  {
    json j = j_node(s);
    json entries = json::array();
    for (const auto * e : s->entries) {
      entries.push_back(visit(e));
    }
    j["entries"] = std::move(entries);
    return j;
  }

  json visit_filter_stmt(const FilterStmt * s)
  {
    json j = j_node(s);
    j["field"] = std::string(s->field);
    j["op"] = std::string(to_string(s->op));
    j["value"] = j_filter_value(s->value);
    return j;
  }

  json visit_filter_block(const FilterBlock * s)
  {
    json j = j_node(s);
    j["field"] = std::string(s->field);
    json conds = json::array();
    for (const auto & c : s->conditions) {
      conds.push_back(json{
        {"field", std::string(c.field)},
        {"op", std::string(to_string(c.op))},
        {"value", j_filter_value(c.value)},
        {"range", j_range(c.range)}});
    }
    j["conditions"] = std::move(conds);
    return j;
  }

  json visit_merge_stmt(const MergeStmt * s)
  {
    json j = j_node(s);
    j["datasets"] = j_strings(s->datasets);
    return j;
  }

  json visit_save_stmt(const SaveStmt * s)
  {
    json j = j_node(s);
    j["filename"] = std::string(s->filename);
    return j;
  }

  json visit_generate_stmt(const GenerateStmt * s)
  {
    json j = j_node(s);
    j["sourceField"] = std::string(s->sourceField);
    j["targetField"] = std::string(s->targetField);
    j["model"] = s->model ? json(std::string(*s->model)) : json(nullptr);
    j["temperature"] = s->temperature;
    j["maxTokens"] = s->maxTokens;
    j["prompts"] = j_strings(s->prompts);
    return j;
  }

  json visit_prompt_stmt(const PromptStmt * s)
  {
    json j = j_node(s);
    j["name"] = std::string(s->name);
    j["role"] = std::string(to_string(s->role));
    j["template"] = std::string(s->templateText);
    j["fields"] = j_strings(s->fields);
    return j;
  }

  json visit_pragma_stmt(const PragmaStmt * s)
  {
    json j = j_node(s);
    j["directive"] = std::string(to_string(s->directive));
    if (s->directive == PragmaKind::Autosave) {
      j["value"] = true;
    } else {
      j["value"] = s->value;
    }
    return j;
  }

private:
  json stmts(gsl::span<Stmt * const> list)
  {
    json arr = json::array();
    for (const auto * s : list) {
      arr.push_back(visit(s));
    }
    return arr;
  }
};

}  // namespace

json to_json(const AstNode * node)
{
  JsonVisitor v;
  return v.visit(node);
}

}  // namespace syn_dsl
