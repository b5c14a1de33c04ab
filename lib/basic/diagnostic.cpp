// syn_dsl/basic/diagnostic.cpp - Diagnostic bag and builder
#include "syn_dsl/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace syn_dsl
{

namespace
{

Diagnostic make_diagnostic(
  Severity severity, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l != nullptr ? l->range : SourceRange{};
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  return {
    *this,
    make_diagnostic(Severity::Error, range, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  return {
    *this,
    make_diagnostic(Severity::Warning, range, std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

}  // namespace syn_dsl
