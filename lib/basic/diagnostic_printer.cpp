// syn_dsl/basic/diagnostic_printer.cpp - Source-annotated diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "syn_dsl/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace syn_dsl
{

namespace
{

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Note:
      return rang::fg::cyan;
  }
  return rang::fg::red;
}

/// Tabs widen to four columns so markers line up with the echoed line.
std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  print_header(diag);

  const FullSourceRange fr = source.get_full_range(diag.primary_range());
  const std::string name = source.get_display_name();
  if (fr.is_valid()) {
    fmt::print(os_, "  --> {}:{}:{}\n", name, fr.start_line, fr.start_column);
  } else {
    fmt::print(os_, "  --> {}\n", name);
  }

  fmt::print(os_, "{}\n", gutter());
  for (const auto & label : diag.labels) {
    print_label(label, source);
  }
  if (diag.help_message) {
    print_help(*diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });
  for (const auto * d : ordered) {
    print(*d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << name << code << rang::fg::reset
        << ": " << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label, const SourceManager & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    if (!label.message.empty()) {
      fmt::print(os_, "   = note: {}\n", label.message);
    }
    return;
  }

  const std::string_view raw_line = source.get_line(fr.start_line - 1);
  const std::string line = expand_tabs(raw_line);

  if (use_color_) {
    os_ << rang::fg::cyan << fmt::format(" {:>4} ", fr.start_line) << rang::fg::reset;
    os_ << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", fr.start_line);
  }
  fmt::print(os_, "{}\n", line);

  // Marker column accounts for expanded tabs before the start column.
  const auto prefix_len = std::min<size_t>(fr.start_column - 1, raw_line.size());
  const size_t visual_start = expand_tabs(raw_line.substr(0, prefix_len)).size();
  const size_t width = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                         ? fr.end_column - fr.start_column
                         : 1;
  const char marker = label.style == LabelStyle::Primary ? '^' : '-';

  fmt::print(os_, "{} {}", gutter(), std::string(visual_start, ' '));
  if (use_color_) {
    os_ << (label.style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan)
        << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(width, marker));
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

std::string DiagnosticPrinter::gutter() const
{
  if (use_color_) {
    return "\033[1;36m      |\033[0m";
  }
  return "      |";
}

}  // namespace syn_dsl
