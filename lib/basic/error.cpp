// syn_dsl/basic/error.cpp - Exception types
#include "syn_dsl/basic/error.hpp"

#include <utility>

namespace syn_dsl
{

namespace
{

Diagnostic error_diagnostic(std::string code, std::string message, SourceRange range)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::move(code);
  d.message = std::move(message);
  d.labels.push_back(Label{range, {}, LabelStyle::Primary});
  return d;
}

/// Failure text shown by what(): the message plus the child's stderr, if any.
std::string execution_message(const std::string & message, const std::string & captured_stderr)
{
  if (captured_stderr.empty()) {
    return message;
  }
  std::string out = message + "\n" + captured_stderr;
  while (!out.empty() && out.back() == '\n') {
    out.pop_back();
  }
  return out;
}

}  // namespace

Error::Error(Diagnostic diag) : std::runtime_error(diag.message), diagnostic_(std::move(diag)) {}

TokenizeError::TokenizeError(std::string code, std::string message, SourceRange range)
: Error(error_diagnostic(std::move(code), std::move(message), range))
{
}

ParseError::ParseError(std::string code, std::string message, SourceRange range)
: Error(error_diagnostic(std::move(code), std::move(message), range))
{
}

ExecutionError::ExecutionError(
  std::string message, std::string captured_stderr, std::string captured_stdout)
: Error(error_diagnostic("E0300", execution_message(message, captured_stderr), SourceRange{})),
  stderr_(std::move(captured_stderr)),
  stdout_(std::move(captured_stdout))
{
}

}  // namespace syn_dsl
