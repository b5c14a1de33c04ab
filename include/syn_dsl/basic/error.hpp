// syn_dsl/basic/error.hpp - Exception types raised by the compile and execute pipeline
#pragma once

#include <stdexcept>
#include <string>

#include "syn_dsl/basic/diagnostic.hpp"

namespace syn_dsl
{

/**
 * Root of every error thrown by syn_dsl.
 *
 * Carries a Diagnostic so callers can render it with source context.
 * `what()` returns the diagnostic message.
 */
class Error : public std::runtime_error
{
public:
  explicit Error(Diagnostic diag);

  [[nodiscard]] const Diagnostic & diagnostic() const noexcept { return diagnostic_; }
  [[nodiscard]] const std::string & code() const noexcept { return diagnostic_.code; }
  [[nodiscard]] SourceRange range() const noexcept { return diagnostic_.primary_range(); }

private:
  Diagnostic diagnostic_;
};

/// The lexer could not produce a token sequence.
class TokenizeError : public Error
{
public:
  TokenizeError(std::string code, std::string message, SourceRange range);
};

/// The token sequence does not match the grammar.
class ParseError : public Error
{
public:
  ParseError(std::string code, std::string message, SourceRange range);
};

/**
 * The generated program could not be written, launched or finished
 * with a non-interrupt failure.
 */
class ExecutionError : public Error
{
public:
  explicit ExecutionError(
    std::string message, std::string captured_stderr = {}, std::string captured_stdout = {});

  [[nodiscard]] const std::string & captured_stderr() const noexcept { return stderr_; }
  [[nodiscard]] const std::string & captured_stdout() const noexcept { return stdout_; }

private:
  std::string stderr_;
  std::string stdout_;
};

}  // namespace syn_dsl
