// syn_dsl/basic/source_manager.hpp - Byte offsets, ranges and line lookup for .syn sources
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace syn_dsl
{

// ============================================================================
// SourceLocation
// ============================================================================

/**
 * A byte offset into a single source buffer.
 *
 * Line and column are derived lazily through SourceManager.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open byte range [begin, end) of a token or node.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }

  constexpr SourceRange(uint32_t begin_offset, uint32_t end_offset) noexcept
  : begin_(SourceLocation(begin_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.get_offset() - begin_.get_offset() : 0;
  }

  /// Smallest range covering both `a` and `b`.
  [[nodiscard]] static constexpr SourceRange join(SourceRange a, SourceRange b) noexcept
  {
    if (a.is_invalid()) return b;
    if (b.is_invalid()) return a;
    return {a.begin_, b.end_};
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange
// ============================================================================

/// 1-indexed position; 0 means unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceManager
// ============================================================================

/**
 * Owns the text of one DSL file and answers position queries about it.
 *
 * The line table is rebuilt whenever the text changes, so offset to
 * line/column conversion is a binary search.
 */
class SourceManager
{
public:
  SourceManager() = default;

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }
  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  /// Path used in diagnostics; "<input>" for in-memory sources.
  [[nodiscard]] std::string get_display_name() const;

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;
  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept
  {
    return loc.is_valid() ? get_line_column(loc.get_offset()) : LineColumn{};
  }

  /// Text of a 0-indexed line without its terminator.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace syn_dsl
