// minml/basic/source_manager.hpp - Source files and location services
//
// The registry owns source text and assigns SourceIds. Spans produced by the
// lexer and parser are plain byte ranges; everything line/column related is
// answered here.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "minml/basic/span.hpp"

namespace minml
{

namespace fs = std::filesystem;

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * A span expanded with pre-computed line/column information.
 */
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
// SourceFile
// ============================================================================

class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  void set_content(std::string new_content);

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a 0-indexed line, without its line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(Span span) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(Span span) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns every source of a session and maps SourceId <-> path.
 *
 * Registering the same (normalized) path twice returns the first id.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  [[nodiscard]] SourceId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(SourceId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(SourceId id) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] FullSourceRange get_full_range(Span span) const noexcept;
  [[nodiscard]] std::string_view get_slice(Span span) const noexcept;

private:
  [[nodiscard]] static std::string normalize_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, SourceId> path_to_id_;
};

}  // namespace minml
