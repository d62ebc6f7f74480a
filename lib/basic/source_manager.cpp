// minml/basic/source_manager.cpp - Source file and registry implementation
#include "minml/basic/source_manager.hpp"

#include <algorithm>

namespace minml
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

void SourceFile::set_content(std::string new_content)
{
  content_ = std::move(new_content);
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;  // drop '\n'
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(Span span) const noexcept
{
  if (span.is_invalid()) {
    return {};
  }

  const uint32_t start = span.start();
  const uint32_t end = std::min(span.end(), static_cast<uint32_t>(content_.size()));
  if (start > end) {
    return {};
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(Span span) const noexcept
{
  FullSourceRange result;
  if (span.is_invalid()) {
    return result;
  }

  result.start_byte = span.start();
  result.end_byte = span.end();

  const auto start_lc = get_line_column(result.start_byte);
  const auto end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

// ============================================================================
// SourceRegistry
// ============================================================================

std::string SourceRegistry::normalize_key(const fs::path & path)
{
  // Virtual names such as "<stdin>" are not filesystem paths; keep them as-is.
  const std::string raw = path.string();
  if (!raw.empty() && raw.front() == '<') {
    return raw;
  }

  std::error_code ec;
  const fs::path canonical = fs::weakly_canonical(path, ec);
  if (ec) {
    return path.lexically_normal().string();
  }
  return canonical.string();
}

SourceId SourceRegistry::register_file(fs::path path, std::string content)
{
  const std::string key = normalize_key(path);
  if (const auto it = path_to_id_.find(key); it != path_to_id_.end()) {
    files_[it->second.value]->set_content(std::move(content));
    return it->second;
  }

  if (files_.size() >= static_cast<size_t>(SourceId::k_invalid)) {
    return SourceId::invalid();
  }

  const SourceId id{static_cast<uint32_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  path_to_id_.emplace(key, id);
  return id;
}

const SourceFile * SourceRegistry::get_file(SourceId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

const fs::path & SourceRegistry::get_path(SourceId id) const noexcept
{
  static const fs::path k_empty;
  const auto * f = get_file(id);
  return f ? f->path() : k_empty;
}

FullSourceRange SourceRegistry::get_full_range(Span span) const noexcept
{
  const auto * f = get_file(span.src());
  if (f == nullptr) {
    return {};
  }
  return f->get_full_range(span);
}

std::string_view SourceRegistry::get_slice(Span span) const noexcept
{
  const auto * f = get_file(span.src());
  if (f == nullptr) {
    return {};
  }
  return f->get_slice(span);
}

}  // namespace minml
