// minml/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-file parsing pipeline for tests. Ownership stays explicit
// (SourceRegistry + AstContext) behind a convenient wrapper.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "minml/ast/ast.hpp"
#include "minml/ast/ast_context.hpp"
#include "minml/basic/casting.hpp"
#include "minml/basic/diagnostic.hpp"
#include "minml/basic/source_manager.hpp"
#include "minml/syntax/frontend.hpp"

namespace minml::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  SourceId src = SourceId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  AstNode * root = nullptr;

  [[nodiscard]] const SourceFile * source_file() const noexcept { return sources.get_file(src); }

  [[nodiscard]] std::string_view slice(Span s) const noexcept { return sources.get_slice(s); }

  [[nodiscard]] FullSourceRange full_range(Span s) const noexcept
  {
    return sources.get_full_range(s);
  }

  [[nodiscard]] Expr * expr() const { return root ? dyn_cast<Expr>(root) : nullptr; }
  [[nodiscard]] Decl * decl() const { return root ? dyn_cast<Decl>(root) : nullptr; }
  [[nodiscard]] Program * program() const { return root ? dyn_cast<Program>(root) : nullptr; }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, ParseMode mode = ParseMode::Program,
  const std::filesystem::path & virtual_path = "<test>.mml")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed = parse_source(
    out.sources, virtual_path, std::move(src), *out.ast, out.diags, FrontendOptions{mode});
  out.src = parsed.src;
  out.root = parsed.root;
  return out;
}

[[nodiscard]] inline TestParseUnit parse_expr(std::string src)
{
  return parse(std::move(src), ParseMode::Expression);
}

[[nodiscard]] inline TestParseUnit parse_decl(std::string src)
{
  return parse(std::move(src), ParseMode::Declaration);
}

}  // namespace minml::test_support
