// minml/syntax/frontend.cpp - High-level parse pipeline
#include "minml/syntax/frontend.hpp"

#include <utility>

#include "minml/syntax/parser.hpp"

namespace minml
{

std::string_view to_string(ParseMode mode) noexcept
{
  switch (mode) {
    case ParseMode::Expression:
      return "expression";
    case ParseMode::Declaration:
      return "declaration";
    case ParseMode::Program:
      return "program";
  }
  return "program";
}

std::optional<ParseMode> parse_mode_from_string(std::string_view text) noexcept
{
  if (text == "expression" || text == "expr") return ParseMode::Expression;
  if (text == "declaration" || text == "decl") return ParseMode::Declaration;
  if (text == "program") return ParseMode::Program;
  return std::nullopt;
}

ParseOutput parse_source(
  SourceId src, std::string_view source_text, AstContext & ast, DiagnosticBag & diags,
  const FrontendOptions & options)
{
  ParseOutput out;
  out.src = src;

  auto lexed = syntax::lex(src, source_text);
  if (!lexed) {
    for (const auto & err : lexed.error()) {
      diags.add(syntax::to_diagnostic(err));
    }
    return out;
  }
  out.tokens = std::move(lexed.value());

  syntax::Parser parser(ast, out.tokens);
  switch (options.mode) {
    case ParseMode::Expression: {
      auto r = parser.parse_expression();
      if (r) {
        out.root = r.value().value();
      } else {
        diags.add(r.error().to_diagnostic());
      }
      break;
    }
    case ParseMode::Declaration: {
      auto r = parser.parse_declaration();
      if (r) {
        out.root = r.value().value();
      } else {
        diags.add(r.error().to_diagnostic());
      }
      break;
    }
    case ParseMode::Program: {
      auto r = parser.parse_program();
      if (r) {
        out.root = r.value();
      } else {
        diags.add(r.error().to_diagnostic());
      }
      break;
    }
  }
  return out;
}

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags, const FrontendOptions & options)
{
  const SourceId src = sources.register_file(path, std::move(source_text));
  const SourceFile * file = sources.get_file(src);
  if (file == nullptr) {
    diags.report_error({}, "too many source files registered");
    return {};
  }
  return parse_source(src, file->content(), ast, diags, options);
}

}  // namespace minml
