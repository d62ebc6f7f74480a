// minml/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "minml/ast/ast.hpp"
#include "minml/ast/ast_context.hpp"
#include "minml/basic/diagnostic.hpp"
#include "minml/basic/source_manager.hpp"
#include "minml/syntax/lexer.hpp"

namespace minml
{

/// Which entry point of the parser a source is fed to.
enum class ParseMode : uint8_t {
  Expression,
  Declaration,
  Program,
};

[[nodiscard]] std::string_view to_string(ParseMode mode) noexcept;
[[nodiscard]] std::optional<ParseMode> parse_mode_from_string(std::string_view text) noexcept;

struct FrontendOptions
{
  ParseMode mode = ParseMode::Program;
};

struct ParseOutput
{
  SourceId src = SourceId::invalid();
  AstNode * root = nullptr;  ///< null iff lexing or parsing failed
  syntax::TokenStream tokens;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// Lex errors are all reported; parsing is skipped when any exist. A parse
// failure contributes exactly one diagnostic.
[[nodiscard]] ParseOutput parse_source(
  SourceId src, std::string_view source_text, AstContext & ast, DiagnosticBag & diags,
  const FrontendOptions & options = {});

/// Register `source_text` under `path`, then parse it.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags, const FrontendOptions & options = {});

}  // namespace minml
