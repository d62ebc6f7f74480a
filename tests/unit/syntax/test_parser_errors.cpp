#include <gtest/gtest.h>

#include <string_view>

#include "minml/ast/ast_context.hpp"
#include "minml/basic/diagnostic.hpp"
#include "minml/syntax/lexer.hpp"
#include "minml/syntax/parse_error.hpp"
#include "minml/syntax/parser.hpp"
#include "minml/test_support/parse_helpers.hpp"

using minml::AstContext;
using minml::LabelStyle;
using minml::ParseMode;
using minml::SourceId;
using minml::Span;
using minml::syntax::lex;
using minml::syntax::ParseError;
using minml::syntax::ParseErrorKind;
using minml::syntax::Parser;
using minml::syntax::TokenKind;
using minml::syntax::TokenStream;
using minml::test_support::parse;
using minml::test_support::parse_decl;
using minml::test_support::parse_expr;

namespace
{

constexpr SourceId k_src{0};

TokenStream tokens_of(std::string_view src)
{
  auto r = lex(k_src, src);
  EXPECT_FALSE(r.has_error()) << "unexpected lex errors for: " << src;
  if (!r) return {};
  return std::move(r).value();
}

ParseError expr_error(std::string_view src)
{
  AstContext ast;
  const auto tokens = tokens_of(src);
  auto r = Parser(ast, tokens).parse_expression();
  EXPECT_TRUE(r.has_error()) << "expected a parse error for: " << src;
  if (r) return ParseError::unexpected_eof("a parse error", {});
  return r.error();
}

ParseError program_error(std::string_view src)
{
  AstContext ast;
  const auto tokens = tokens_of(src);
  auto r = Parser(ast, tokens).parse_program();
  EXPECT_TRUE(r.has_error()) << "expected a parse error for: " << src;
  if (r) return ParseError::unexpected_eof("a parse error", {});
  return r.error();
}

}  // namespace

// ============================================================================
// Error kinds
// ============================================================================

TEST(SyntaxParserErrors, UnclosedParenthesis)
{
  const auto err = expr_error("(1");
  EXPECT_EQ(err.kind(), ParseErrorKind::ExpectedDelimiter);
  EXPECT_EQ(err.open_span(), (Span{k_src, 0, 1}));
  EXPECT_EQ(err.end_span(), (Span{k_src, 2, 2}));
  EXPECT_EQ(err.expected(), ")");
  EXPECT_EQ(err.opened(), "(");
  EXPECT_EQ(err.code(), "parse::expected_delimiter");
  EXPECT_EQ(err.message(), "unclosed delimiter `(`, expected `)`");
}

TEST(SyntaxParserErrors, UnclosedParenthesisBeforeAnotherToken)
{
  const auto err = expr_error("(a + b then");
  EXPECT_EQ(err.kind(), ParseErrorKind::ExpectedDelimiter);
  EXPECT_EQ(err.open_span(), (Span{k_src, 0, 1}));
  EXPECT_EQ(err.end_span(), (Span{k_src, 7, 11}));
}

TEST(SyntaxParserErrors, OperatorAtEndOfInput)
{
  const auto err = expr_error("1 +");
  EXPECT_EQ(err.kind(), ParseErrorKind::UnexpectedEof);
  EXPECT_EQ(err.span(), (Span{k_src, 3, 3}));
  EXPECT_EQ(err.message(), "unexpected end of input, expected an expression");
  ASSERT_TRUE(err.found().has_value());
  EXPECT_TRUE(err.found()->is(TokenKind::Eof));
}

TEST(SyntaxParserErrors, MissingOperand)
{
  const auto err = expr_error("1 + )");
  EXPECT_EQ(err.kind(), ParseErrorKind::ExpectedPrimary);
  EXPECT_EQ(err.span(), (Span{k_src, 4, 5}));
  EXPECT_EQ(err.message(), "expected an expression, found `)`");
  EXPECT_TRUE(err.help().has_value());
}

TEST(SyntaxParserErrors, UnknownTypeName)
{
  const auto err = program_error("val x : foo = 1");
  EXPECT_EQ(err.kind(), ParseErrorKind::ExpectedType);
  EXPECT_EQ(err.span(), (Span{k_src, 8, 11}));
  EXPECT_EQ(err.expected(), "a type");
}

TEST(SyntaxParserErrors, UnclosedUnitType)
{
  const auto err = program_error("val x : ( = 1");
  EXPECT_EQ(err.kind(), ParseErrorKind::ExpectedDelimiter);
  EXPECT_EQ(err.open_span(), (Span{k_src, 8, 9}));
  EXPECT_EQ(err.end_span(), (Span{k_src, 10, 11}));
}

TEST(SyntaxParserErrors, TrailingTokensAfterExpression)
{
  const auto err = expr_error("1 2)");
  EXPECT_EQ(err.kind(), ParseErrorKind::UnexpectedToken);
  EXPECT_EQ(err.expected(), "end of input");
  EXPECT_EQ(err.span(), (Span{k_src, 3, 4}));
  ASSERT_TRUE(err.found().has_value());
  EXPECT_TRUE(err.found()->is(TokenKind::RParen));
}

TEST(SyntaxParserErrors, IfWithoutElse)
{
  const auto err = expr_error("if a then b");
  EXPECT_EQ(err.kind(), ParseErrorKind::UnexpectedEof);
  EXPECT_EQ(err.expected(), "`else`");
}

TEST(SyntaxParserErrors, LetWithoutEnd)
{
  const auto err = expr_error("let val x = 1 in x then");
  EXPECT_EQ(err.kind(), ParseErrorKind::UnexpectedToken);
  EXPECT_EQ(err.expected(), "`end`");
  EXPECT_EQ(err.span(), (Span{k_src, 19, 23}));
}

TEST(SyntaxParserErrors, WhileWithoutDo)
{
  const auto err = expr_error("let while x x := 1 in x end");
  EXPECT_EQ(err.kind(), ParseErrorKind::UnexpectedToken);
  EXPECT_EQ(err.expected(), "`do`");
}

TEST(SyntaxParserErrors, FunctionWithoutName)
{
  const auto err = program_error("fun = 1");
  EXPECT_EQ(err.kind(), ParseErrorKind::UnexpectedToken);
  EXPECT_EQ(err.expected(), "a function name");
  EXPECT_EQ(err.span(), (Span{k_src, 4, 5}));
}

TEST(SyntaxParserErrors, TypedParameterWithoutColon)
{
  const auto err = program_error("fun f (x int) = x");
  EXPECT_EQ(err.kind(), ParseErrorKind::UnexpectedToken);
  EXPECT_EQ(err.expected(), "`:`");
}

TEST(SyntaxParserErrors, ExpressionWhereDeclarationExpected)
{
  auto u = parse_decl("x");
  EXPECT_EQ(u.root, nullptr);
  ASSERT_EQ(u.diags.size(), 1u);
  EXPECT_EQ(u.diags.all()[0].code, "parse::unexpected_token");
  EXPECT_EQ(u.diags.all()[0].message, "expected a declaration (`val` or `fun`), found `x`");
}

TEST(SyntaxParserErrors, EmptyExpressionInput)
{
  const auto err = expr_error("   ");
  EXPECT_EQ(err.kind(), ParseErrorKind::UnexpectedEof);
  EXPECT_EQ(err.span(), (Span{k_src, 3, 3}));
}

TEST(SyntaxParserErrors, EmptyTokenStreamIsEndOfInput)
{
  AstContext ast;
  const TokenStream empty;

  auto e = Parser(ast, empty).parse_expression();
  ASSERT_TRUE(e.has_error());
  EXPECT_EQ(e.error().kind(), ParseErrorKind::UnexpectedEof);

  auto p = Parser(ast, empty).parse_program();
  ASSERT_FALSE(p.has_error());
  EXPECT_TRUE(p.value()->decls.empty());
}

TEST(SyntaxParserErrors, StreamWithoutEofEndsAfterLastToken)
{
  AstContext ast;

  auto truncated = tokens_of("val x =");
  ASSERT_EQ(truncated.back().value().kind(), TokenKind::Eof);
  truncated.pop_back();
  auto d = Parser(ast, truncated).parse_declaration();
  ASSERT_TRUE(d.has_error());
  EXPECT_EQ(d.error().kind(), ParseErrorKind::UnexpectedEof);
  EXPECT_EQ(d.error().span(), (Span{k_src, 7, 7}));

  auto app = tokens_of("val y = f 1 2");
  app.pop_back();
  auto p = Parser(ast, app).parse_program();
  ASSERT_FALSE(p.has_error());
  EXPECT_EQ(p.value()->decls.size(), 1u);
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(SyntaxParserErrors, ParsingStopsAtTheFirstError)
{
  auto u = parse("val a = ) val b = ) fun = 3");
  EXPECT_EQ(u.root, nullptr);
  ASSERT_EQ(u.diags.size(), 1u);
  EXPECT_EQ(u.diags.all()[0].primary_span(), (Span{u.src, 8, 9}));
}

TEST(SyntaxParserErrors, UnclosedDelimiterDiagnostic)
{
  auto u = parse_expr("(1");
  ASSERT_EQ(u.diags.size(), 1u);
  const auto & d = u.diags.all()[0];

  EXPECT_EQ(d.code, "parse::expected_delimiter");
  ASSERT_EQ(d.labels.size(), 2u);
  EXPECT_EQ(d.labels[0].style, LabelStyle::Primary);
  EXPECT_EQ(d.labels[0].span, (Span{u.src, 2, 2}));
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.labels[1].span, (Span{u.src, 0, 1}));
  EXPECT_EQ(d.labels[1].message, "unclosed `(` opened here");

  ASSERT_EQ(d.fixits.size(), 1u);
  EXPECT_EQ(d.fixits[0].replacement, ")");
  EXPECT_EQ(d.fixits[0].span, (Span{u.src, 2, 2}));

  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "add `)` to close the `(`");
}

TEST(SyntaxParserErrors, LexErrorsSkipParsing)
{
  auto u = parse_expr("12ab + 'xy'");
  EXPECT_EQ(u.root, nullptr);
  ASSERT_EQ(u.diags.size(), 2u);
  EXPECT_EQ(u.diags.all()[0].code, "lex::invalid_number_char");
  EXPECT_EQ(u.diags.all()[1].code, "lex::multi_char");
}

TEST(SyntaxParserErrors, ModesRejectEachOthersInput)
{
  EXPECT_FALSE(parse("1 + 2", ParseMode::Program).diags.empty());
  EXPECT_FALSE(parse("val x = 1", ParseMode::Expression).diags.empty());
  EXPECT_FALSE(parse("val x = 1 val y = 2", ParseMode::Declaration).diags.empty());
  EXPECT_TRUE(parse("val x = 1 val y = 2", ParseMode::Program).diags.empty());
}
