// End-to-end checks of small inputs through the lexer and parser.
#include <gtest/gtest.h>

#include "minml/ast/ast.hpp"
#include "minml/basic/casting.hpp"
#include "minml/syntax/lex_error.hpp"
#include "minml/syntax/lexer.hpp"
#include "minml/test_support/parse_helpers.hpp"

using minml::BinaryExpr;
using minml::BinaryOp;
using minml::dyn_cast;
using minml::LiteralExpr;
using minml::LiteralKind;
using minml::LocalExpr;
using minml::SourceId;
using minml::Span;
using minml::UnaryExpr;
using minml::UnaryOp;
using minml::syntax::lex;
using minml::syntax::LexErrorKind;
using minml::test_support::parse_expr;

TEST(SyntaxScenarios, SpacedParensAreUnit)
{
  auto u = parse_expr("( )");
  auto * lit = dyn_cast<LiteralExpr>(u.expr());
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value.kind(), LiteralKind::Unit);
  EXPECT_EQ(lit->span(), (Span{u.src, 0, 3}));
}

TEST(SyntaxScenarios, IntegerLiteral)
{
  auto u = parse_expr("42");
  auto * lit = dyn_cast<LiteralExpr>(u.expr());
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value.kind(), LiteralKind::Int);
  EXPECT_EQ(lit->value.as_int(), 42u);
  EXPECT_EQ(lit->span(), (Span{u.src, 0, 2}));
}

TEST(SyntaxScenarios, EscapedCharLiteral)
{
  auto u = parse_expr(R"('\n')");
  auto * lit = dyn_cast<LiteralExpr>(u.expr());
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value.kind(), LiteralKind::Char);
  EXPECT_EQ(lit->value.as_char(), U'\n');
  EXPECT_EQ(lit->span(), (Span{u.src, 0, 4}));
}

TEST(SyntaxScenarios, AndBindsTighterThanOr)
{
  auto u = parse_expr("a && b || c");
  auto * or_ = dyn_cast<BinaryExpr>(u.expr());
  ASSERT_NE(or_, nullptr);
  EXPECT_EQ(or_->op.value(), BinaryOp::Or);
  EXPECT_EQ(or_->span(), (Span{u.src, 0, 11}));

  auto * and_ = dyn_cast<BinaryExpr>(or_->lhs);
  ASSERT_NE(and_, nullptr);
  EXPECT_EQ(and_->op.value(), BinaryOp::And);
  EXPECT_EQ(dyn_cast<LocalExpr>(and_->lhs)->name, "a");
  EXPECT_EQ(dyn_cast<LocalExpr>(and_->rhs)->name, "b");
  EXPECT_EQ(dyn_cast<LocalExpr>(or_->rhs)->name, "c");
}

TEST(SyntaxScenarios, ComparisonOperatorSpan)
{
  auto u = parse_expr("1 < 2");
  auto * less = dyn_cast<BinaryExpr>(u.expr());
  ASSERT_NE(less, nullptr);
  EXPECT_EQ(less->op.value(), BinaryOp::Less);
  EXPECT_EQ(less->op.span(), (Span{u.src, 2, 3}));
  EXPECT_EQ(dyn_cast<LiteralExpr>(less->lhs)->value.as_int(), 1u);
  EXPECT_EQ(dyn_cast<LiteralExpr>(less->rhs)->value.as_int(), 2u);
}

TEST(SyntaxScenarios, MultiCharLiteralIsOneLexError)
{
  constexpr SourceId src{0};
  auto r = lex(src, "'ab'");
  ASSERT_TRUE(r.has_error());
  ASSERT_EQ(r.error().size(), 1u);
  EXPECT_EQ(r.error()[0]->kind(), LexErrorKind::MultiChar);
  EXPECT_EQ(r.error()[0].span(), (Span{src, 0, 4}));
}

TEST(SyntaxScenarios, UnclosedParenReportsDelimiter)
{
  auto u = parse_expr("(1");
  EXPECT_EQ(u.root, nullptr);
  ASSERT_EQ(u.diags.size(), 1u);
  EXPECT_EQ(u.diags.all()[0].code, "parse::expected_delimiter");
  EXPECT_EQ(u.diags.all()[0].message, "unclosed delimiter `(`, expected `)`");
}

TEST(SyntaxScenarios, NestedNegation)
{
  auto u = parse_expr("~ ~ x");
  auto * outer = dyn_cast<UnaryExpr>(u.expr());
  ASSERT_NE(outer, nullptr);
  auto * inner = dyn_cast<UnaryExpr>(outer->operand);
  ASSERT_NE(inner, nullptr);
  auto * x = dyn_cast<LocalExpr>(inner->operand);
  ASSERT_NE(x, nullptr);

  EXPECT_EQ(outer->op.value(), UnaryOp::Neg);
  EXPECT_EQ(inner->op.value(), UnaryOp::Neg);
  EXPECT_EQ(outer->span(), (Span{u.src, 0, 5}));
  EXPECT_EQ(inner->span(), (Span{u.src, 2, 5}));
  EXPECT_EQ(x->span(), (Span{u.src, 4, 5}));
}
