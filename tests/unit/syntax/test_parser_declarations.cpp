#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "minml/ast/ast.hpp"
#include "minml/basic/casting.hpp"
#include "minml/test_support/parse_helpers.hpp"

using minml::BinaryExpr;
using minml::dyn_cast;
using minml::FuncDecl;
using minml::IdentParam;
using minml::isa;
using minml::LiteralExpr;
using minml::Span;
using minml::Type;
using minml::TypedParam;
using minml::ValDecl;
using minml::WildcardParam;
using minml::test_support::parse;
using minml::test_support::parse_decl;

// ============================================================================
// val
// ============================================================================

TEST(SyntaxParserDecl, ValWithType)
{
  auto u = parse_decl("val x : int = 1");
  ASSERT_TRUE(u.diags.empty());
  auto * val = dyn_cast<ValDecl>(u.decl());
  ASSERT_NE(val, nullptr);

  EXPECT_EQ(val->binding.name->str(), "x");
  EXPECT_EQ(val->binding.name.span(), (Span{u.src, 4, 5}));
  ASSERT_TRUE(val->binding.ty.has_value());
  EXPECT_EQ(*val->binding.ty, Type::Int);
  EXPECT_TRUE(isa<LiteralExpr>(val->binding.expr));
  EXPECT_EQ(val->span(), (Span{u.src, 0, 15}));
}

TEST(SyntaxParserDecl, ValWithoutType)
{
  auto u = parse_decl("val total = a + b");
  auto * val = dyn_cast<ValDecl>(u.decl());
  ASSERT_NE(val, nullptr);
  EXPECT_FALSE(val->binding.ty.has_value());
  EXPECT_TRUE(isa<BinaryExpr>(val->binding.expr));
  EXPECT_EQ(u.slice(val->span()), "val total = a + b");
}

TEST(SyntaxParserDecl, UnitTypeSpellings)
{
  for (const std::string ty : {"unit", "()", "( )"}) {
    auto u = parse_decl("val u : " + ty + " = ()");
    auto * val = dyn_cast<ValDecl>(u.decl());
    ASSERT_NE(val, nullptr) << ty;
    ASSERT_TRUE(val->binding.ty.has_value()) << ty;
    EXPECT_EQ(*val->binding.ty, Type::Unit) << ty;
  }
}

TEST(SyntaxParserDecl, EveryPrimitiveType)
{
  const std::pair<const char *, Type> cases[] = {
    {"int", Type::Int},   {"bool", Type::Bool}, {"char", Type::Char},
    {"real", Type::Real}, {"unit", Type::Unit},
  };
  for (const auto & [text, ty] : cases) {
    auto u = parse_decl(std::string("fun f (x : ") + text + ") : " + text + " = x");
    auto * fn = dyn_cast<FuncDecl>(u.decl());
    ASSERT_NE(fn, nullptr) << text;
    ASSERT_TRUE(fn->return_ty.has_value());
    EXPECT_EQ(fn->return_ty->value(), ty) << text;
    EXPECT_EQ(dyn_cast<TypedParam>(fn->params[0])->ty.value(), ty) << text;
  }
}

// ============================================================================
// fun
// ============================================================================

TEST(SyntaxParserDecl, FunctionWithPlainParameters)
{
  auto u = parse_decl("fun add x y = x + y");
  ASSERT_TRUE(u.diags.empty());
  auto * fn = dyn_cast<FuncDecl>(u.decl());
  ASSERT_NE(fn, nullptr);

  EXPECT_EQ(fn->name->str(), "add");
  EXPECT_EQ(fn->name.span(), (Span{u.src, 4, 7}));
  ASSERT_EQ(fn->params.size(), 2u);

  auto * x = dyn_cast<IdentParam>(fn->params[0]);
  ASSERT_NE(x, nullptr);
  EXPECT_EQ(x->name, "x");
  EXPECT_EQ(x->span(), (Span{u.src, 8, 9}));
  EXPECT_TRUE(isa<IdentParam>(fn->params[1]));

  EXPECT_FALSE(fn->return_ty.has_value());
  EXPECT_TRUE(isa<BinaryExpr>(fn->body));
  EXPECT_EQ(fn->span(), (Span{u.src, 0, 19}));
}

TEST(SyntaxParserDecl, FunctionWithTypedAndWildcardParameters)
{
  auto u = parse_decl("fun f (x : int) _ : bool = true");
  ASSERT_TRUE(u.diags.empty());
  auto * fn = dyn_cast<FuncDecl>(u.decl());
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->params.size(), 2u);

  auto * typed = dyn_cast<TypedParam>(fn->params[0]);
  ASSERT_NE(typed, nullptr);
  EXPECT_EQ(typed->span(), (Span{u.src, 6, 15}));
  EXPECT_EQ(typed->ty.value(), Type::Int);
  EXPECT_EQ(typed->ty.span(), (Span{u.src, 11, 14}));
  EXPECT_TRUE(isa<IdentParam>(typed->inner));

  auto * wild = dyn_cast<WildcardParam>(fn->params[1]);
  ASSERT_NE(wild, nullptr);
  EXPECT_EQ(wild->span(), (Span{u.src, 16, 17}));

  ASSERT_TRUE(fn->return_ty.has_value());
  EXPECT_EQ(fn->return_ty->value(), Type::Bool);
  EXPECT_EQ(fn->return_ty->span(), (Span{u.src, 20, 24}));
}

TEST(SyntaxParserDecl, NestedTypedParameter)
{
  auto u = parse_decl("fun f ((x : int) : int) = x");
  auto * fn = dyn_cast<FuncDecl>(u.decl());
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->params.size(), 1u);

  auto * outer = dyn_cast<TypedParam>(fn->params[0]);
  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(u.slice(outer->span()), "((x : int) : int)");
  auto * inner = dyn_cast<TypedParam>(outer->inner);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(u.slice(inner->span()), "(x : int)");
}

TEST(SyntaxParserDecl, FunctionWithoutParameters)
{
  auto u = parse_decl("fun main = let val x = 1 in x end");
  auto * fn = dyn_cast<FuncDecl>(u.decl());
  ASSERT_NE(fn, nullptr);
  EXPECT_TRUE(fn->params.empty());
  EXPECT_EQ(u.slice(fn->span()), "fun main = let val x = 1 in x end");
}

// ============================================================================
// Programs
// ============================================================================

TEST(SyntaxParserDecl, ProgramCoversTheWholeInput)
{
  const std::string src =
    "  val limit = 10\n"
    "fun square x = x * x\n"
    "fun main _ = square limit\n\n";
  auto u = parse(src);
  ASSERT_TRUE(u.diags.empty());
  auto * prog = u.program();
  ASSERT_NE(prog, nullptr);
  ASSERT_EQ(prog->decls.size(), 3u);
  EXPECT_EQ(prog->span(), (Span{u.src, 0, static_cast<uint32_t>(src.size())}));

  EXPECT_TRUE(isa<ValDecl>(prog->decls[0]));
  EXPECT_TRUE(isa<FuncDecl>(prog->decls[1]));
  EXPECT_EQ(u.slice(prog->decls[1]->span()), "fun square x = x * x");
  EXPECT_EQ(u.slice(prog->decls[2]->span()), "fun main _ = square limit");
}

TEST(SyntaxParserDecl, EmptyProgram)
{
  auto u = parse("   \n");
  ASSERT_TRUE(u.diags.empty());
  auto * prog = u.program();
  ASSERT_NE(prog, nullptr);
  EXPECT_TRUE(prog->decls.empty());
  EXPECT_EQ(prog->span(), (Span{u.src, 0, 4}));
}

TEST(SyntaxParserDecl, DeclarationModeRejectsTrailingTokens)
{
  auto u = parse_decl("val x = 1 )");
  EXPECT_EQ(u.root, nullptr);
  ASSERT_EQ(u.diags.size(), 1u);
  EXPECT_EQ(u.diags.all()[0].message, "expected end of input, found `)`");
}
