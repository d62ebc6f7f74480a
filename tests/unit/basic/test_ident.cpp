#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "minml/basic/ident.hpp"

using minml::Ident;
using minml::IdentTable;

TEST(BasicIdent, InterningCanonicalizes)
{
  const std::string a = "counter";
  const std::string b = std::string("coun") + "ter";

  const Ident x = Ident::intern(a);
  const Ident y = Ident::intern(b);

  EXPECT_EQ(x, y);
  EXPECT_EQ(x.data(), y.data());
  EXPECT_EQ(x.str(), "counter");
  EXPECT_EQ(x.size(), 7u);
  EXPECT_NE(x, Ident::intern("count"));
}

TEST(BasicIdent, ComparesAgainstText)
{
  const Ident x = Ident::intern("foo");
  EXPECT_TRUE(x == "foo");
  EXPECT_TRUE(x != "bar");
}

TEST(BasicIdent, HashesByIdentity)
{
  std::unordered_set<Ident> set;
  set.insert(Ident::intern("a"));
  set.insert(Ident::intern("a"));
  set.insert(Ident::intern("b"));
  EXPECT_EQ(set.size(), 2u);
}

TEST(BasicIdent, StreamsItsText)
{
  std::ostringstream os;
  os << Ident::intern("hello");
  EXPECT_EQ(os.str(), "hello");
}

TEST(BasicIdentTable, IsolatedTableIsAppendOnly)
{
  IdentTable table;
  EXPECT_EQ(table.size(), 0u);
  EXPECT_FALSE(table.contains("x"));

  const Ident x1 = Ident::intern(table, "x");
  const Ident x2 = Ident::intern(table, "x");
  (void)Ident::intern(table, "y");

  EXPECT_EQ(x1, x2);
  EXPECT_TRUE(table.contains("x"));
  EXPECT_EQ(table.size(), 2u);
}

TEST(BasicIdentTable, InternedTextOutlivesTheCaller)
{
  IdentTable table;
  std::string_view view;
  {
    std::string temp = "temporary_name";
    view = table.intern(temp);
    temp.assign("overwritten!!!");
  }
  EXPECT_EQ(view, "temporary_name");
}

TEST(BasicIdentTable, ConcurrentInterningYieldsOneEntryPerText)
{
  IdentTable table;
  constexpr int k_threads = 8;
  constexpr int k_names = 200;

  std::vector<std::vector<Ident>> seen(k_threads);
  std::vector<std::thread> workers;
  workers.reserve(k_threads);
  for (int t = 0; t < k_threads; ++t) {
    workers.emplace_back([&table, &seen, t] {
      for (int i = 0; i < k_names; ++i) {
        seen[t].push_back(Ident::intern(table, "name_" + std::to_string(i)));
      }
    });
  }
  for (auto & w : workers) {
    w.join();
  }

  EXPECT_EQ(table.size(), static_cast<size_t>(k_names));
  for (int t = 1; t < k_threads; ++t) {
    ASSERT_EQ(seen[t].size(), seen[0].size());
    for (int i = 0; i < k_names; ++i) {
      EXPECT_EQ(seen[t][i].data(), seen[0][i].data());
    }
  }
}
