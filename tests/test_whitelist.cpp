#include <gtest/gtest.h>

#include "whitelist.hpp"

#include <algorithm>

using namespace host_bridge;

TEST(CommandWhitelistTest, DefaultListCoversReadOperations) {
  auto wl = DefaultWhitelist();
  for (const char* name : {"read_dword", "decompile_by_addr", "disassemble_function", "get_function_by_address",
                           "list_functions", "list_strings", "get_xrefs_to", "searchFunctions"}) {
    const auto* e = wl.Find(name);
    ASSERT_NE(e, nullptr) << name;
    EXPECT_FALSE(e->write) << name;
    EXPECT_FALSE(e->post) << name;
    EXPECT_TRUE(e->requires_program) << name;
  }
}

TEST(CommandWhitelistTest, ProjectInfoNeedsNoProgram) {
  auto wl = DefaultWhitelist();
  const auto* e = wl.Find("project_info");
  ASSERT_NE(e, nullptr);
  EXPECT_FALSE(e->requires_program);
}

TEST(CommandWhitelistTest, WriteOperationsArePosts) {
  auto wl = DefaultWhitelist();
  for (const char* name : {"rename_function_by_address", "set_decompiler_comment", "set_disassembly_comment"}) {
    const auto* e = wl.Find(name);
    ASSERT_NE(e, nullptr) << name;
    EXPECT_TRUE(e->write) << name;
    EXPECT_TRUE(e->post) << name;
  }
}

TEST(CommandWhitelistTest, ArbitraryScriptingIsNotAllowed) {
  auto wl = DefaultWhitelist();
  EXPECT_FALSE(wl.IsAllowed("runScript"));
  EXPECT_FALSE(wl.IsAllowed("eval"));
  EXPECT_FALSE(wl.IsAllowed(""));
  EXPECT_FALSE(wl.IsAllowed("READ_DWORD"));
}

TEST(CommandWhitelistTest, NamesAreSortedAndUnique) {
  CommandWhitelist wl({{"b"}, {"a"}, {"b", true, false, true}, {""}});
  auto names = wl.Names();
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "a");
  EXPECT_EQ(names[1], "b");
  EXPECT_TRUE(wl.Find("b")->write);

  const auto defaults = DefaultWhitelist().Names();
  EXPECT_EQ(defaults.size(), 20u);
  EXPECT_TRUE(std::is_sorted(defaults.begin(), defaults.end()));
}
