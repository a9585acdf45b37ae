#include <gtest/gtest.h>

#include "search.hpp"

#include <string>
#include <vector>

using namespace host_bridge;

class SearchFunctionsTest : public ::testing::Test {
 protected:
  SearchFetcher Lines(std::vector<std::string> lines) {
    return [this, lines](const std::string& query, BridgeError*) -> std::optional<std::vector<std::string>> {
      fetch_calls++;
      last_query = query;
      return lines;
    };
  }

  SearchRequest Request(const std::string& query, int limit, int offset) {
    SearchRequest req;
    req.query = query;
    req.limit = limit;
    req.offset = offset;
    return req;
  }

  const std::vector<std::string> reset_lines{"ResetHandler @ 0x1000", "ResetVector @ 0x2000", "malformed-line"};
  int fetch_calls = 0;
  std::string last_query;
};

TEST_F(SearchFunctionsTest, FirstPageOfResetExample) {
  BridgeError err;
  auto page = SearchFunctions(Request("Reset", 5, 0), Lines(reset_lines), &err);
  ASSERT_TRUE(page.has_value()) << err.message;
  EXPECT_EQ(page->total_results, 2);
  EXPECT_EQ(page->page, 1);
  EXPECT_EQ(page->parse_failures, 1);
  EXPECT_FALSE(page->has_more);
  ASSERT_EQ(page->items.size(), 2u);
  EXPECT_EQ(page->items[0].name, "ResetHandler");
  EXPECT_EQ(page->items[0].address, "0x1000");
  EXPECT_EQ(page->items[1].name, "ResetVector");
  EXPECT_EQ(page->items[1].address, "0x2000");
  EXPECT_EQ(last_query, "Reset");
}

TEST_F(SearchFunctionsTest, SecondPageKeepsTotal) {
  BridgeError err;
  auto page = SearchFunctions(Request("Reset", 1, 1), Lines(reset_lines), &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->total_results, 2);
  EXPECT_EQ(page->page, 2);
  ASSERT_EQ(page->items.size(), 1u);
  EXPECT_EQ(page->items[0].name, "ResetVector");
  EXPECT_FALSE(page->has_more);
}

TEST_F(SearchFunctionsTest, TotalIsIndependentOfWindow) {
  std::vector<std::string> lines;
  for (int i = 0; i < 37; i++) lines.push_back("fn_" + std::to_string(i) + " @ 0x" + std::to_string(1000 + i));
  for (int limit : {1, 5, 10, 100}) {
    for (int offset : {0, 3, 36, 37, 500}) {
      BridgeError err;
      auto page = SearchFunctions(Request("fn", limit, offset), Lines(lines), &err);
      ASSERT_TRUE(page.has_value());
      EXPECT_EQ(page->total_results, 37) << "limit=" << limit << " offset=" << offset;
    }
  }
  EXPECT_EQ(fetch_calls, 20);
}

TEST_F(SearchFunctionsTest, OffsetPastEndGivesEmptyPage) {
  BridgeError err;
  auto page = SearchFunctions(Request("Reset", 10, 50), Lines(reset_lines), &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_TRUE(page->items.empty());
  EXPECT_EQ(page->total_results, 2);
  EXPECT_EQ(page->page, 6);
  EXPECT_FALSE(page->has_more);
}

TEST_F(SearchFunctionsTest, HasMoreWhenWindowEndsEarly) {
  BridgeError err;
  auto page = SearchFunctions(Request("Reset", 1, 0), Lines(reset_lines), &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_TRUE(page->has_more);
}

TEST_F(SearchFunctionsTest, BlankLinesAreNotParseFailures) {
  BridgeError err;
  auto page = SearchFunctions(Request("main", 10, 0), Lines({"", "main @ 0x401000", "   "}), &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->total_results, 1);
  EXPECT_EQ(page->parse_failures, 0);
}

TEST_F(SearchFunctionsTest, InvalidRequestNeverReachesFetcher) {
  BridgeError err;
  EXPECT_FALSE(SearchFunctions(Request("", 10, 0), Lines(reset_lines), &err));
  EXPECT_EQ(err.field, "query");
  EXPECT_FALSE(SearchFunctions(Request("Reset", 0, 0), Lines(reset_lines), &err));
  EXPECT_EQ(err.field, "limit");
  EXPECT_FALSE(SearchFunctions(Request("Reset", kMaxSearchLimit + 1, 0), Lines(reset_lines), &err));
  EXPECT_EQ(err.field, "limit");
  EXPECT_FALSE(SearchFunctions(Request("Reset", 10, -1), Lines(reset_lines), &err));
  EXPECT_EQ(err.field, "offset");
  EXPECT_EQ(err.code, ErrorCode::kValidation);
  EXPECT_EQ(fetch_calls, 0);
}

TEST_F(SearchFunctionsTest, FetcherFailurePropagates) {
  SearchFetcher failing = [](const std::string&, BridgeError* err) -> std::optional<std::vector<std::string>> {
    err->code = ErrorCode::kNoActiveContext;
    err->message = "no program-capable context is active";
    return std::nullopt;
  };
  BridgeError err;
  EXPECT_FALSE(SearchFunctions(Request("Reset", 10, 0), failing, &err));
  EXPECT_EQ(err.code, ErrorCode::kNoActiveContext);
}

TEST_F(SearchFunctionsTest, SimpleRankPutsExactMatchFirst) {
  SearchRequest req = Request("reset", 10, 0);
  req.rank = "simple";
  BridgeError err;
  auto page = SearchFunctions(req, Lines({"do_reset @ 0x10", "ResetAll @ 0x20", "reset @ 0x30", "other @ 0x40"}), &err);
  ASSERT_TRUE(page.has_value());
  ASSERT_EQ(page->items.size(), 4u);
  EXPECT_EQ(page->items[0].name, "reset");
  EXPECT_EQ(page->items[1].name, "ResetAll");
  EXPECT_EQ(page->items[2].name, "do_reset");
  EXPECT_EQ(page->items[3].name, "other");
}

TEST(ParseSearchLineTest, AcceptsKnownForms) {
  auto a = ParseSearchLine("ResetHandler @ 0x1000");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->name, "ResetHandler");
  EXPECT_EQ(a->address, "0x1000");

  auto b = ParseSearchLine("  FUN_00401A2B at 00401A2B ");
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->name, "FUN_00401A2B");
  EXPECT_EQ(b->address, "0x00401a2b");

  auto c = ParseSearchLine("operator new @ 0XDEAD");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->name, "operator new");
  EXPECT_EQ(c->address, "0xdead");
}

TEST(ParseSearchLineTest, RejectsMalformedLines) {
  EXPECT_FALSE(ParseSearchLine("malformed-line"));
  EXPECT_FALSE(ParseSearchLine("@ 0x1000"));
  EXPECT_FALSE(ParseSearchLine("name @ zz"));
  EXPECT_FALSE(ParseSearchLine(""));
}

TEST(ParseSearchLineTest, VeryLongLinesParseWithoutRecursion) {
  const std::string name(200000, 'A');
  auto ok = ParseSearchLine(name + " @ 0x1000");
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->name.size(), name.size());
  EXPECT_EQ(ok->address, "0x1000");

  EXPECT_FALSE(ParseSearchLine(name));
  EXPECT_FALSE(ParseSearchLine(std::string(200000, ' ') + "x @ zz"));
}

TEST(ParseSearchLineTest, SplitsOnLastSeparator) {
  auto r = ParseSearchLine("a @ b @ 0x10");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->name, "a @ b");
  EXPECT_EQ(r->address, "0x10");
  EXPECT_FALSE(ParseSearchLine("flat 0x10"));
  EXPECT_FALSE(ParseSearchLine("name @ 0x"));
}

TEST_F(SearchFunctionsTest, LongMalformedLineIsCountedNotFatal) {
  BridgeError err;
  auto page = SearchFunctions(Request("Reset", 10, 0),
                              Lines({std::string(200000, 'B'), "ResetHandler @ 0x1000"}), &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->total_results, 1);
  EXPECT_EQ(page->parse_failures, 1);
}

TEST(ParseSearchRequestTest, AppliesDefaults) {
  BridgeError err;
  auto req = ParseSearchRequest({{"query", "Reset"}}, &err);
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->limit, kDefaultSearchLimit);
  EXPECT_EQ(req->offset, 0);
  EXPECT_TRUE(req->rank.empty());
}

TEST(ParseSearchRequestTest, ReportsOffendingField) {
  BridgeError err;
  EXPECT_FALSE(ParseSearchRequest(nlohmann::json::array(), &err));
  EXPECT_EQ(err.field, "body");
  EXPECT_FALSE(ParseSearchRequest({{"limit", 5}}, &err));
  EXPECT_EQ(err.field, "query");
  EXPECT_FALSE(ParseSearchRequest({{"query", "x"}, {"limit", "5"}}, &err));
  EXPECT_EQ(err.field, "limit");
  EXPECT_FALSE(ParseSearchRequest({{"query", "x"}, {"offset", 1.5}}, &err));
  EXPECT_EQ(err.field, "offset");
  EXPECT_FALSE(ParseSearchRequest({{"query", "x"}, {"limit", 5000000000LL}}, &err));
  EXPECT_EQ(err.field, "limit");
  EXPECT_FALSE(ParseSearchRequest({{"query", "x"}, {"rank", "fuzzy"}}, &err));
  EXPECT_EQ(err.field, "rank");
}

TEST(SearchJsonTest, ResponseShape) {
  PaginatedSearchResponse r;
  r.query = "Reset";
  r.total_results = 2;
  r.limit = 1;
  r.offset = 1;
  r.page = 2;
  r.items.push_back({"ResetVector", "0x2000"});
  nlohmann::json j = r;
  EXPECT_EQ(j["query"], "Reset");
  EXPECT_EQ(j["total_results"], 2);
  EXPECT_EQ(j["page"], 2);
  EXPECT_EQ(j["items"][0]["name"], "ResetVector");
  EXPECT_EQ(j["items"][0]["address"], "0x2000");
  EXPECT_TRUE(j.contains("has_more"));
}
