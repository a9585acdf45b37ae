#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace host_bridge {

constexpr int kDefaultSearchLimit = 100;
constexpr int kMaxSearchLimit = 1000;

struct SearchResultRecord {
  std::string name;
  std::string address;
};

struct SearchRequest {
  std::string query;
  int limit = kDefaultSearchLimit;
  int offset = 0;
  std::string rank;
};

struct PaginatedSearchResponse {
  std::string query;
  int total_results = 0;
  int page = 1;
  int limit = kDefaultSearchLimit;
  int offset = 0;
  bool has_more = false;
  int parse_failures = 0;
  std::vector<SearchResultRecord> items;
};

// Returns every line the downstream search primitive produced for query.
using SearchFetcher =
    std::function<std::optional<std::vector<std::string>>(const std::string& query, BridgeError* err)>;

// "<name> @ 0x<hex>" (also "at", and a bare hex address). The address comes
// back lowercase with a 0x prefix.
std::optional<SearchResultRecord> ParseSearchLine(const std::string& line);

std::optional<SearchRequest> ParseSearchRequest(const nlohmann::json& body, BridgeError* err);
bool ValidateSearchRequest(const SearchRequest& req, BridgeError* err);

// Stable: equal scores keep downstream order.
std::vector<SearchResultRecord> RankSimple(std::vector<SearchResultRecord> items, const std::string& query);

// Fetches the full set for req.query, then pages locally. Pagination is
// never pushed to the fetcher.
std::optional<PaginatedSearchResponse> SearchFunctions(const SearchRequest& req,
                                                       const SearchFetcher& fetch,
                                                       BridgeError* err);

void to_json(nlohmann::json& j, const SearchResultRecord& r);
void to_json(nlohmann::json& j, const PaginatedSearchResponse& r);

}  // namespace host_bridge
