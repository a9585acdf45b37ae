#include "search.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <iostream>
#include <tuple>
#include <utility>

namespace host_bridge {
namespace {

static std::string Trim(std::string s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

constexpr const char* kSpace = " \t\n\v\f\r";

// True if s[from..] is non-empty and all hex digits.
static bool IsHexDigits(const std::string& s, size_t from) {
  if (s.size() <= from) return false;
  for (size_t i = from; i < s.size(); i++) {
    if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static bool ReadIntField(const nlohmann::json& body, const char* field, int* out, BridgeError* err) {
  if (!body.contains(field) || body[field].is_null()) return true;
  const auto& v = body[field];
  if (!v.is_number_integer()) {
    if (err) *err = MakeValidationError(field, std::string(field) + " must be an integer");
    return false;
  }
  if (v.is_number_unsigned()) {
    const auto n = v.get<uint64_t>();
    if (n > static_cast<uint64_t>(INT_MAX)) {
      if (err) *err = MakeValidationError(field, std::string(field) + " is out of range");
      return false;
    }
    *out = static_cast<int>(n);
    return true;
  }
  const auto n = v.get<int64_t>();
  if (n > INT_MAX || n < INT_MIN) {
    if (err) *err = MakeValidationError(field, std::string(field) + " is out of range");
    return false;
  }
  *out = static_cast<int>(n);
  return true;
}

}  // namespace

std::optional<SearchResultRecord> ParseSearchLine(const std::string& line) {
  // <name> <ws> (@|at) <ws> [0x]<hex>, split from the right in one pass.
  const auto trimmed = Trim(line);
  const auto addr_pos = trimmed.find_last_of(kSpace);
  if (addr_pos == std::string::npos) return std::nullopt;
  auto addr = ToLower(trimmed.substr(addr_pos + 1));

  const auto head = Trim(trimmed.substr(0, addr_pos));
  const auto sep_pos = head.find_last_of(kSpace);
  if (sep_pos == std::string::npos) return std::nullopt;
  const auto sep = head.substr(sep_pos + 1);
  if (sep != "@" && sep != "at") return std::nullopt;

  SearchResultRecord r;
  r.name = Trim(head.substr(0, sep_pos));
  if (r.name.empty()) return std::nullopt;
  if (addr.rfind("0x", 0) != 0) addr = "0x" + addr;
  if (!IsHexDigits(addr, 2)) return std::nullopt;
  r.address = std::move(addr);
  return r;
}

std::optional<SearchRequest> ParseSearchRequest(const nlohmann::json& body, BridgeError* err) {
  if (!body.is_object()) {
    if (err) *err = MakeValidationError("body", "request body must be a JSON object");
    return std::nullopt;
  }
  SearchRequest req;
  if (!body.contains("query") || !body["query"].is_string()) {
    if (err) *err = MakeValidationError("query", "query must be a non-empty string");
    return std::nullopt;
  }
  req.query = body["query"].get<std::string>();
  if (!ReadIntField(body, "limit", &req.limit, err)) return std::nullopt;
  if (!ReadIntField(body, "offset", &req.offset, err)) return std::nullopt;
  if (body.contains("rank") && !body["rank"].is_null()) {
    if (!body["rank"].is_string()) {
      if (err) *err = MakeValidationError("rank", "rank must be a string");
      return std::nullopt;
    }
    req.rank = body["rank"].get<std::string>();
  }
  if (!ValidateSearchRequest(req, err)) return std::nullopt;
  return req;
}

bool ValidateSearchRequest(const SearchRequest& req, BridgeError* err) {
  if (req.query.empty()) {
    if (err) *err = MakeValidationError("query", "query must be a non-empty string");
    return false;
  }
  if (req.limit < 1 || req.limit > kMaxSearchLimit) {
    if (err) *err = MakeValidationError("limit", "limit must be between 1 and " + std::to_string(kMaxSearchLimit));
    return false;
  }
  if (req.offset < 0) {
    if (err) *err = MakeValidationError("offset", "offset must be >= 0");
    return false;
  }
  if (!req.rank.empty() && req.rank != "simple") {
    if (err) *err = MakeValidationError("rank", "rank must be one of: simple");
    return false;
  }
  return true;
}

std::vector<SearchResultRecord> RankSimple(std::vector<SearchResultRecord> items, const std::string& query) {
  const auto q = ToLower(Trim(query));
  if (q.empty()) return items;

  std::vector<std::tuple<int, size_t, SearchResultRecord>> scored;
  scored.reserve(items.size());
  for (size_t i = 0; i < items.size(); i++) {
    const auto name = ToLower(items[i].name);
    const auto addr = ToLower(items[i].address);
    int score = 0;
    if (name == q) score += 400;
    if (name.rfind(q, 0) == 0) score += 200;
    if (name.find(q) != std::string::npos) score += 100;
    if (addr == q) {
      score += 350;
    } else if (addr.find(q) != std::string::npos) {
      score += 150;
    }
    scored.emplace_back(-score, i, std::move(items[i]));
  }
  std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
    if (std::get<0>(a) != std::get<0>(b)) return std::get<0>(a) < std::get<0>(b);
    return std::get<1>(a) < std::get<1>(b);
  });

  std::vector<SearchResultRecord> out;
  out.reserve(scored.size());
  for (auto& s : scored) out.push_back(std::move(std::get<2>(s)));
  return out;
}

std::optional<PaginatedSearchResponse> SearchFunctions(const SearchRequest& req,
                                                       const SearchFetcher& fetch,
                                                       BridgeError* err) {
  if (!ValidateSearchRequest(req, err)) return std::nullopt;
  if (!fetch) {
    if (err) {
      err->code = ErrorCode::kDownstreamFailure;
      err->message = "no search primitive";
      err->field.clear();
    }
    return std::nullopt;
  }

  auto lines = fetch(req.query, err);
  if (!lines) return std::nullopt;

  PaginatedSearchResponse out;
  out.query = req.query;
  out.limit = req.limit;
  out.offset = req.offset;

  std::vector<SearchResultRecord> parsed;
  parsed.reserve(lines->size());
  for (const auto& line : *lines) {
    if (Trim(line).empty()) continue;
    auto rec = ParseSearchLine(line);
    if (!rec) {
      out.parse_failures++;
      continue;
    }
    parsed.push_back(std::move(*rec));
  }
  if (out.parse_failures > 0) {
    std::cout << "[search] query=" << req.query << " parse_failures=" << out.parse_failures << "\n";
  }
  if (req.rank == "simple") parsed = RankSimple(std::move(parsed), req.query);

  const auto total = static_cast<int64_t>(parsed.size());
  const auto start = std::min<int64_t>(req.offset, total);
  const auto end = std::min<int64_t>(start + req.limit, total);
  out.total_results = static_cast<int>(total);
  out.page = req.offset / req.limit + 1;
  out.items.assign(std::make_move_iterator(parsed.begin() + start), std::make_move_iterator(parsed.begin() + end));
  out.has_more = end < total;
  return out;
}

void to_json(nlohmann::json& j, const SearchResultRecord& r) {
  j = nlohmann::json{{"name", r.name}, {"address", r.address}};
}

void to_json(nlohmann::json& j, const PaginatedSearchResponse& r) {
  j = nlohmann::json{{"query", r.query},
                     {"total_results", r.total_results},
                     {"page", r.page},
                     {"limit", r.limit},
                     {"offset", r.offset},
                     {"has_more", r.has_more},
                     {"parse_failures", r.parse_failures},
                     {"items", r.items}};
}

}  // namespace host_bridge
