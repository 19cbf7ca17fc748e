#include <algorithm>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "monetize/errors.h"
#include "monetize/symbols.h"

namespace monetize {

SymbolTable::SymbolTable(std::vector<SymbolEntry> entries)
    : table_order(std::move(entries)) {
  for (const auto& entry : table_order) {
    if (entry.symbol.empty()) {
      throw ConfigError("empty currency symbol for " + entry.code);
    }
  }
  longest_first = table_order;
  std::stable_sort(longest_first.begin(), longest_first.end(), [](const SymbolEntry& lhs, const SymbolEntry& rhs) {
    return lhs.symbol.size() > rhs.symbol.size();
  });
}

const SymbolTable& SymbolTable::defaults() {
  static const SymbolTable table({
      {"$", "USD"},
      {"\xE2\x82\xAC", "EUR"},  // €
      {"\xC2\xA3", "GBP"},      // £
      {"\xE2\x82\xA4", "GBP"},  // ₤
      {"R$", "BRL"},
      {"R", "ZAR"},
      {"\xC2\xA5", "JPY"},      // ¥
      {"C$", "CAD"},
  });
  return table;
}

std::optional<std::string> SymbolTable::match_prefix(std::string_view text) const {
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    text.remove_prefix(1);
  }
  for (const auto& entry : longest_first) {
    if (text.compare(0, entry.symbol.size(), entry.symbol) == 0) {
      return entry.code;
    }
  }
  return std::nullopt;
}

CurrencySymbolResolver::CurrencySymbolResolver() : table(SymbolTable::defaults()) {}

CurrencySymbolResolver::CurrencySymbolResolver(SymbolTable table) : table(std::move(table)) {}

std::optional<std::string> CurrencySymbolResolver::resolve_symbol(std::string_view text) const {
  return table.match_prefix(text);
}

std::optional<std::string> CurrencySymbolResolver::resolve(std::string_view text) const {
  if (auto code = resolve_symbol(text)) {
    return code;
  }
  return scan_iso_code(text);
}

std::optional<std::string> scan_iso_code(std::string_view text) {
  static const std::regex pattern("[A-Z]{2,3}", std::regex::ECMAScript);
  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_search(text.begin(), text.end(), match, pattern)) {
    return match.str(0);
  }
  return std::nullopt;
}

}  // namespace monetize
