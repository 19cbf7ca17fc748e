#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace monetize {

struct SymbolEntry {
  std::string symbol;
  std::string code;
};

// Maps literal currency symbols to ISO codes. Matching always prefers the
// longest symbol, so "R$" wins over "R" no matter how the entries are
// ordered.
class SymbolTable {
 public:
  explicit SymbolTable(std::vector<SymbolEntry> entries);

  static const SymbolTable& defaults();

  // Symbol at the very start of the text, after at most one '+' or '-'.
  std::optional<std::string> match_prefix(std::string_view text) const;

  // Entries in the order they were given.
  const std::vector<SymbolEntry>& entries() const { return table_order; }

 private:
  std::vector<SymbolEntry> table_order;
  std::vector<SymbolEntry> longest_first;
};

class CurrencySymbolResolver {
 public:
  CurrencySymbolResolver();
  explicit CurrencySymbolResolver(SymbolTable table);

  std::optional<std::string> resolve_symbol(std::string_view text) const;
  // Symbol first, then the ISO code scan.
  std::optional<std::string> resolve(std::string_view text) const;

  const SymbolTable& symbols() const { return table; }

 private:
  SymbolTable table;
};

// First run of two or three uppercase ASCII letters, returned verbatim.
std::optional<std::string> scan_iso_code(std::string_view text);

}  // namespace monetize
