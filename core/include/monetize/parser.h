#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "monetize/amount_text.h"
#include "monetize/big_number.h"
#include "monetize/currency.h"
#include "monetize/symbols.h"

namespace monetize {

struct ParseOptions {
  // Look for a leading currency symbol ("R$", "€", ...) before scanning for
  // an ISO code.
  bool assume_from_symbol = false;
  // Keep fractional subunits exactly instead of rounding to the currency's
  // decimal places.
  bool infinite_precision = false;
};

// Reads MONETIZE_ASSUME_FROM_SYMBOL and MONETIZE_INFINITE_PRECISION on top of
// the given fallback. Unset variables keep the fallback value.
ParseOptions options_from_env(ParseOptions fallback = {});

bool parse_env_flag_value(const char* raw, bool fallback);
bool env_flag_enabled(const char* name, bool fallback);

struct ParseResult {
  BigRational subunits;
  std::string currency;
};

struct ParseTrace {
  ParseResult result;
  std::string input;
  CurrencyContext currency;
  ParsedAmount amount;
};

class Parser {
 public:
  // The registry is held by reference and must outlive the parser.
  explicit Parser(const CurrencyRegistry& registry);
  Parser(const CurrencyRegistry& registry, SymbolTable symbols);
  Parser(CurrencyRegistry&&) = delete;
  Parser(CurrencyRegistry&&, SymbolTable) = delete;

  ParseResult parse(std::string_view text,
                    const std::optional<std::string>& default_currency = std::nullopt,
                    const ParseOptions& options = {}) const;

  // Same as parse, keeping the intermediate state.
  ParseTrace explain(std::string_view text,
                     const std::optional<std::string>& default_currency = std::nullopt,
                     const ParseOptions& options = {}) const;

  std::string resolve_currency(std::string_view trimmed,
                               const std::optional<std::string>& default_currency,
                               const ParseOptions& options) const;

 private:
  const CurrencyRegistry& registry;
  CurrencySymbolResolver resolver;

  static std::string trim(std::string_view value);
};

}  // namespace monetize
