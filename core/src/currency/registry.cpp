#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "monetize/currency.h"
#include "monetize/errors.h"

namespace monetize {

std::string normalize_currency_code(std::string_view identifier) {
  std::string out;
  out.reserve(identifier.size());
  for (const char ch : identifier) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      continue;
    }
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
  }
  return out;
}

CurrencyTable::CurrencyTable() : default_code("USD") {}

CurrencyTable::CurrencyTable(std::vector<CurrencyContext> currencies, std::string default_code)
    : default_code(normalize_currency_code(default_code)) {
  for (auto& currency : currencies) {
    add(std::move(currency));
  }
}

CurrencyTable CurrencyTable::builtin() {
  // code, decimal mark, subunit_to_unit, decimal places
  return CurrencyTable({
      {"USD", '.', 100, 2},
      {"EUR", ',', 100, 2},
      {"GBP", '.', 100, 2},
      {"BRL", ',', 100, 2},
      {"ZAR", '.', 100, 2},
      {"JPY", '.', 1, 0},
      {"CAD", '.', 100, 2},
      {"CHF", '.', 100, 2},
      {"BHD", '.', 1000, 3},
      {"KWD", '.', 1000, 3},
      {"OMR", '.', 1000, 3},
      {"CLP", ',', 1, 0},
      {"KRW", '.', 1, 0},
      {"MGA", '.', 5, 1},
      {"INR", '.', 100, 2},
      {"MXN", '.', 100, 2},
      {"ARS", ',', 100, 2},
      {"AUD", '.', 100, 2},
      {"NZD", '.', 100, 2},
      {"SEK", ',', 100, 2},
      {"NOK", ',', 100, 2},
      {"DKK", ',', 100, 2},
      {"PLN", ',', 100, 2},
      {"CNY", '.', 100, 2},
      {"HKD", '.', 100, 2},
      {"SGD", '.', 100, 2},
  });
}

const CurrencyContext& CurrencyTable::lookup(std::string_view identifier) const {
  const auto code = normalize_currency_code(identifier);
  const auto it = by_code.find(code);
  if (it == by_code.end()) {
    throw UnknownCurrency(code.empty() ? std::string(identifier) : code);
  }
  return it->second;
}

bool CurrencyTable::contains(std::string_view identifier) const {
  return by_code.find(normalize_currency_code(identifier)) != by_code.end();
}

std::string CurrencyTable::default_identifier() const {
  return default_code;
}

void CurrencyTable::add(CurrencyContext currency) {
  currency.code = normalize_currency_code(currency.code);
  if (currency.code.empty()) {
    throw ConfigError("currency without a code");
  }
  if (currency.subunit_to_unit < 1) {
    throw ConfigError("currency " + currency.code + ": subunit_to_unit must be at least 1");
  }
  if (currency.decimal_places < 0) {
    throw ConfigError("currency " + currency.code + ": decimal_places must not be negative");
  }
  auto code = currency.code;
  by_code[code] = std::move(currency);
}

void CurrencyTable::set_default(std::string code) {
  default_code = normalize_currency_code(code);
}

std::vector<CurrencyContext> CurrencyTable::currencies() const {
  std::vector<CurrencyContext> out;
  out.reserve(by_code.size());
  for (const auto& entry : by_code) {
    out.push_back(entry.second);
  }
  return out;
}

}  // namespace monetize
