#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace monetize {

struct CurrencyContext {
  std::string code;
  char decimal_mark = '.';
  long subunit_to_unit = 100;
  int decimal_places = 2;
};

class CurrencyRegistry {
 public:
  virtual ~CurrencyRegistry() = default;

  // Identifiers are ISO codes, matched case-insensitively. Throws
  // UnknownCurrency on a miss.
  virtual const CurrencyContext& lookup(std::string_view identifier) const = 0;
  virtual bool contains(std::string_view identifier) const = 0;
  virtual std::string default_identifier() const = 0;
};

class CurrencyTable : public CurrencyRegistry {
 public:
  // Empty table with USD as the default identifier.
  CurrencyTable();
  explicit CurrencyTable(std::vector<CurrencyContext> currencies, std::string default_code = "USD");

  static CurrencyTable builtin();

  const CurrencyContext& lookup(std::string_view identifier) const override;
  bool contains(std::string_view identifier) const override;
  std::string default_identifier() const override;

  // Replaces an existing entry with the same code.
  void add(CurrencyContext currency);
  void set_default(std::string code);

  std::vector<CurrencyContext> currencies() const;

 private:
  std::map<std::string, CurrencyContext> by_code;
  std::string default_code;
};

// One "CODE decimal_mark subunit_to_unit decimal_places" line per currency,
// an optional "default CODE" line, '#' comments. Throws ConfigError.
CurrencyTable load_currency_table(const std::string& path);
CurrencyTable parse_currency_table(const std::string& text, const std::string& origin = "<memory>");

std::string normalize_currency_code(std::string_view identifier);

}  // namespace monetize
