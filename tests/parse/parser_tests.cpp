#include <cassert>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "parse_support.h"

namespace parse_test {
namespace {

using monetize::ParseOptions;

// A parser only borrows its registry, so temporaries are refused.
static_assert(std::is_constructible<monetize::Parser, const monetize::CurrencyTable&>::value,
              "parser accepts a registry lvalue");
static_assert(!std::is_constructible<monetize::Parser, monetize::CurrencyTable>::value,
              "parser rejects a temporary registry");
static_assert(!std::is_constructible<monetize::Parser, monetize::CurrencyTable, monetize::SymbolTable>::value,
              "parser rejects a temporary registry with symbols");

ParseOptions from_symbol() {
  ParseOptions options;
  options.assume_from_symbol = true;
  return options;
}

ParseOptions exact() {
  ParseOptions options;
  options.infinite_precision = true;
  return options;
}

// Major and minor digits joined by the currency's decimal mark, no grouping.
std::string canonical_text(const std::string& subunits, const monetize::CurrencyContext& currency) {
  std::string digits = subunits;
  const bool negative = !digits.empty() && digits.front() == '-';
  if (negative) {
    digits.erase(digits.begin());
  }
  const auto places = static_cast<std::size_t>(currency.decimal_places);
  if (places == 0) {
    return (negative ? "-" : "") + digits;
  }
  if (digits.size() <= places) {
    digits.insert(0, places + 1 - digits.size(), '0');
  }
  digits.insert(digits.size() - places, 1, currency.decimal_mark);
  return (negative ? "-" : "") + digits;
}

void test_plain_amounts() {
  expect_parse("1234", "123400", "USD");
  expect_parse("1,234.56", "123456", "USD");
  expect_parse("$1,234.56", "123456", "USD");
  expect_parse("  $5  ", "500", "USD", std::nullopt, from_symbol());
  expect_parse("0.05", "5", "USD");
  expect_parse("", "0", "USD");
}

void test_currency_decimal_mark_drives_disambiguation() {
  expect_parse("1.234,56", "123456", "EUR", std::string("EUR"));
  expect_parse("1.234", "123", "EUR", std::string("EUR"));
  expect_parse("1,234", "123400", "USD");
  expect_parse("1,5", "150", "EUR", std::string("EUR"));
  expect_parse("1,5", "150", "USD");
  expect_parse("1.234.567", "123456700", "EUR", std::string("EUR"));
}

void test_signs() {
  expect_parse("-12", "-1200", "USD");
  expect_parse("12-", "-1200", "USD");
  expect_parse("-$1,234.56", "-123456", "USD", std::nullopt, from_symbol());
  assert(throws_as<monetize::InvalidAmount>([] { expect_parse("12-34", "0", "USD"); }));
}

void test_multiplier_suffixes() {
  expect_parse("1.5M", "150000000", "USD");
  expect_parse("10k", "1000000", "USD");
  expect_parse("$2.5B", "250000000000", "USD", std::nullopt, from_symbol());
  expect_parse("1T", "100000000000000", "USD");

  const monetize::Parser parser(builtin_registry());
  assert(parser.explain("1.5M").amount.multiplier_exponent == 6);
  assert(parser.explain("1.5M").amount.minor_digits == "5");
}

void test_symbols_with_assume_from_symbol() {
  expect_parse("R$ 1.234,56", "123456", "BRL", std::nullopt, from_symbol());
  expect_parse("R10", "1000", "ZAR", std::nullopt, from_symbol());
  expect_parse("C$10", "1000", "CAD", std::nullopt, from_symbol());
  expect_parse("-\xC2\xA3" "12", "-1200", "GBP", std::nullopt, from_symbol());
  expect_parse("\xE2\x82\xAC" "1.234,56", "123456", "EUR", std::nullopt, from_symbol());
  expect_parse("\xC2\xA5" "1,000", "1000", "JPY", std::nullopt, from_symbol());
  // No symbol: the ISO scan still applies, then the default.
  expect_parse("10 CHF", "1000", "CHF", std::nullopt, from_symbol());
  expect_parse("10", "1000", "GBP", std::string("GBP"), from_symbol());
}

void test_symbols_ignored_without_assume_from_symbol() {
  // "R" alone is not an ISO code, so the default currency and its dot
  // decimal mark apply.
  expect_parse("R$ 1.234,56", "123456", "USD");
  expect_parse("C$10", "1000", "USD");
  expect_parse("\xC2\xA3" "5", "500", "EUR", std::string("EUR"));
}

void test_iso_code_in_text() {
  expect_parse("10 EUR", "1000", "EUR");
  expect_parse("EUR 1.234,56", "123456", "EUR");
  expect_parse("1.234,56 BRL", "123456", "BRL", std::string("USD"));
  expect_parse("12.6 JPY", "13", "JPY");
  expect_parse("1.2345 BHD", "1235", "BHD");
  assert(throws_as<monetize::UnknownCurrency>([] { expect_parse("10 ZZZ", "0", "ZZZ"); }));
}

void test_default_currency_fallbacks() {
  expect_parse("12.6", "13", "JPY", std::string("JPY"));
  expect_parse("12.6", "13", "JPY", std::string("jpy"));
  expect_parse("12.6", "1260", "USD", std::string(""));

  monetize::CurrencyTable table = monetize::CurrencyTable::builtin();
  table.set_default("EUR");
  const monetize::Parser parser(table);
  expect_result(parser.parse("1.234,56"), "123456", "EUR");
}

void test_infinite_precision() {
  expect_parse("1.2345", "123.45", "USD", std::nullopt, exact());
  expect_parse("-0.001", "-0.1", "USD", std::nullopt, exact());
  expect_parse("1.2345", "123", "USD");

  const monetize::Parser parser(builtin_registry());
  const auto result = parser.parse("1.2345", std::nullopt, exact());
  assert(!result.subunits.is_integer());
  assert(result.subunits == monetize::BigRational(monetize::BigInt(12345L), monetize::BigInt(100L)));
}

void test_invalid_shapes() {
  assert(throws_as<monetize::InvalidAmount>([] { expect_parse("1,234.5'6", "0", "USD"); }));
  assert(throws_as<monetize::InvalidAmount>([] { expect_parse("--5", "0", "USD"); }));
}

void test_reparsing_canonical_text_is_stable() {
  const monetize::Parser parser(builtin_registry());
  const std::vector<std::pair<std::string, std::string>> inputs = {
      {"1,234.56", "USD"}, {"1.234,56", "EUR"}, {"-0.05", "USD"}, {"1.5M", "USD"},
      {"12,6", "EUR"},     {"1.2345", "BHD"},   {"12.6", "JPY"},  {"7", "USD"},
  };
  for (const auto& input : inputs) {
    const auto first = parser.parse(input.first, input.second);
    const auto& currency = builtin_registry().lookup(first.currency);
    const auto again = parser.parse(canonical_text(first.subunits.to_string(), currency), input.second);
    assert(again.subunits == first.subunits);
    assert(again.currency == first.currency);
  }
}

void test_longest_symbol_wins_in_custom_table() {
  const monetize::SymbolTable symbols(std::vector<monetize::SymbolEntry>{{"R", "ZAR"}, {"R$", "BRL"}});
  const monetize::Parser parser(builtin_registry(), symbols);
  expect_result(parser.parse("R$5", std::nullopt, from_symbol()), "500", "BRL");
  expect_result(parser.parse("R5", std::nullopt, from_symbol()), "500", "ZAR");
}

void test_explain_reports_context() {
  const monetize::Parser parser(builtin_registry());
  const auto trace = parser.explain("  \xE2\x82\xAC" "1.234,56 ", std::nullopt, from_symbol());
  assert(trace.input == "\xE2\x82\xAC" "1.234,56");
  assert(trace.currency.code == "EUR");
  assert(trace.currency.decimal_mark == ',');
  assert(trace.amount.major_digits == "1234");
  assert(trace.amount.minor_digits == "56");
  assert(!trace.amount.negative);
  expect_result(trace.result, "123456", "EUR");
}

void test_long_inputs() {
  expect_parse("1K" + std::string(100000, '!'), "100000", "USD");
  const std::string digits(100000, '7');
  expect_parse(digits, digits + "00", "USD");
}

}  // namespace

void run_parser_tests() {
  test_plain_amounts();
  test_currency_decimal_mark_drives_disambiguation();
  test_signs();
  test_multiplier_suffixes();
  test_symbols_with_assume_from_symbol();
  test_symbols_ignored_without_assume_from_symbol();
  test_iso_code_in_text();
  test_default_currency_fallbacks();
  test_infinite_precision();
  test_invalid_shapes();
  test_reparsing_canonical_text_is_stable();
  test_longest_symbol_wins_in_custom_table();
  test_explain_reports_context();
  test_long_inputs();
}

}  // namespace parse_test
