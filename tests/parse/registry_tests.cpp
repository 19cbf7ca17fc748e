#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "parse_support.h"

namespace parse_test {
namespace {

using monetize::ConfigError;
using monetize::CurrencyTable;

void test_builtin_lookup() {
  const auto& registry = builtin_registry();
  assert(registry.default_identifier() == "USD");
  assert(registry.lookup("usd").code == "USD");
  assert(registry.lookup("USD").decimal_mark == '.');
  assert(registry.lookup("EUR").decimal_mark == ',');
  assert(registry.lookup("jpy").subunit_to_unit == 1);
  assert(registry.lookup("jpy").decimal_places == 0);
  assert(registry.lookup("BHD").subunit_to_unit == 1000);
  assert(registry.contains(" brl "));
  assert(!registry.contains("XXX"));
}

void test_unknown_currency_carries_identifier() {
  bool caught = false;
  try {
    (void)builtin_registry().lookup("nope");
  } catch (const monetize::UnknownCurrency& e) {
    caught = true;
    assert(e.identifier == "NOPE");
  }
  assert(caught);
}

void test_add_replaces_entry() {
  CurrencyTable table = CurrencyTable::builtin();
  table.add({"usd", ',', 100, 2});
  assert(table.lookup("USD").decimal_mark == ',');
  assert(throws_as<ConfigError>([&] { table.add({"XTS", '.', 0, 2}); }));
  assert(throws_as<ConfigError>([&] { table.add({"XTS", '.', 100, -1}); }));
  assert(throws_as<ConfigError>([&] { table.add({"", '.', 100, 2}); }));

  const auto listed = table.currencies();
  assert(!listed.empty());
  assert(listed.front().code == "ARS");
}

void test_parse_currency_table() {
  const auto table = monetize::parse_currency_table(
      "# test currencies\n"
      "USD . 100 2\n"
      "\n"
      "XTS , 1000 3   # three places\n"
      "default xts\n");
  assert(table.default_identifier() == "XTS");
  assert(table.lookup("xts").decimal_mark == ',');
  assert(table.lookup("XTS").subunit_to_unit == 1000);
  assert(table.lookup("XTS").decimal_places == 3);
  assert(table.contains("USD"));
  assert(!table.contains("EUR"));

  const monetize::Parser parser(table);
  expect_result(parser.parse("1.234,5678"), "1234568", "XTS");
}

void test_parse_currency_table_errors() {
  assert(throws_as<ConfigError>([] { monetize::parse_currency_table("USD . 100\n"); }));
  assert(throws_as<ConfigError>([] { monetize::parse_currency_table("USD .. 100 2\n"); }));
  assert(throws_as<ConfigError>([] { monetize::parse_currency_table("USD . abc 2\n"); }));
  assert(throws_as<ConfigError>([] { monetize::parse_currency_table("USD . 100 2x\n"); }));
  assert(throws_as<ConfigError>([] { monetize::parse_currency_table("USD . 0 2\n"); }));
  assert(throws_as<ConfigError>([] { monetize::parse_currency_table("USD . 100 2\ndefault\n"); }));
  assert(throws_as<ConfigError>([] { monetize::parse_currency_table("USD . 100 2\ndefault EUR\n"); }));
  assert(throws_as<ConfigError>([] { monetize::parse_currency_table(""); }));

  bool caught = false;
  try {
    (void)monetize::parse_currency_table("USD . 100 2\nEUR , 100\n", "currencies.txt");
  } catch (const ConfigError& e) {
    caught = true;
    assert(std::string(e.what()).find("currencies.txt:2:") != std::string::npos);
  }
  assert(caught);

  caught = false;
  try {
    (void)monetize::parse_currency_table("XXX . 100 4294967298\ndefault XXX\n", "wide.txt");
  } catch (const ConfigError& e) {
    caught = true;
    assert(std::string(e.what()).find("wide.txt:1:") != std::string::npos);
    assert(std::string(e.what()).find("decimal_places out of range") != std::string::npos);
  }
  assert(caught);
}

void test_load_currency_table_from_file() {
  const auto path = std::filesystem::temp_directory_path() / "monetize_registry_test.txt";
  {
    std::ofstream out(path);
    out << "GBP . 100 2\n"
        << "default GBP\n";
  }
  const auto table = monetize::load_currency_table(path.string());
  std::filesystem::remove(path);
  assert(table.default_identifier() == "GBP");
  assert(table.lookup("GBP").subunit_to_unit == 100);

  assert(throws_as<ConfigError>([] { monetize::load_currency_table("/nonexistent/monetize/currencies.txt"); }));
}

}  // namespace

void run_registry_tests() {
  test_builtin_lookup();
  test_unknown_currency_carries_identifier();
  test_add_replaces_entry();
  test_parse_currency_table();
  test_parse_currency_table_errors();
  test_load_currency_table_from_file();
}

}  // namespace parse_test
