#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "monetize/currency.h"
#include "monetize/errors.h"

namespace monetize {

namespace {

std::string strip_comment(std::string value) {
  const auto pos = value.find('#');
  if (pos != std::string::npos) {
    value.erase(pos);
  }
  return value;
}

std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> fields;
  std::istringstream ss(line);
  std::string token;
  while (ss >> token) {
    fields.push_back(token);
  }
  return fields;
}

ConfigError error_at(const std::string& origin, int line_no, const std::string& message) {
  return ConfigError(origin + ":" + std::to_string(line_no) + ": " + message);
}

long parse_field_number(const std::string& field, const std::string& origin, int line_no, const char* what) {
  std::size_t consumed = 0;
  long value = 0;
  try {
    value = std::stol(field, &consumed);
  } catch (const std::exception&) {
    throw error_at(origin, line_no, std::string("invalid ") + what + ": " + field);
  }
  if (consumed != field.size()) {
    throw error_at(origin, line_no, std::string("invalid ") + what + ": " + field);
  }
  return value;
}

}  // namespace

CurrencyTable parse_currency_table(const std::string& text, const std::string& origin) {
  CurrencyTable table;
  std::istringstream lines(text);
  std::string raw;
  int line_no = 0;
  while (std::getline(lines, raw)) {
    ++line_no;
    const auto fields = split_fields(strip_comment(raw));
    if (fields.empty()) {
      continue;
    }
    if (fields[0] == "default") {
      if (fields.size() != 2) {
        throw error_at(origin, line_no, "expected: default <CODE>");
      }
      table.set_default(fields[1]);
      continue;
    }
    if (fields.size() != 4) {
      throw error_at(origin, line_no, "expected: <CODE> <decimal_mark> <subunit_to_unit> <decimal_places>");
    }
    if (fields[1].size() != 1) {
      throw error_at(origin, line_no, "decimal mark must be a single character: " + fields[1]);
    }

    CurrencyContext currency;
    currency.code = fields[0];
    currency.decimal_mark = fields[1][0];
    currency.subunit_to_unit = parse_field_number(fields[2], origin, line_no, "subunit_to_unit");
    const long decimal_places = parse_field_number(fields[3], origin, line_no, "decimal_places");
    if (decimal_places < std::numeric_limits<int>::min() || decimal_places > std::numeric_limits<int>::max()) {
      throw error_at(origin, line_no, "decimal_places out of range");
    }
    currency.decimal_places = static_cast<int>(decimal_places);
    try {
      table.add(std::move(currency));
    } catch (const ConfigError& e) {
      throw error_at(origin, line_no, e.what());
    }
  }
  if (!table.contains(table.default_identifier())) {
    throw ConfigError(origin + ": default currency " + table.default_identifier() + " is not defined");
  }
  return table;
}

CurrencyTable load_currency_table(const std::string& path) {
  std::ifstream source_file(path);
  if (!source_file) {
    throw ConfigError("failed to open currency file: " + path);
  }
  const std::string text((std::istreambuf_iterator<char>(source_file)), std::istreambuf_iterator<char>());
  return parse_currency_table(text, path);
}

}  // namespace monetize
