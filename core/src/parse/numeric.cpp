#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "monetize/errors.h"
#include "monetize/numeric.h"

namespace monetize {

namespace {

const CurrencyContext& currency_or_default(const CurrencyRegistry& registry,
                                           const std::optional<std::string>& currency) {
  if (currency && !currency->empty()) {
    return registry.lookup(*currency);
  }
  return registry.lookup(registry.default_identifier());
}

std::string trim_text(std::string_view value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return std::string();
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return std::string(value.substr(first, last - first + 1));
}

enum class LiteralKind { kInteger, kDecimal, kOther };

std::size_t skip_digits(std::string_view text, std::size_t pos) {
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  return pos;
}

// Accepts [+-]digits as an integer and [+-](digits[.digits]|.digits)[e[+-]digits] as a decimal.
LiteralKind classify_literal(std::string_view text) {
  std::size_t pos = 0;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    ++pos;
  }
  const std::size_t int_start = pos;
  pos = skip_digits(text, pos);
  const bool has_int_digits = pos > int_start;
  if (pos == text.size()) {
    return has_int_digits ? LiteralKind::kInteger : LiteralKind::kOther;
  }
  bool has_fraction_digits = false;
  if (text[pos] == '.') {
    const std::size_t fraction_start = ++pos;
    pos = skip_digits(text, pos);
    has_fraction_digits = pos > fraction_start;
  }
  if (!has_int_digits && !has_fraction_digits) {
    return LiteralKind::kOther;
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      ++pos;
    }
    const std::size_t exponent_start = pos;
    pos = skip_digits(text, pos);
    if (pos == exponent_start) {
      return LiteralKind::kOther;
    }
  }
  return pos == text.size() ? LiteralKind::kDecimal : LiteralKind::kOther;
}

}  // namespace

ParseResult from_integer(const BigInt& units, const CurrencyRegistry& registry,
                         const std::optional<std::string>& currency) {
  const auto& context = currency_or_default(registry, currency);
  BigInt subunits = units;
  subunits *= context.subunit_to_unit;
  return ParseResult{BigRational(subunits), context.code};
}

ParseResult from_decimal(std::string_view literal, const CurrencyRegistry& registry,
                         const std::optional<std::string>& currency, const ParseOptions& options) {
  const auto& context = currency_or_default(registry, currency);
  const std::string text = trim_text(literal);
  BigRational value;
  try {
    value = BigRational::from_decimal_literal(text);
  } catch (const std::invalid_argument& e) {
    throw InvalidAmount(std::string("invalid decimal amount: ") + e.what());
  }
  value *= BigRational(BigInt(context.subunit_to_unit));
  if (!options.infinite_precision) {
    value = BigRational(value.round_half_away());
  }
  return ParseResult{std::move(value), context.code};
}

std::string shortest_double_text(double value) {
  for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
    std::ostringstream stream;
    stream << std::setprecision(precision) << value;
    if (std::strtod(stream.str().c_str(), nullptr) == value) {
      return stream.str();
    }
  }
  std::ostringstream stream;
  stream << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
  return stream.str();
}

ParseResult from_double(double value, const CurrencyRegistry& registry,
                        const std::optional<std::string>& currency, const ParseOptions& options) {
  if (!std::isfinite(value)) {
    throw UnsupportedValueType("'value' should be a finite number");
  }
  return from_decimal(shortest_double_text(value), registry, currency, options);
}

ParseResult from_numeric(std::string_view literal, const CurrencyRegistry& registry,
                         const std::optional<std::string>& currency, const ParseOptions& options) {
  const std::string text = trim_text(literal);
  switch (classify_literal(text)) {
    case LiteralKind::kInteger:
      return from_integer(BigInt::from_digits(text), registry, currency);
    case LiteralKind::kDecimal:
      return from_decimal(text, registry, currency, options);
    case LiteralKind::kOther:
      break;
  }
  throw UnsupportedValueType("'value' should be a numeric literal: " + text);
}

}  // namespace monetize
