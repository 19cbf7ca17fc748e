#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "monetize/amount_text.h"
#include "monetize/errors.h"

namespace monetize {

namespace {

bool is_kept_char(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) || ch == '.' || ch == ',' || ch == '\'' || ch == '-';
}

// Splits on every occurrence of sep and drops trailing empty pieces, so
// "5," gives {"5"} while ",5" gives {"", "5"}.
std::vector<std::string> split_pieces(const std::string& text, char sep) {
  std::vector<std::string> pieces;
  std::size_t start = 0;
  for (;;) {
    const auto pos = text.find(sep, start);
    if (pos == std::string::npos) {
      pieces.push_back(text.substr(start));
      break;
    }
    pieces.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  while (!pieces.empty() && pieces.back().empty()) {
    pieces.pop_back();
  }
  return pieces;
}

AmountParts split_major_minor(const std::string& text, char decimal_mark) {
  const auto pieces = split_pieces(text, decimal_mark);
  AmountParts parts;
  if (!pieces.empty()) {
    parts.major = pieces[0];
  }
  if (pieces.size() > 1) {
    parts.minor = pieces[1];
  }
  return parts;
}

std::string remove_all(std::string text, char ch) {
  text.erase(std::remove(text.begin(), text.end(), ch), text.end());
  return text;
}

std::vector<char> distinct_separators(const std::string& digits) {
  std::vector<char> used;
  for (const char ch : digits) {
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      continue;
    }
    if (std::find(used.begin(), used.end(), ch) == used.end()) {
      used.push_back(ch);
    }
  }
  return used;
}

// A lone separator that is not the currency's decimal mark. Three digits
// after it look like a thousands group unless the part before it is too long
// to be one, or the separator is a dot.
AmountParts resolve_single_separator(const std::string& digits, char sep) {
  const auto pieces = split_pieces(digits, sep);
  std::string possible_major = !pieces.empty() && !pieces[0].empty() ? pieces[0] : "0";
  std::string possible_minor = pieces.size() > 1 && !pieces[1].empty() ? pieces[1] : "00";

  if (possible_minor.size() != 3 || possible_major.size() > 3 || sep == '.') {
    return {possible_major, possible_minor};
  }
  return {possible_major + possible_minor, "0"};
}

}  // namespace

CleanedAmount clean_amount_text(std::string_view text) {
  CleanedAmount out;
  std::string num;
  num.reserve(text.size());
  for (const char ch : text) {
    if (is_kept_char(ch)) {
      num.push_back(ch);
    }
  }

  if (!num.empty() && num.front() == '-') {
    out.negative = true;
    num.erase(num.begin());
  } else if (!num.empty() && num.back() == '-') {
    out.negative = true;
    num.pop_back();
  }

  if (num.find('-') != std::string::npos) {
    throw InvalidAmount("invalid currency amount (hyphen): " + std::string(text));
  }

  if (!num.empty() && (num.back() == '.' || num.back() == ',')) {
    num.pop_back();
  }
  out.digits = std::move(num);
  return out;
}

AmountParts disambiguate_delimiters(const std::string& digits, char decimal_mark) {
  const auto used = distinct_separators(digits);
  switch (used.size()) {
    case 0:
      return {digits, "0"};
    case 1: {
      const char sep = used[0];
      if (sep == decimal_mark) {
        return split_major_minor(digits, sep);
      }
      if (std::count(digits.begin(), digits.end(), sep) > 1) {
        return {remove_all(digits, sep), "0"};
      }
      return resolve_single_separator(digits, sep);
    }
    case 2: {
      const char thousands_separator = used[0];
      const char decimal = used[1];
      return split_major_minor(remove_all(digits, thousands_separator), decimal);
    }
    default:
      throw InvalidAmount("invalid currency amount: " + digits);
  }
}

ParsedAmount extract_amount(std::string_view text, char decimal_mark) {
  ParsedAmount parsed;
  parsed.multiplier_exponent = extract_multiplier_exponent(text);
  auto cleaned = clean_amount_text(text);
  parsed.negative = cleaned.negative;
  auto parts = disambiguate_delimiters(cleaned.digits, decimal_mark);
  parsed.major_digits = std::move(parts.major);
  parsed.minor_digits = std::move(parts.minor);
  return parsed;
}

}  // namespace monetize
