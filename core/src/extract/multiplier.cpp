#include <cctype>
#include <string>
#include <string_view>

#include "monetize/amount_text.h"

namespace monetize {

namespace {

int exponent_for_suffix(char suffix) {
  switch (std::toupper(static_cast<unsigned char>(suffix))) {
    case 'K':
      return 3;
    case 'M':
      return 6;
    case 'B':
      return 9;
    case 'T':
      return 12;
    default:
      return 0;
  }
}

bool is_ascii_digit(char ch) {
  return ch >= '0' && ch <= '9';
}

bool is_word_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

}  // namespace

// The suffix must sit right after the last digit and end a word.
int extract_multiplier_exponent(std::string_view text) {
  std::size_t last_digit = text.size();
  for (std::size_t pos = text.size(); pos > 0; --pos) {
    if (is_ascii_digit(text[pos - 1])) {
      last_digit = pos - 1;
      break;
    }
  }
  if (last_digit + 1 >= text.size()) {
    return 0;
  }
  const std::size_t suffix = last_digit + 1;
  if (suffix + 1 < text.size() && is_word_char(text[suffix + 1])) {
    return 0;
  }
  return exponent_for_suffix(text[suffix]);
}

}  // namespace monetize
