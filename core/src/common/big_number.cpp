#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "monetize/big_number.h"

namespace monetize {

namespace {

constexpr std::size_t kMaxExponentDigits = 6;

bool all_ascii_digits(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

}  // namespace

std::string mpz_to_decimal_string(mpz_srcptr value) {
  char* raw = mpz_get_str(nullptr, 10, value);
  if (!raw) {
    return "0";
  }
  std::string out(raw);
  void* (*alloc_fn)(size_t) = nullptr;
  void* (*realloc_fn)(void*, size_t, size_t) = nullptr;
  void (*free_fn)(void*, size_t) = nullptr;
  mp_get_memory_functions(&alloc_fn, &realloc_fn, &free_fn);
  if (free_fn) {
    free_fn(raw, std::strlen(raw) + 1U);
  }
  return out.empty() ? "0" : out;
}

// ---------------------------------------------------------------------------
// BigInt

BigInt::BigInt() {
  mpz_init(value);
}

BigInt::BigInt(long v) {
  mpz_init_set_si(value, v);
}

BigInt::BigInt(const BigInt& other) {
  mpz_init_set(value, other.value);
}

BigInt::BigInt(BigInt&& other) noexcept {
  mpz_init(value);
  mpz_swap(value, other.value);
}

BigInt& BigInt::operator=(const BigInt& other) {
  if (this != &other) {
    mpz_set(value, other.value);
  }
  return *this;
}

BigInt& BigInt::operator=(BigInt&& other) noexcept {
  if (this != &other) {
    mpz_swap(value, other.value);
  }
  return *this;
}

BigInt::~BigInt() {
  mpz_clear(value);
}

BigInt BigInt::from_digits(std::string_view digits) {
  BigInt out;
  if (digits.empty()) {
    return out;
  }
  bool negative = false;
  if (digits.front() == '+' || digits.front() == '-') {
    negative = digits.front() == '-';
    digits.remove_prefix(1);
  }
  if (digits.empty() || !all_ascii_digits(digits)) {
    throw std::invalid_argument("not a decimal integer: " + std::string(digits));
  }
  const std::string text(digits);
  if (mpz_set_str(out.value, text.c_str(), 10) != 0) {
    throw std::invalid_argument("not a decimal integer: " + text);
  }
  if (negative) {
    mpz_neg(out.value, out.value);
  }
  return out;
}

BigInt BigInt::pow10(unsigned long exponent) {
  BigInt out;
  mpz_ui_pow_ui(out.value, 10U, exponent);
  return out;
}

BigInt& BigInt::operator+=(const BigInt& rhs) {
  mpz_add(value, value, rhs.value);
  return *this;
}

BigInt& BigInt::operator*=(const BigInt& rhs) {
  mpz_mul(value, value, rhs.value);
  return *this;
}

BigInt& BigInt::operator*=(long rhs) {
  mpz_mul_si(value, value, rhs);
  return *this;
}

BigInt BigInt::operator-() const {
  BigInt out(*this);
  mpz_neg(out.value, out.value);
  return out;
}

int BigInt::sign() const {
  return mpz_sgn(value);
}

bool BigInt::fits_long() const {
  return mpz_fits_slong_p(value) != 0;
}

long BigInt::to_long() const {
  if (!fits_long()) {
    throw std::overflow_error("integer does not fit in long: " + to_string());
  }
  return mpz_get_si(value);
}

std::string BigInt::to_string() const {
  return mpz_to_decimal_string(value);
}

bool operator==(const BigInt& lhs, const BigInt& rhs) {
  return mpz_cmp(lhs.value, rhs.value) == 0;
}

bool operator<(const BigInt& lhs, const BigInt& rhs) {
  return mpz_cmp(lhs.value, rhs.value) < 0;
}

BigInt operator+(BigInt lhs, const BigInt& rhs) {
  lhs += rhs;
  return lhs;
}

BigInt operator*(BigInt lhs, const BigInt& rhs) {
  lhs *= rhs;
  return lhs;
}

// ---------------------------------------------------------------------------
// BigRational

BigRational::BigRational() {
  mpq_init(value);
}

BigRational::BigRational(const BigInt& integer) {
  mpq_init(value);
  mpq_set_z(value, integer.get());
}

BigRational::BigRational(const BigInt& numerator, const BigInt& denominator) {
  if (denominator.sign() == 0) {
    throw std::domain_error("rational with zero denominator");
  }
  mpq_init(value);
  mpq_set_num(value, numerator.get());
  mpq_set_den(value, denominator.get());
  mpq_canonicalize(value);
}

BigRational::BigRational(const BigRational& other) {
  mpq_init(value);
  mpq_set(value, other.value);
}

BigRational::BigRational(BigRational&& other) noexcept {
  mpq_init(value);
  mpq_swap(value, other.value);
}

BigRational& BigRational::operator=(const BigRational& other) {
  if (this != &other) {
    mpq_set(value, other.value);
  }
  return *this;
}

BigRational& BigRational::operator=(BigRational&& other) noexcept {
  if (this != &other) {
    mpq_swap(value, other.value);
  }
  return *this;
}

BigRational::~BigRational() {
  mpq_clear(value);
}

BigRational BigRational::from_fraction_digits(std::string_view digits) {
  if (digits.empty()) {
    return BigRational();
  }
  return BigRational(BigInt::from_digits(digits), BigInt::pow10(digits.size()));
}

BigRational BigRational::from_decimal_literal(std::string_view text) {
  const std::string original(text);
  std::size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }

  std::string digits;
  long fraction_len = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    digits.push_back(text[pos++]);
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      digits.push_back(text[pos++]);
      ++fraction_len;
    }
  }
  if (digits.empty()) {
    throw std::invalid_argument("not a decimal literal: " + original);
  }

  long exponent = 0;
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    bool exponent_negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      exponent_negative = text[pos] == '-';
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
    }
    if (pos == start) {
      throw std::invalid_argument("not a decimal literal: " + original);
    }
    if (pos - start > kMaxExponentDigits) {
      throw std::invalid_argument("decimal exponent out of range: " + original);
    }
    exponent = std::stol(std::string(text.substr(start, pos - start)));
    if (exponent_negative) {
      exponent = -exponent;
    }
  }
  if (pos != text.size()) {
    throw std::invalid_argument("not a decimal literal: " + original);
  }

  BigInt numerator = BigInt::from_digits(digits);
  if (negative) {
    numerator = -numerator;
  }
  const long scale = exponent - fraction_len;
  if (scale >= 0) {
    return BigRational(numerator * BigInt::pow10(static_cast<unsigned long>(scale)));
  }
  return BigRational(numerator, BigInt::pow10(static_cast<unsigned long>(-scale)));
}

BigRational& BigRational::operator+=(const BigRational& rhs) {
  mpq_add(value, value, rhs.value);
  return *this;
}

BigRational& BigRational::operator*=(const BigRational& rhs) {
  mpq_mul(value, value, rhs.value);
  return *this;
}

BigRational BigRational::operator-() const {
  BigRational out(*this);
  mpq_neg(out.value, out.value);
  return out;
}

int BigRational::sign() const {
  return mpq_sgn(value);
}

bool BigRational::is_integer() const {
  return mpz_cmp_ui(mpq_denref(value), 1U) == 0;
}

BigInt BigRational::numerator() const {
  BigInt out;
  mpz_set(out.get(), mpq_numref(value));
  return out;
}

BigInt BigRational::denominator() const {
  BigInt out;
  mpz_set(out.get(), mpq_denref(value));
  return out;
}

BigInt BigRational::round_half_away() const {
  BigInt quotient;
  BigInt remainder;
  mpz_tdiv_qr(quotient.get(), remainder.get(), mpq_numref(value), mpq_denref(value));
  if (remainder.sign() == 0) {
    return quotient;
  }
  // |remainder| * 2 >= denominator rounds away from zero.
  BigInt twice;
  mpz_abs(twice.get(), remainder.get());
  mpz_mul_2exp(twice.get(), twice.get(), 1U);
  if (mpz_cmp(twice.get(), mpq_denref(value)) >= 0) {
    quotient += BigInt(remainder.sign() < 0 ? -1L : 1L);
  }
  return quotient;
}

std::string BigRational::to_string() const {
  if (is_integer()) {
    return mpz_to_decimal_string(mpq_numref(value));
  }

  BigInt rest = denominator();
  const BigInt two(2L);
  const BigInt five(5L);
  const auto twos = mpz_remove(rest.get(), rest.get(), two.get());
  const auto fives = mpz_remove(rest.get(), rest.get(), five.get());
  if (rest != BigInt(1L)) {
    return mpz_to_decimal_string(mpq_numref(value)) + "/" + mpz_to_decimal_string(mpq_denref(value));
  }

  const unsigned long scale = static_cast<unsigned long>(std::max(twos, fives));
  BigInt scaled = numerator() * BigInt::pow10(scale);
  mpz_divexact(scaled.get(), scaled.get(), mpq_denref(value));
  const bool negative = scaled.sign() < 0;
  if (negative) {
    scaled = -scaled;
  }
  std::string digits = scaled.to_string();
  if (digits.size() <= scale) {
    digits.insert(0, scale + 1 - digits.size(), '0');
  }
  digits.insert(digits.size() - scale, 1, '.');
  return negative ? "-" + digits : digits;
}

bool operator==(const BigRational& lhs, const BigRational& rhs) {
  return mpq_equal(lhs.value, rhs.value) != 0;
}

BigRational operator+(BigRational lhs, const BigRational& rhs) {
  lhs += rhs;
  return lhs;
}

BigRational operator*(BigRational lhs, const BigRational& rhs) {
  lhs *= rhs;
  return lhs;
}

}  // namespace monetize
