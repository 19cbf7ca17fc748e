#pragma once

#include <string>
#include <string_view>

#include <gmp.h>

namespace monetize {

class BigInt {
 public:
  BigInt();
  BigInt(long value);  // NOLINT(google-explicit-constructor)
  BigInt(const BigInt& other);
  BigInt(BigInt&& other) noexcept;
  BigInt& operator=(const BigInt& other);
  BigInt& operator=(BigInt&& other) noexcept;
  ~BigInt();

  // Empty text is zero. Anything but an optional sign followed by ASCII
  // digits is rejected with std::invalid_argument.
  static BigInt from_digits(std::string_view digits);
  static BigInt pow10(unsigned long exponent);

  BigInt& operator+=(const BigInt& rhs);
  BigInt& operator*=(const BigInt& rhs);
  BigInt& operator*=(long rhs);

  BigInt operator-() const;

  int sign() const;
  bool fits_long() const;
  long to_long() const;
  std::string to_string() const;

  mpz_srcptr get() const { return value; }
  mpz_ptr get() { return value; }

  friend bool operator==(const BigInt& lhs, const BigInt& rhs);
  friend bool operator!=(const BigInt& lhs, const BigInt& rhs) { return !(lhs == rhs); }
  friend bool operator<(const BigInt& lhs, const BigInt& rhs);

 private:
  mpz_t value;
};

BigInt operator+(BigInt lhs, const BigInt& rhs);
BigInt operator*(BigInt lhs, const BigInt& rhs);

// Exact fraction kept in canonical form (positive denominator, no common
// factors).
class BigRational {
 public:
  BigRational();
  BigRational(const BigInt& integer);  // NOLINT(google-explicit-constructor)
  BigRational(const BigInt& numerator, const BigInt& denominator);
  BigRational(const BigRational& other);
  BigRational(BigRational&& other) noexcept;
  BigRational& operator=(const BigRational& other);
  BigRational& operator=(BigRational&& other) noexcept;
  ~BigRational();

  // "0.0125" style digit string of a pure fraction: digits / 10^len(digits).
  static BigRational from_fraction_digits(std::string_view digits);
  // [+-]digits[.digits][e[+-]digits]; std::invalid_argument otherwise.
  static BigRational from_decimal_literal(std::string_view text);

  BigRational& operator+=(const BigRational& rhs);
  BigRational& operator*=(const BigRational& rhs);

  BigRational operator-() const;

  int sign() const;
  bool is_integer() const;
  BigInt numerator() const;
  BigInt denominator() const;

  // Rounds to the nearest integer, halves away from zero.
  BigInt round_half_away() const;

  // Integers render as plain digits, terminating fractions as an exact
  // decimal ("123.45"), anything else as "n/d".
  std::string to_string() const;

  mpq_srcptr get() const { return value; }

  friend bool operator==(const BigRational& lhs, const BigRational& rhs);
  friend bool operator!=(const BigRational& lhs, const BigRational& rhs) { return !(lhs == rhs); }

 private:
  mpq_t value;
};

BigRational operator+(BigRational lhs, const BigRational& rhs);
BigRational operator*(BigRational lhs, const BigRational& rhs);

std::string mpz_to_decimal_string(mpz_srcptr value);

}  // namespace monetize
