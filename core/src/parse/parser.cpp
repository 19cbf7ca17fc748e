#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "monetize/parser.h"
#include "monetize/subunits.h"

namespace monetize {

Parser::Parser(const CurrencyRegistry& registry) : registry(registry) {}

Parser::Parser(const CurrencyRegistry& registry, SymbolTable symbols)
    : registry(registry), resolver(std::move(symbols)) {}

std::string Parser::trim(std::string_view value) {
  std::size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  std::size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return std::string(value.substr(start, end - start));
}

std::string Parser::resolve_currency(std::string_view trimmed,
                                     const std::optional<std::string>& default_currency,
                                     const ParseOptions& options) const {
  auto computed = options.assume_from_symbol ? resolver.resolve(trimmed) : scan_iso_code(trimmed);
  if (computed) {
    return *computed;
  }
  if (default_currency && !default_currency->empty()) {
    return *default_currency;
  }
  return registry.default_identifier();
}

ParseTrace Parser::explain(std::string_view text,
                           const std::optional<std::string>& default_currency,
                           const ParseOptions& options) const {
  ParseTrace trace;
  trace.input = trim(text);
  trace.currency = registry.lookup(resolve_currency(trace.input, default_currency, options));
  trace.amount = extract_amount(trace.input, trace.currency.decimal_mark);
  trace.result.subunits = compute_subunits(trace.amount, trace.currency, options.infinite_precision);
  trace.result.currency = trace.currency.code;
  return trace;
}

ParseResult Parser::parse(std::string_view text,
                          const std::optional<std::string>& default_currency,
                          const ParseOptions& options) const {
  return std::move(explain(text, default_currency, options).result);
}

}  // namespace monetize
