void dump_trace(const monetize::ParseTrace& trace) {
  std::cerr << "input: \"" << trace.input << "\"\n"
            << "currency: " << trace.currency.code
            << " (decimal_mark '" << trace.currency.decimal_mark
            << "', subunit_to_unit " << trace.currency.subunit_to_unit
            << ", decimal_places " << trace.currency.decimal_places << ")\n"
            << "multiplier_exponent: " << trace.amount.multiplier_exponent << "\n"
            << "major: \"" << trace.amount.major_digits << "\"\n"
            << "minor: \"" << trace.amount.minor_digits << "\"\n"
            << "negative: " << (trace.amount.negative ? "true" : "false") << "\n"
            << "subunits: " << trace.result.subunits.to_string() << "\n";
}

int parse_mode_main(const CliOptions& options) {
  const auto registry = load_registry(options);
  const monetize::Parser parser(registry);
  const auto trace = parser.explain(options.value, options.currency, options.parse);
  if (options.explain) {
    dump_trace(trace);
  }
  print_result(trace.result);
  return kExitOk;
}

int numeric_mode_main(const CliOptions& options) {
  const auto registry = load_registry(options);
  print_result(monetize::from_numeric(options.value, registry, options.currency, options.parse));
  return kExitOk;
}

int currencies_mode_main(const CliOptions& options) {
  const auto registry = load_registry(options);
  for (const auto& currency : registry.currencies()) {
    std::cout << currency.code << " " << currency.decimal_mark << " " << currency.subunit_to_unit << " "
              << currency.decimal_places
              << (currency.code == registry.default_identifier() ? " default" : "") << "\n";
  }
  return kExitOk;
}
