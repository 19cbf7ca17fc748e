constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitAmount = 2;
constexpr int kExitCurrency = 3;

struct CliOptions {
  std::string value;
  std::optional<std::string> currency;
  std::optional<std::string> currencies_path;
  monetize::ParseOptions parse;
  bool explain = false;
};

struct UsageError : public std::runtime_error {
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

void print_usage() {
  std::cerr << "usage:\n"
            << "  monetize parse <text> [--currency <code>] [--assume-from-symbol]\n"
            << "                        [--infinite-precision] [--currencies <file>] [--explain]\n"
            << "  monetize numeric <literal> [--currency <code>] [--infinite-precision]\n"
            << "                             [--currencies <file>]\n"
            << "  monetize currencies [--currencies <file>]\n"
            << "environment:\n"
            << "  MONETIZE_ASSUME_FROM_SYMBOL, MONETIZE_INFINITE_PRECISION (0/false/off/no disable)\n"
            << "  MONETIZE_DEFAULT_CURRENCY   (overrides the registry default)\n";
}

// Flags override the environment; positional arguments fill `value`.
CliOptions parse_cli_options(int argc, char** argv, int first, bool takes_value) {
  CliOptions options;
  options.parse = monetize::options_from_env();
  bool have_value = false;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--assume-from-symbol") {
      options.parse.assume_from_symbol = true;
      continue;
    }
    if (arg == "--infinite-precision") {
      options.parse.infinite_precision = true;
      continue;
    }
    if (arg == "--explain") {
      options.explain = true;
      continue;
    }
    if (arg == "--currency" || arg == "--currencies") {
      if (i + 1 >= argc) {
        throw UsageError("missing value for " + arg);
      }
      (arg == "--currency" ? options.currency : options.currencies_path) = std::string(argv[++i]);
      continue;
    }
    // "--" takes the next argument verbatim, even if it looks like a flag.
    if (arg == "--" && i + 1 < argc && takes_value && !have_value) {
      options.value = argv[++i];
      have_value = true;
      continue;
    }
    if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      throw UsageError("unknown option: " + arg);
    }
    if (!takes_value || have_value) {
      throw UsageError("unexpected extra argument: " + arg);
    }
    options.value = arg;
    have_value = true;
  }
  if (takes_value && !have_value) {
    throw UsageError("missing value");
  }
  return options;
}

monetize::CurrencyTable load_registry(const CliOptions& options) {
  auto table = options.currencies_path ? monetize::load_currency_table(*options.currencies_path)
                                       : monetize::CurrencyTable::builtin();
  if (const char* raw = std::getenv("MONETIZE_DEFAULT_CURRENCY"); raw != nullptr && *raw != '\0') {
    table.set_default(raw);
  }
  return table;
}

void print_result(const monetize::ParseResult& result) {
  std::cout << result.subunits.to_string() << " " << result.currency << "\n";
}
