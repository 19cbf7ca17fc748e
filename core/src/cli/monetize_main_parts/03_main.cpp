int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return kExitUsage;
  }

  const std::string command = argv[1];
  try {
    if (command == "parse") {
      return parse_mode_main(parse_cli_options(argc, argv, 2, true));
    }
    if (command == "numeric") {
      return numeric_mode_main(parse_cli_options(argc, argv, 2, true));
    }
    if (command == "currencies") {
      return currencies_mode_main(parse_cli_options(argc, argv, 2, false));
    }
    if (command == "-h" || command == "--help" || command == "help") {
      print_usage();
      return kExitOk;
    }
    std::cerr << "unknown command: " << command << "\n";
    print_usage();
    return kExitUsage;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    print_usage();
    return kExitUsage;
  } catch (const monetize::InvalidAmount& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitAmount;
  } catch (const monetize::UnsupportedValueType& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitAmount;
  } catch (const monetize::UnknownCurrency& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitCurrency;
  } catch (const monetize::ConfigError& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitCurrency;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitUsage;
  }
}
