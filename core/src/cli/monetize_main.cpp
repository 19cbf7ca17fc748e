#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "monetize/currency.h"
#include "monetize/errors.h"
#include "monetize/numeric.h"
#include "monetize/parser.h"

// CLI parts:
// - 01: option parsing, registry loading, output helpers
// - 02: parse / numeric / currencies modes
// - 03: command dispatch
namespace {

#include "monetize_main_parts/01_common.cpp"
#include "monetize_main_parts/02_modes.cpp"

}  // namespace

#include "monetize_main_parts/03_main.cpp"
