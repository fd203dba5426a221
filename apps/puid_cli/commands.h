#pragma once

#include "config.h"

#include <iosfwd>
#include <string>

namespace puid::cli {

// Each command writes results to out, diagnostics to err, and returns the
// process exit code (0 success, 1 failure).

// run_demo: one ID with prefix "foo" and the default random length, then one with
// prefix "bar" and a 24-character random suffix.
int run_demo(std::ostream& out);

// run_decode: decimal value of a base-36 string.
int run_decode(const std::string& text, std::ostream& out, std::ostream& err);

// run_generate: config.count IDs, one per line or as a JSON document
// {"ids": [...], "prefix": ..., "random_length": ...} when config.json is set.
int run_generate(const CliConfig& config, std::ostream& out, std::ostream& err);

}  // namespace puid::cli
