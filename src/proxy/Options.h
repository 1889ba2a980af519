#pragma once

#include <string>

/// Command-line settings. Addresses stay as "host:port" strings here;
/// main() resolves them.
struct Options {
    std::string listen  = ":8080";
    std::string backend = "127.0.0.1:9090";
    bool help = false;
};

/// Parses `[-l <listen>] [-d <backend>] [-h]`.
/// Throws std::invalid_argument on a missing value or unknown option.
Options parseOptions(int argc, const char* const argv[]);

/// One-line usage text for `prog`.
std::string usage(const char* prog);
