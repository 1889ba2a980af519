#include "proxy/Options.h"

#include <stdexcept>

Options parseOptions(int argc, const char* const argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-l" || arg == "-d") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing argument for " + arg);
            }
            (arg == "-l" ? opts.listen : opts.backend) = argv[++i];
        } else {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }
    return opts;
}

std::string usage(const char* prog) {
    return std::string("Usage: ") + prog + " [-l <listen>] [-d <backend>]\n";
}
