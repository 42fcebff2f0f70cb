#include "options.hpp"

#include <getopt.h>

namespace platmon::fan
{

std::string usage(const std::string& argv0)
{
    return "Usage: " + argv0 + " [-d] [-l <log_file>]";
}

Options parseOptions(int argc, char** argv)
{
    Options opts;
    opts.logFile = std::string(kFunctionName) + ".log";

    static const struct option longOpts[] = {
        {"debug", no_argument, nullptr, 'd'},
        {"lfile", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0},
    };

    // Full re-initialisation of getopt state (glibc), so this can be called
    // more than once per process.
    optind = 0;
    opterr = 0;

    int c;
    while ((c = getopt_long(argc, argv, "hdl:", longOpts, nullptr)) != -1)
    {
        switch (c)
        {
            case 'h':
                opts.showUsage = true;
                return opts;
            case 'd':
                opts.level = log::Level::Debug;
                break;
            case 'l':
                opts.logFile = optarg;
                break;
            default:
                opts.showUsage = true;
                return opts;
        }
    }

    return opts;
}

} // namespace platmon::fan
