/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "Util.hpp"
#include <iostream>
#include <getopt.h>

using namespace nyx;

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // Start from the defaults, then apply the command-line options:
    TotpConfig defaults;
    uint64_t digits = defaults.digits();
    uint64_t skew = defaults.skew();
    uint64_t step = defaults.step();
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"digits",  required_argument, nullptr, 'n'},
        {"skew",    required_argument, nullptr, 's'},
        {"step",    required_argument, nullptr, 't'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "hn:s:t:", long_options, nullptr)))
    {
        switch (c)
        {
        case 'h':
            wantHelp = true;
            break;
        case 'n':
            NYX_CHECK(parseNumber(digits, optarg, UINT32_MAX));
            break;
        case 's':
            NYX_CHECK(parseNumber(skew, optarg, UINT8_MAX));
            break;
        case 't':
            NYX_CHECK(parseNumber(step, optarg, UINT64_MAX));
            break;
        case '?':
            if (optopt == 'n')
                return NYX_ERROR(NYX_CC_Error, "-n requires a digit count");
            else if (optopt == 's')
                return NYX_ERROR(NYX_CC_Error, "-s requires a step count");
            else if (optopt == 't')
                return NYX_ERROR(NYX_CC_Error, "-t requires a step length");
            else
                return NYX_ERROR(NYX_CC_Error, "Unknown option '" +
                                 std::string(argv[optind - 1]) + "'");
        default:
            return NYX_ERROR(NYX_CC_Error, "Unexpected getopt result");
        }
    }

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

    // Find the command:
    if (argc < 1)
    {
        commandPrintAll();
        return Status();
    }
    const auto commandName = argv[0];
    --argc;
    ++argv;

    const Command *command = commandFind(commandName);
    if (!command)
        return NYX_ERROR(NYX_CC_Error,
                         "unknown command " + std::string(commandName));

    // If the user wants help, just print the string and return:
    if (wantHelp)
    {
        std::cout << usageString(*command) << std::endl;
        return Status();
    }

    TotpConfig config;
    NYX_CHECK(totpConfigure(config, static_cast<unsigned>(digits),
        static_cast<uint8_t>(skew), step));

    return command->run(config, argc, argv);
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
