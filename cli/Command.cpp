/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include <iostream>

static const Command commands[] =
{
    {"hotp-generate", "<key> <counter>", hotpGenerateCommand},
    {"totp-generate", "<key> [time]", totpGenerateCommand},
    {"totp-verify", "<key> <code> [time]", totpVerifyCommand}
};

const Command *
commandFind(const std::string &name)
{
    for (auto &command: commands)
        if (name == command.name)
            return &command;
    return nullptr;
}

void
commandPrintAll()
{
    for (auto &command: commands)
        std::cout << usageString(command) << std::endl;
}

std::string
usageString(const Command &command)
{
    return std::string("usage: nyx-cli [-n digits] [-s skew] [-t step] ") +
        command.name + " " + command.usage;
}
