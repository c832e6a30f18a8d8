/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../nyx/crypto/Totp.hpp"

/**
 * A sub-command, run with the arguments after its name.
 */
struct Command
{
    const char *name;
    const char *usage;
    nyx::Status (*run)(const nyx::TotpConfig &config, int argc, char *argv[]);
};

// The sub-commands, in commands/Totp.cpp:
nyx::Status
totpGenerateCommand(const nyx::TotpConfig &config, int argc, char *argv[]);

nyx::Status
totpVerifyCommand(const nyx::TotpConfig &config, int argc, char *argv[]);

nyx::Status
hotpGenerateCommand(const nyx::TotpConfig &config, int argc, char *argv[]);

/**
 * Looks a sub-command up by name, returning null if there is none.
 */
const Command *
commandFind(const std::string &name);

/**
 * Prints the usage line of every sub-command.
 */
void
commandPrintAll();

/**
 * Builds the usage string for a sub-command.
 */
std::string
usageString(const Command &command);

#endif
