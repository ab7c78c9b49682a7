// SOULBOUND - CLI Commands
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// Command table of the soulbound-cli tool. Each command runs against an
// open registry and writes its result to the supplied streams.

#ifndef SOULBOUND_CLI_COMMANDS_H
#define SOULBOUND_CLI_COMMANDS_H

#include "soulbound/core/types.h"
#include "soulbound/registry/registry.h"

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace soulbound {
namespace cli {

// ============================================================================
// Command Table
// ============================================================================

struct CommandContext {
    registry::SoulRegistry& registry;
    /// Address the command acts as
    Address caller;
    const std::vector<std::string>& args;
    std::ostream& out;
    std::ostream& err;
};

struct CommandInfo {
    size_t minArgs;
    size_t maxArgs;
    const char* usage;
    const char* description;
    std::function<int(CommandContext&)> handler;
};

/// All commands, keyed by name
const std::map<std::string, CommandInfo>& GetCommands();

/**
 * Look up method and check its argument count.
 * @return The command, or nullptr after writing the reason to err
 */
const CommandInfo* FindCommand(const std::string& method, size_t argCount, std::ostream& err);

/**
 * Run one command against an open registry.
 *
 * Registry rejections are written to err as "error: <Name>".
 * @return Process exit code: 0 on success, 1 on any failure
 */
int RunCommand(registry::SoulRegistry& registry, const Address& caller,
               const std::string& method, const std::vector<std::string>& args,
               std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace soulbound

#endif // SOULBOUND_CLI_COMMANDS_H
