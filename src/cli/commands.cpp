// SOULBOUND - CLI Commands
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/cli/commands.h"

#include "soulbound/core/hex.h"
#include "soulbound/util/logging.h"
#include "soulbound/util/time.h"

namespace soulbound {
namespace cli {

namespace {

// ============================================================================
// Helpers
// ============================================================================

bool ParseOwner(CommandContext& ctx, Address& out) {
    auto addr = Address::TryFromHex(ctx.args[0]);
    if (!addr) {
        ctx.err << "Error: Invalid owner address: " << ctx.args[0] << "\n";
        return false;
    }
    out = *addr;
    return true;
}

int Report(CommandContext& ctx, registry::RegistryError err) {
    if (err == registry::RegistryError::OK) {
        return 0;
    }
    ctx.err << "error: " << registry::RegistryErrorToString(err) << "\n";
    return 1;
}

void PrintSoul(std::ostream& out, const Address& owner, const registry::SoulView& view) {
    const registry::Soul& soul = view.soul;
    out << "owner:      " << owner.ToString() << "\n";
    out << "uuid:       " << soul.uuid.ToString() << "\n";
    out << "identity:   " << BytesToString(soul.identity) << "\n";
    out << "url:        " << BytesToString(soul.url) << "\n";
    out << "minted:     " << util::FormatISO8601(soul.mintedAt) << "\n";
    out << "lastupdate: " << util::FormatISO8601(soul.lastUpdate) << "\n";
    for (size_t i = 0; i < view.keys.size(); ++i) {
        out << "  " << view.keys[i] << " = " << BytesToDisplay(view.values[i]) << "\n";
    }
}

// ============================================================================
// Soul Commands
// ============================================================================

int CmdMint(CommandContext& ctx) {
    Address owner;
    if (!ParseOwner(ctx, owner)) return 1;

    Uuid uuid;
    registry::RegistryError err = ctx.registry.Mint(
        ctx.caller, owner, StringToBytes(ctx.args[1]), StringToBytes(ctx.args[2]), &uuid);
    if (err != registry::RegistryError::OK) return Report(ctx, err);

    ctx.out << uuid.ToString() << "\n";
    return 0;
}

int CmdBurn(CommandContext& ctx) {
    Address owner;
    if (!ParseOwner(ctx, owner)) return 1;
    return Report(ctx, ctx.registry.Burn(ctx.caller, owner));
}

int CmdGetSoul(CommandContext& ctx) {
    Address owner;
    if (!ParseOwner(ctx, owner)) return 1;

    bool includeMetadata = ctx.args.size() > 1 && ctx.args[1] == "metadata";
    registry::SoulView view;
    registry::RegistryError err = ctx.registry.GetSoul(owner, includeMetadata, &view);
    if (err != registry::RegistryError::OK) return Report(ctx, err);

    PrintSoul(ctx.out, owner, view);
    return 0;
}

int CmdCounter(CommandContext& ctx) {
    uint64_t counter = 0;
    registry::RegistryError err = ctx.registry.GetCounter(&counter);
    if (err != registry::RegistryError::OK) return Report(ctx, err);

    ctx.out << counter << "\n";
    return 0;
}

int CmdBaseAsset(CommandContext& ctx) {
    ctx.out << ctx.registry.GetBaseAssetHandle().ToString() << "\n";
    return 0;
}

// ============================================================================
// Metadata Commands
// ============================================================================

int CmdAllowKey(CommandContext& ctx) {
    return Report(ctx, ctx.registry.AllowKey(ctx.caller, ctx.args[0]));
}

int CmdDisallowKey(CommandContext& ctx) {
    return Report(ctx, ctx.registry.DisallowKey(ctx.caller, ctx.args[0]));
}

int CmdIsAllowed(CommandContext& ctx) {
    bool allowed = false;
    registry::RegistryError err = ctx.registry.IsMetadataKeyAllowed(ctx.args[0], &allowed);
    if (err != registry::RegistryError::OK) return Report(ctx, err);

    ctx.out << (allowed ? "true" : "false") << "\n";
    return 0;
}

int CmdSetMetadata(CommandContext& ctx) {
    Address owner;
    if (!ParseOwner(ctx, owner)) return 1;
    return Report(ctx, ctx.registry.SetMetadata(ctx.caller, owner, ctx.args[1],
                                                StringToBytes(ctx.args[2])));
}

int CmdDeleteMetadata(CommandContext& ctx) {
    Address owner;
    if (!ParseOwner(ctx, owner)) return 1;
    return Report(ctx, ctx.registry.DeleteMetadata(ctx.caller, owner, ctx.args[1]));
}

int CmdGetMetadata(CommandContext& ctx) {
    Address owner;
    if (!ParseOwner(ctx, owner)) return 1;

    Bytes value;
    registry::RegistryError err = ctx.registry.GetMetadataValue(owner, ctx.args[1], &value);
    if (err != registry::RegistryError::OK) return Report(ctx, err);

    ctx.out << BytesToString(value) << "\n";
    return 0;
}

int CmdEnumerate(CommandContext& ctx) {
    Address owner;
    if (!ParseOwner(ctx, owner)) return 1;

    std::vector<std::string> keys;
    std::vector<Bytes> values;
    registry::RegistryError err = ctx.registry.Enumerate(owner, &keys, &values);
    if (err != registry::RegistryError::OK) return Report(ctx, err);

    for (size_t i = 0; i < keys.size(); ++i) {
        ctx.out << keys[i] << " = " << BytesToDisplay(values[i]) << "\n";
    }
    return 0;
}

// ============================================================================
// Storage Commands
// ============================================================================

int CmdDbStats(CommandContext& ctx) {
    ctx.out << ctx.registry.GetDatabase().GetStats() << "\n";
    return 0;
}

} // namespace

// ============================================================================
// Command Table
// ============================================================================

const std::map<std::string, CommandInfo>& GetCommands() {
    static const std::map<std::string, CommandInfo> commands = {
        {"mint",           {3, 3, "mint <owner> <identity> <url>", "Mint a soul", CmdMint}},
        {"burn",           {1, 1, "burn <owner>", "Burn a soul", CmdBurn}},
        {"getsoul",        {1, 2, "getsoul <owner> [metadata]", "Show a soul", CmdGetSoul}},
        {"counter",        {0, 0, "counter", "Number of souls minted", CmdCounter}},
        {"baseasset",      {0, 0, "baseasset", "Bound asset address", CmdBaseAsset}},
        {"allowkey",       {1, 1, "allowkey <key>", "Allow a metadata key", CmdAllowKey}},
        {"disallowkey",    {1, 1, "disallowkey <key>", "Disallow a metadata key", CmdDisallowKey}},
        {"isallowed",      {1, 1, "isallowed <key>", "Check a metadata key", CmdIsAllowed}},
        {"setmetadata",    {3, 3, "setmetadata <owner> <key> <value>", "Set a metadata value",
                            CmdSetMetadata}},
        {"deletemetadata", {2, 2, "deletemetadata <owner> <key>", "Clear a metadata value",
                            CmdDeleteMetadata}},
        {"getmetadata",    {2, 2, "getmetadata <owner> <key>", "Show a metadata value",
                            CmdGetMetadata}},
        {"enumerate",      {1, 1, "enumerate <owner>", "List an owner's metadata", CmdEnumerate}},
        {"dbstats",        {0, 0, "dbstats", "Storage backend statistics", CmdDbStats}},
    };
    return commands;
}

const CommandInfo* FindCommand(const std::string& method, size_t argCount, std::ostream& err) {
    const auto& commands = GetCommands();
    auto it = commands.find(method);
    if (it == commands.end()) {
        err << "Error: Unknown command: " << method << "\n";
        return nullptr;
    }
    if (argCount < it->second.minArgs || argCount > it->second.maxArgs) {
        err << "Usage: soulbound-cli " << it->second.usage << "\n";
        return nullptr;
    }
    return &it->second;
}

int RunCommand(registry::SoulRegistry& registry, const Address& caller,
               const std::string& method, const std::vector<std::string>& args,
               std::ostream& out, std::ostream& err) {
    const CommandInfo* command = FindCommand(method, args.size(), err);
    if (!command) {
        return 1;
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Running " << method << " as " << caller.ToString();

    CommandContext ctx{registry, caller, args, out, err};
    return command->handler(ctx);
}

} // namespace cli
} // namespace soulbound
