#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace dw::shell {

struct FlagKV {
    std::string key;                    // without leading dashes
    std::optional<std::string> value;   // nullopt for a bare switch
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

// Splits "--key=value" into "--key" "value"; everything else passes through.
std::vector<std::string> normalizeArgs(int argc, char** argv, int start_index = 1);

// First word is the command name. A flag consumes the next word as its value
// unless its key is listed in switches. Everything after "--" is positional.
CommandCall parseArgs(const std::vector<std::string>& args, const std::unordered_set<std::string>& switches = {});

// Upsert a flag (last wins)
void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

bool hasFlag(const CommandCall& c, const std::string& key);
bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

bool hasKey(const CommandCall& c, const std::string& key);

}
