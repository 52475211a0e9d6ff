#include "shell/Parser.hpp"

#include <algorithm>

using namespace dw::shell;

namespace {

bool isFlag(const std::string& a) {
    return a.size() > 1 && a[0] == '-' && a != "--";
}

std::string stripDashes(const std::string& a) {
    const auto pos = a.find_first_not_of('-');
    return pos == std::string::npos ? std::string{} : a.substr(pos);
}

}

std::vector<std::string> dw::shell::normalizeArgs(const int argc, char** argv, const int start_index) {
    std::vector<std::string> out;
    if (argc > start_index) out.reserve(static_cast<size_t>(argc - start_index) + 4);

    for (int i = start_index; i < argc; ++i) {
        std::string a = argv[i];

        if (a.rfind("--", 0) == 0 && a.size() > 2) {
            if (const auto eq = a.find('='); eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));      // --key
                out.emplace_back(a.substr(eq + 1));     // value
                continue;
            }
        }

        out.emplace_back(std::move(a));
    }
    return out;
}

void dw::shell::setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

CommandCall dw::shell::parseArgs(const std::vector<std::string>& args, const std::unordered_set<std::string>& switches) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;
    if (!args.empty() && !isFlag(args[0])) {
        call.name = args[0];
        i = 1;
    }

    bool stop_flags = false;
    for (; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stop_flags && a == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && isFlag(a)) {
            const auto key = stripDashes(a);
            if (!switches.contains(key) && i + 1 < args.size() && !isFlag(args[i + 1]) && args[i + 1] != "--") {
                setOpt(call, key, args[i + 1]);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(a);
    }

    return call;
}

std::optional<std::string> dw::shell::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v;
    return std::nullopt;
}

std::optional<std::string> dw::shell::optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool dw::shell::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool dw::shell::hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& k) { return hasFlag(c, k); });
}

bool dw::shell::hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}
