#include "shell/Report.hpp"
#include "shell/Table.hpp"
#include "record/Snapshot.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace dw::shell;
using namespace dw::sync;
using namespace dw::sync::model;
using namespace dw::util;

namespace {

constexpr std::size_t PATH_WIDTH = 60;

std::string tsOrNA(const std::optional<std::time_t>& ts) {
    return ts ? timestampToDisplay(*ts) : "N/A";
}

}

std::string Report::scanLines(const dw::record::Snapshot& snapshot, const std::vector<std::string>& paths,
                              const ScanMode mode) {
    const bool withRef = mode != ScanMode::UpdateLocal;

    std::vector<Column> cols{{.header = "File", .max = PATH_WIDTH, .ellipsize_middle = true}};
    if (withRef) cols.push_back({.header = "Reference"});
    cols.push_back({.header = "Local"});
    Table table(std::move(cols));

    for (const auto& p : paths) {
        const auto* rec = snapshot.find(p);
        if (!rec) continue;
        if (withRef) table.add_row({rec->path, "ref: " + tsOrNA(rec->reference_timestamp), "local: " + tsOrNA(rec->local_timestamp)});
        else table.add_row({rec->path, "local: " + tsOrNA(rec->local_timestamp)});
    }
    return table.render();
}

std::string Report::classification(const std::vector<Classification>& classified) {
    Table table({
        {.header = "File", .max = PATH_WIDTH, .ellipsize_middle = true},
        {.header = "Status", .min = 17},
        {.header = "Details"},
    });

    for (const auto& c : classified) table.add_row({c.path, to_string(c.status), c.details()});
    return "\n--- Remote Comparison Results ---\n" + table.render();
}

std::string Report::summary(const std::vector<Classification>& classified) {
    std::string out = fmt::format("\n{} path(s) compared:", classified.size());
    for (const auto s : ALL_STATUSES) {
        const auto n = std::ranges::count_if(classified, [s](const Classification& c) { return c.status == s; });
        if (n) fmt::format_to(std::back_inserter(out), "\n  {:<18} {}", to_string(s), n);
    }
    out += '\n';
    return out;
}

std::string Report::plan(const Plan& plan) {
    if (plan.aborted)
        return fmt::format("\nDeployment ABORTED at {}. No files were transferred.\n", plan.aborted_on);
    if (plan.empty()) return "\nNo files to deploy.\n";

    std::string out = "\n--- Deploy Plan ---\n";
    for (const auto& a : plan.actions)
        fmt::format_to(std::back_inserter(out), "  {:<10} {} ({})\n", to_string(a.type), a.path, to_string(a.status));
    return out;
}

std::string Report::outcomes(const std::vector<Outcome>& outcomes) {
    std::vector<const Outcome*> failed;
    for (const auto& o : outcomes) if (!o.ok()) failed.push_back(&o);

    if (failed.empty()) return fmt::format("\nDeployment completed successfully ({} item(s)).\n", outcomes.size());

    std::string out = "\nWARNING: Some files failed to deploy or verify correctly:\n";
    for (const auto* o : failed)
        fmt::format_to(std::back_inserter(out), " - {} [{}] {}\n", o->path, to_string(o->result), o->reason);
    return out;
}
