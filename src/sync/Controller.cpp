#include "sync/Controller.hpp"
#include "sync/Decider.hpp"
#include "sync/Executor.hpp"
#include "sync/Planner.hpp"
#include "sync/Provenance.hpp"
#include "remote/Store.hpp"
#include "shell/IO.hpp"
#include "shell/Report.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace dw::sync;
using namespace dw::sync::model;
using namespace dw::record;

Controller::Controller(Options opts, vcs::Provider& vcs, remote::Store* store, Decider& decider, shell::IO& io)
    : opts_(std::move(opts)), vcs_(vcs), store_(store), decider_(decider), io_(io) {}

void Controller::saveIfDirty(Snapshot& snapshot) const {
    if (!snapshot.isDirty()) return;
    snapshot.save(opts_.scan.snapshot_file);
}

ExitCode Controller::run() {
    classified_.clear();

    Scanner scanner(vcs_, opts_.working_dir);
    auto [snapshot, workingSet] = scanner.scan(opts_.scan);

    if (opts_.scan.mode == ScanMode::LoadOnly) {
        io_.print(fmt::format("Loaded {} records from {}.", snapshot.size(), opts_.scan.snapshot_file.string()));
        saveIfDirty(snapshot);
    } else {
        io_.print(fmt::format("\n--- Scanned Files ({}, ref {}) ---", to_string(opts_.scan.mode), Scanner::effectiveRef(opts_.scan)));
        io_.print(shell::Report::scanLines(snapshot, workingSet, opts_.scan.mode));
        saveIfDirty(snapshot);
        io_.print(fmt::format("Saved {} records to {}.", snapshot.size(), opts_.scan.snapshot_file.string()));
    }

    if (!store_) return ExitCode::Ok;

    if (workingSet.empty()) {
        io_.print("No file data to compare with the remote.");
        return ExitCode::Ok;
    }

    Classifier classifier(*store_, opts_.size_only ? Classifier::Mode::SizeOnly : Classifier::Mode::Content);
    classified_.reserve(workingSet.size());

    try {
        for (const auto& path : workingSet) classified_.push_back(classifier.classify(*snapshot.find(path)));
    } catch (const remote::TransportError& e) {
        log::Registry::sync()->error("[Controller] Remote comparison interrupted ({}): {}", remote::to_string(e.kind), e.what());
        io_.print(shell::Report::classification(classified_));
        io_.print(fmt::format("\nRemote error: {}. Comparison stopped after {} of {} paths.",
                              e.what(), classified_.size(), workingSet.size()));
        return ExitCode::Aborted;
    }

    io_.print(shell::Report::classification(classified_));
    io_.print(shell::Report::summary(classified_));

    if (opts_.size_only) return ExitCode::Ok;

    if (!opts_.deploy) {
        Provenance::backfill(snapshot, classified_);
        saveIfDirty(snapshot);
        return ExitCode::Ok;
    }

    return deploy(snapshot);
}

ExitCode Controller::deploy(Snapshot& snapshot) {
    auto plan = Planner::build(classified_, decider_);
    io_.print(shell::Report::plan(plan));
    if (plan.aborted) return ExitCode::Aborted;

    Provenance::backfill(snapshot, classified_);

    if (plan.empty()) {
        saveIfDirty(snapshot);
        return ExitCode::Ok;
    }

    if (!decider_.confirmDeploy(plan)) {
        io_.print("Deployment cancelled by operator.");
        std::erase_if(plan.actions, [](const Action& a) { return a.uploads(); });
        if (plan.empty()) {
            saveIfDirty(snapshot);
            return ExitCode::Ok;
        }
        io_.print(fmt::format("Fetching {} remote copy(ies) kept for inspection.", plan.actions.size()));
    }

    const auto project = opts_.project.empty() ? opts_.working_dir.filename().string() : opts_.project;
    io_.print(fmt::format("\nStarting deployment...\nBackups will be stored in: {}", (opts_.backup_root / project).string()));

    Executor executor(*store_, {.working_dir = opts_.working_dir, .backup_root = opts_.backup_root, .project = project});
    const auto outcomes = executor.run(plan);

    Provenance::apply(snapshot, outcomes);
    saveIfDirty(snapshot);

    io_.print(shell::Report::outcomes(outcomes));

    const bool failed = std::ranges::any_of(outcomes, [](const Outcome& o) { return !o.ok(); });
    log::Registry::sync()->info("[Controller] Deploy finished: {} item(s), {}", outcomes.size(),
                                failed ? "with failures" : "all succeeded");
    return failed ? ExitCode::PartialFailure : ExitCode::Ok;
}
