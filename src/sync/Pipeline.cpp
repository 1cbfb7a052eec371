#include "sync/Pipeline.hpp"
#include "sync/CursorStore.hpp"
#include "build/Executor.hpp"
#include "mirror/Copier.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <fmt/core.h>

using namespace mh::sync;
using namespace mh::sync::model;
using namespace mh::log;

namespace fs = std::filesystem;

namespace {

std::string tail(const std::string& s, const size_t n) {
    return s.size() <= n ? s : "..." + s.substr(s.size() - n);
}

}

Pipeline::Pipeline(const config::Config& config,
                   std::shared_ptr<remote::Source> source,
                   std::shared_ptr<CursorStore> cursors,
                   std::shared_ptr<build::Executor> executor,
                   std::shared_ptr<mirror::Copier> copier)
    : remoteRoot_(config.remote.root),
      sync_(config.sync),
      build_(config.build),
      copyRules_(config.copy_rules),
      source_(std::move(source)),
      cursors_(std::move(cursors)),
      executor_(std::move(executor)),
      copier_(std::move(copier)),
      reconciler_(config.sync.local_base_path, config.remote.root,
                  {cursors_ ? cursors_->path() : config.sync.cursorPath()}) {
    if (!source_) throw std::invalid_argument("Pipeline requires a remote source");
    if (!cursors_) throw std::invalid_argument("Pipeline requires a cursor store");
    if (!executor_) throw std::invalid_argument("Pipeline requires a build executor");
    if (!copier_) throw std::invalid_argument("Pipeline requires a copier");
}

CycleReport Pipeline::run(const Trigger& trigger) {
    Cycle c;
    c.report.trigger = trigger;
    c.report.start();

    resolveMode(c);

    Registry::sync()->info("[Pipeline] Starting {} cycle for {} via {}",
                           to_string(c.report.mode), to_string(trigger), source_->name());

    const Stage stages[] = {
        {model::Stage::Listing,          [&] { list(c); }},
        {model::Stage::Reconciling,      [&] { reconcile(c); }},
        {model::Stage::Building,         [&] { buildSite(c); }},
        {model::Stage::Mirroring,        [&] { mirror(c); }},
        {model::Stage::CommittingCursor, [&] { commitCursor(c); }}
    };

    runStages(stages, c.report);
    if (!c.report.aborted()) c.report.stage = model::Stage::Done;
    c.report.stop();

    const auto& r = c.report;
    const auto summary = fmt::format(
        "listed={} fetched={} fetch_failures={} unchanged={} rejected={} deleted={} "
        "delete_failures={} dirs_pruned={} copy_rules_failed={} built={} cursor_committed={} ({:.2f}s)",
        r.listed, r.fetched, r.fetch_failures, r.unchanged, r.rejected, r.deleted,
        r.delete_failures, r.directories_pruned, r.copy_rules_failed, r.built, r.cursor_committed,
        r.durationSeconds());

    if (r.aborted())
        Registry::sync()->error("[Pipeline] Cycle aborted at {}: {} | {}", to_string(r.stage), r.error_message, summary);
    else
        Registry::sync()->info("[Pipeline] Cycle finished with {} | {}", to_string(r.outcome), summary);

    return c.report;
}

void Pipeline::runStages(const std::span<const Stage> stages, CycleReport& report) {
    for (const auto& [stage, fn] : stages) {
        report.stage = stage;
        try {
            fn();
        } catch (const std::exception& e) {
            Registry::sync()->error("[Pipeline:{}] {}", to_string(stage), e.what());
            report.abort(stage, e.what());
            break;
        }
    }
}

void Pipeline::resolveMode(Cycle& c) const {
    const auto& trigger = c.report.trigger;

    switch (trigger.type) {
    case Trigger::Type::ForceFullSync:
        c.report.mode = Mode::Full;
        return;
    case Trigger::Type::RemoteChangedWithCursor:
        if (!trigger.cursor.empty()) {
            c.report.mode = Mode::Incremental;
            c.startCursor = trigger.cursor;
            return;
        }
        Registry::sync()->warn("[Pipeline] Trigger carried an empty cursor, falling back to the stored one");
        break;
    case Trigger::Type::RemoteChanged:
        break;
    }

    if (const auto stored = cursors_->load()) {
        c.report.mode = Mode::Incremental;
        c.startCursor = *stored;
    } else {
        c.report.mode = Mode::Full;
    }
}

// ##########################################
// ################ Stages ##################
// ##########################################

void Pipeline::list(Cycle& c) const {
    if (c.report.mode == Mode::Full) c.listing = source_->list(remoteRoot_, true);
    else c.listing = source_->changesSince(c.startCursor);

    c.report.listed = c.listing.entries.size();
    Registry::sync()->debug("[Pipeline] Listed {} entr{} ({})", c.report.listed,
                            c.report.listed == 1 ? "y" : "ies", to_string(c.report.mode));

    if (c.report.mode == Mode::Incremental && c.listing.entries.empty()) {
        c.shortCircuit = true;
        Registry::sync()->info("[Pipeline] No remote changes since the last cursor");
    }
}

void Pipeline::reconcile(Cycle& c) const {
    if (c.shortCircuit) return;

    std::error_code ec;
    fs::create_directories(reconciler_.localBase(), ec);
    if (ec) throw std::runtime_error(fmt::format("Cannot create local base {}: {}",
                                                 reconciler_.localBase().string(), ec.message()));

    c.plan = reconciler_.plan(c.listing.entries, c.report.mode);
    c.report.unchanged = c.plan.unchanged;
    c.report.rejected = c.plan.rejected;

    const auto fetched = reconciler_.fetch(c.plan, *source_);
    c.report.fetched = fetched.fetched;
    c.report.fetch_failures = fetched.failed;

    if (c.plan.mode != Mode::Full) return;

    const auto pruned = reconciler_.prune(c.plan);
    c.report.deleted = pruned.deleted;
    c.report.delete_failures = pruned.failed;
    c.report.directories_pruned = pruned.directories_removed;
}

void Pipeline::buildSite(Cycle& c) const {
    if (c.shortCircuit) return;

    if (build_.command.empty()) {
        Registry::build()->info("[Pipeline] No build command configured, skipping build");
        return;
    }

    std::error_code ec;
    if (!fs::is_directory(build_.working_directory, ec)) {
        Registry::build()->warn("[Pipeline] Build directory {} does not exist, skipping build",
                                build_.working_directory.string());
        return;
    }

    Registry::build()->info("[Pipeline] Running '{}' in {}", build_.command, build_.working_directory.string());
    const auto result = executor_->run(build_.command, build_.working_directory);

    if (!result.output.empty())
        Registry::build()->debug("[Pipeline] Build output:\n{}", result.output);

    if (!result.ok())
        throw std::runtime_error(fmt::format("Build command exited with status {}: {}",
                                             result.exitCode, tail(result.output, 512)));

    c.report.built = true;
}

void Pipeline::mirror(Cycle& c) const {
    if (c.shortCircuit || copyRules_.empty()) return;

    for (const auto& res : copier_->apply(copyRules_))
        if (!res.ok) ++c.report.copy_rules_failed;
}

void Pipeline::commitCursor(Cycle& c) const {
    if (c.listing.cursor.empty()) {
        Registry::sync()->warn("[Pipeline] Remote returned no cursor, nothing to commit");
        return;
    }

    try {
        cursors_->save(c.listing.cursor);
        c.report.cursor_committed = true;
    } catch (const std::exception& e) {
        Registry::sync()->error("[Pipeline:{}] Failed to persist cursor: {}",
                                to_string(model::Stage::CommittingCursor), e.what());
        c.report.error_message = e.what();
        c.report.outcome = CycleReport::Outcome::PartialSuccess;
    }
}
