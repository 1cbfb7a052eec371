#pragma once

#include "config/Config.hpp"
#include "sync/Reconciler.hpp"
#include "sync/model/CycleReport.hpp"
#include "remote/Source.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>

namespace mh::build { class Executor; }
namespace mh::mirror { class Copier; }

namespace mh::sync {

class CursorStore;

/**
 * One reconciliation cycle end to end:
 * Listing -> Reconciling -> Building -> Mirroring -> CommittingCursor.
 *
 * Listing and Building failures abort the cycle and leave the stored cursor
 * untouched, so the next trigger starts from the same state. Per-file and
 * per-rule failures are counted in the report and never abort.
 *
 * Not safe for concurrent run() calls; the EventLoop serializes them.
 */
class Pipeline {
public:
    Pipeline(const config::Config& config,
             std::shared_ptr<remote::Source> source,
             std::shared_ptr<CursorStore> cursors,
             std::shared_ptr<build::Executor> executor,
             std::shared_ptr<mirror::Copier> copier);

    model::CycleReport run(const model::Trigger& trigger);

    [[nodiscard]] const Reconciler& reconciler() const { return reconciler_; }

private:
    struct Stage {
        model::Stage stage;
        std::function<void()> fn;
    };

    struct Cycle {
        model::CycleReport report;
        std::string startCursor;
        remote::Listing listing;
        model::Plan plan;
        bool shortCircuit{false};
    };

    std::string remoteRoot_;
    config::SyncConfig sync_;
    config::BuildConfig build_;
    std::vector<config::CopyRule> copyRules_;

    std::shared_ptr<remote::Source> source_;
    std::shared_ptr<CursorStore> cursors_;
    std::shared_ptr<build::Executor> executor_;
    std::shared_ptr<mirror::Copier> copier_;

    Reconciler reconciler_;

    void resolveMode(Cycle& c) const;

    void list(Cycle& c) const;
    void reconcile(Cycle& c) const;
    void buildSite(Cycle& c) const;
    void mirror(Cycle& c) const;
    void commitCursor(Cycle& c) const;

    static void runStages(std::span<const Stage> stages, model::CycleReport& report);
};

}
