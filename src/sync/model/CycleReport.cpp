#include "sync/model/CycleReport.hpp"

#include <nlohmann/json.hpp>

using namespace std::chrono;

namespace mh::sync::model {

void CycleReport::start() {
    started_at = system_clock::now();
    finished_at = {};
}

void CycleReport::stop() {
    finished_at = system_clock::now();
    if (outcome != Outcome::Aborted && hadEntityFailures()) outcome = Outcome::PartialSuccess;
}

void CycleReport::abort(const Stage at, const std::string& message) {
    stage = at;
    outcome = Outcome::Aborted;
    error_message = message;
}

double CycleReport::durationSeconds() const {
    if (finished_at < started_at) return 0.0;
    return duration_cast<duration<double>>(finished_at - started_at).count();
}

std::string to_string(const Stage s) {
    switch (s) {
    case Stage::Listing: return "listing";
    case Stage::Reconciling: return "reconciling";
    case Stage::Building: return "building";
    case Stage::Mirroring: return "mirroring";
    case Stage::CommittingCursor: return "committing_cursor";
    case Stage::Done: return "done";
    }
    return "unknown";
}

std::string to_string(const CycleReport::Outcome o) {
    switch (o) {
    case CycleReport::Outcome::Success: return "success";
    case CycleReport::Outcome::PartialSuccess: return "partial_success";
    case CycleReport::Outcome::Aborted: return "aborted";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const CycleReport& r) {
    j = {
        {"trigger", to_string(r.trigger.type)},
        {"mode", to_string(r.mode)},
        {"stage", to_string(r.stage)},
        {"outcome", to_string(r.outcome)},
        {"listed", r.listed},
        {"fetched", r.fetched},
        {"fetch_failures", r.fetch_failures},
        {"unchanged", r.unchanged},
        {"rejected", r.rejected},
        {"deleted", r.deleted},
        {"delete_failures", r.delete_failures},
        {"directories_pruned", r.directories_pruned},
        {"copy_rules_failed", r.copy_rules_failed},
        {"built", r.built},
        {"cursor_committed", r.cursor_committed},
        {"error", r.error_message},
        {"started_at", duration_cast<seconds>(r.started_at.time_since_epoch()).count()},
        {"duration_seconds", r.durationSeconds()}
    };
}

}
