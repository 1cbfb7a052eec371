#pragma once

#include "sync/model/Plan.hpp"
#include "sync/model/Trigger.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mh::sync::model {

enum class Stage {
    Listing,
    Reconciling,
    Building,
    Mirroring,
    CommittingCursor,
    Done
};

struct CycleReport {
    enum class Outcome { Success, PartialSuccess, Aborted };

    Trigger trigger;
    Mode mode{Mode::Full};
    Stage stage{Stage::Listing};  // last stage entered
    Outcome outcome{Outcome::Success};

    uint64_t listed{0};
    uint64_t fetched{0};
    uint64_t fetch_failures{0};
    uint64_t unchanged{0};
    uint64_t rejected{0};
    uint64_t deleted{0};
    uint64_t delete_failures{0};
    uint64_t directories_pruned{0};
    uint64_t copy_rules_failed{0};

    bool built{false};
    bool cursor_committed{false};
    std::string error_message;

    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};

    [[nodiscard]] bool aborted() const { return outcome == Outcome::Aborted; }
    [[nodiscard]] bool hadEntityFailures() const {
        return fetch_failures > 0 || delete_failures > 0 || copy_rules_failed > 0;
    }
    [[nodiscard]] double durationSeconds() const;

    void start();
    void stop();
    void abort(Stage at, const std::string& message);
};

std::string to_string(Stage s);
std::string to_string(CycleReport::Outcome o);

void to_json(nlohmann::json& j, const CycleReport& r);

}
