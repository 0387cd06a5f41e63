#pragma once

#include <chrono>
#include <vector>

namespace wisp::core {

enum class LifecycleStage {
    Idle,
    ParsingHtml,
    ParsingCss,
    Styling,
    Layout,
    Complete,
};

const char* lifecycle_stage_name(LifecycleStage stage);

struct StageTimingEntry {
    LifecycleStage stage;
    std::chrono::steady_clock::time_point entered_at;
    double elapsed_since_prev_ms = 0.0;
};

struct LifecycleTrace {
    std::vector<StageTimingEntry> entries;

    void record(LifecycleStage stage);

    // Drops `stage`'s most recent entry and everything after it, so a
    // repeated pass replaces the previous one instead of appending.
    void rewind_to(LifecycleStage stage);

    std::vector<LifecycleStage> stages() const;
};

}  // namespace wisp::core
