#include "wisp/core/lifecycle.h"

#include <algorithm>
#include <iterator>

namespace wisp::core {

const char* lifecycle_stage_name(LifecycleStage stage) {
    switch (stage) {
        case LifecycleStage::Idle:        return "idle";
        case LifecycleStage::ParsingHtml: return "parsing-html";
        case LifecycleStage::ParsingCss:  return "parsing-css";
        case LifecycleStage::Styling:     return "styling";
        case LifecycleStage::Layout:      return "layout";
        case LifecycleStage::Complete:    return "complete";
    }
    return "unknown";
}

void LifecycleTrace::record(LifecycleStage stage) {
    StageTimingEntry entry;
    entry.stage = stage;
    entry.entered_at = std::chrono::steady_clock::now();
    entry.elapsed_since_prev_ms = 0.0;

    if (!entries.empty()) {
        const auto delta = entry.entered_at - entries.back().entered_at;
        entry.elapsed_since_prev_ms =
            std::chrono::duration<double, std::milli>(delta).count();
    }

    entries.push_back(entry);
}

void LifecycleTrace::rewind_to(LifecycleStage stage) {
    const auto last = std::find_if(entries.rbegin(), entries.rend(),
                                   [stage](const StageTimingEntry& entry) {
                                       return entry.stage == stage;
                                   });
    if (last != entries.rend()) {
        entries.erase(std::prev(last.base()), entries.end());
    }
}

std::vector<LifecycleStage> LifecycleTrace::stages() const {
    std::vector<LifecycleStage> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(entry.stage);
    }
    return result;
}

}  // namespace wisp::core
