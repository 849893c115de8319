#include "completion_tracker.hpp"
#include "constants.hpp"
#include <system_error>

const char* stage_name(UnitStage stage) {
    switch (stage) {
        case UnitStage::NotStarted:          return "not-started";
        case UnitStage::DownloadIncomplete:  return "download-incomplete";
        case UnitStage::ConvertIncomplete:   return "convert-incomplete";
        case UnitStage::SubmitScriptMissing: return "submit-script-missing";
        case UnitStage::AnalysisIncomplete:  return "analysis-incomplete";
        case UnitStage::FullyProcessed:      return "fully-processed";
    }
    return "unknown";
}

static bool marker_exists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

static size_t count_markers(const Unit& unit, const char* suffix) {
    size_t present = 0;
    for (const auto& in : *unit.raw_inputs) {
        if (marker_exists(unit.outdir / (in.basename() + suffix))) present++;
    }
    return present;
}

UnitStage CompletionTracker::classify(const Unit& unit) {
    auto it = cache_.find(unit.key);
    if (it != cache_.end()) return it->second;
    UnitStage stage = probe(unit);
    cache_[unit.key] = stage;
    return stage;
}

UnitStage CompletionTracker::probe(const Unit& unit) const {
    if (!unit.raw_inputs) return UnitStage::NotStarted;

    size_t total = unit.raw_inputs->size();
    size_t downloaded = count_markers(unit, DOWNLOAD_FLAG_SUFFIX);
    if (downloaded == 0 && total > 0) return UnitStage::NotStarted;
    if (downloaded < total) return UnitStage::DownloadIncomplete;

    if (count_markers(unit, CONVERT_FLAG_SUFFIX) < total) return UnitStage::ConvertIncomplete;
    if (!submit_script_present(unit)) return UnitStage::SubmitScriptMissing;
    if (!marker_exists(unit.outdir / ANALYSIS_COMPLETE_FLAG)) return UnitStage::AnalysisIncomplete;
    return UnitStage::FullyProcessed;
}

bool CompletionTracker::convert_complete(const Unit& unit) const {
    if (!unit.raw_inputs || unit.raw_inputs->empty()) return false;
    return count_markers(unit, CONVERT_FLAG_SUFFIX) == unit.raw_inputs->size();
}

bool CompletionTracker::submit_script_present(const Unit& unit) const {
    return marker_exists(unit.outdir / SUBMIT_SCRIPT_FILE);
}

bool CompletionTracker::remote_unit_needs_space(const std::string& unit_dir,
                                                const std::set<std::string>& listing) {
    if (listing.count(unit_dir + "/" + ANALYSIS_COMPLETE_FLAG)) return false;

    // Anything under the directory besides the directory entry itself
    std::string prefix = unit_dir + "/";
    auto next = listing.lower_bound(prefix);
    return next != listing.end() && next->compare(0, prefix.size(), prefix) == 0;
}
