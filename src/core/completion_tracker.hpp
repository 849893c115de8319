#pragma once

#include <map>
#include <set>
#include <string>
#include "unit.hpp"

// Pipeline position of a unit, derived from the marker files in its directory.
// Stages are checked in order and each one needs every raw input done before
// the next is looked at.
enum class UnitStage {
    NotStarted,             // no metadata, or no download marker at all
    DownloadIncomplete,     // some but not all <sra>.download.COMPLETE
    ConvertIncomplete,      // downloads done, some <sra>.sra2fastq.COMPLETE missing
    SubmitScriptMissing,    // conversions done, 0_submit.sh absent
    AnalysisIncomplete,     // submit script present, rsem.COMPLETE absent
    FullyProcessed,
};

const char* stage_name(UnitStage stage);

class CompletionTracker {
public:
    CompletionTracker() = default;

    // Classify once per cycle; later calls for the same key return the cached stage.
    UnitStage classify(const Unit& unit);

    // Every raw input has its convert marker (transfer eligibility).
    // False when metadata is missing.
    bool convert_complete(const Unit& unit) const;

    bool submit_script_present(const Unit& unit) const;

    // Drop cached classifications (start of a new cycle).
    void reset() { cache_.clear(); }

    // A remote unit directory still needs space if it has no analysis marker
    // and holds something besides itself. `listing` is a full `find` of the tree.
    static bool remote_unit_needs_space(const std::string& unit_dir,
                                        const std::set<std::string>& listing);

private:
    std::map<std::string, UnitStage> cache_;

    UnitStage probe(const Unit& unit) const;
};
