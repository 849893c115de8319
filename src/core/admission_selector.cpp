#include "admission_selector.hpp"
#include "capacity_model.hpp"
#include "constants.hpp"
#include "size_metadata.hpp"
#include "size_units.hpp"
#include <managers/run_log.hpp>
#include <fmt/format.h>

// ── Policies ────────────────────────────────────────────────

LocalProcessingPolicy::LocalProcessingPolicy(CompletionTracker& tracker,
                                             const UsageEstimator& estimator)
    : tracker_(tracker), estimator_(estimator) {}

std::optional<SkipReason> LocalProcessingPolicy::skip(const Unit& unit) {
    if (tracker_.classify(unit) == UnitStage::FullyProcessed) {
        return SkipReason{"already processed successfully", false};
    }
    return std::nullopt;
}

Result<double> LocalProcessingPolicy::project(const Unit& unit) {
    if (!unit.raw_inputs) {
        return Result<double>::Err(ErrorKind::MetadataMissing,
                                   "no sras_info.yaml, size unknown");
    }
    return Result<double>::Ok(estimator_.estimate(*unit.raw_inputs));
}

RemoteTransferPolicy::RemoteTransferPolicy(CompletionTracker& tracker,
                                           const UsageEstimator& estimator)
    : tracker_(tracker), estimator_(estimator) {}

std::optional<SkipReason> RemoteTransferPolicy::skip(const Unit& unit) {
    if (!tracker_.convert_complete(unit)) {
        return SkipReason{"sra2fastq not complete, no fastq.gz to transfer", false};
    }
    if (!tracker_.submit_script_present(unit)) {
        return SkipReason{fmt::format("{} doesn't exist", SUBMIT_SCRIPT_FILE), true};
    }
    if (scan_fastq_gz(unit.outdir).empty()) {
        return SkipReason{"no fastq.gz files found", true};
    }
    return std::nullopt;
}

Result<double> RemoteTransferPolicy::project(const Unit& unit) {
    auto total = fastq_gz_total(unit.outdir);
    if (total.is_err()) {
        return Result<double>::Err(total.kind, total.error);
    }
    return Result<double>::Ok(estimator_.estimate(total.value));
}

// ── Selector ────────────────────────────────────────────────

std::vector<std::string> AdmissionResult::admitted_keys() const {
    std::vector<std::string> keys;
    keys.reserve(admitted.size());
    for (const auto& u : admitted) keys.push_back(u.key);
    return keys;
}

AdmissionSelector::AdmissionSelector(RunLog& log) : log_(log) {}

AdmissionResult AdmissionSelector::select(const std::vector<Unit>& candidates,
                                          int64_t budget,
                                          const std::set<std::string>& already_admitted,
                                          AdmissionPolicy& policy,
                                          bool ignore_budget) {
    AdmissionResult result;
    result.initial_budget = static_cast<double>(budget);
    result.remaining_budget = result.initial_budget;

    if (!ignore_budget && budget_exhausted(budget)) {
        log_.info(fmt::format("{} free_to_use is {}, nothing can be admitted",
                              policy.name(), format_size(result.initial_budget)));
        return result;
    }

    for (const auto& unit : candidates) {
        AdmissionDecision d;
        d.key = unit.key;
        d.budget_before = result.remaining_budget;

        if (already_admitted.count(unit.key)) {
            d.reason = "already recorded";
            log_.debug(fmt::format("{} is recorded already, ignore it", unit.key));
            result.decisions.push_back(d);
            continue;
        }

        if (auto skip = policy.skip(unit)) {
            d.reason = skip->reason;
            log_.write(skip->warn ? RunLog::Level::Warn : RunLog::Level::Debug,
                       fmt::format("{}: {}, skip", unit.key, skip->reason));
            result.decisions.push_back(d);
            continue;
        }

        if (ignore_budget) {
            d.admitted = true;
            d.reason = "disk usage rule ignored";
            log_.info(fmt::format("{} admitted (disk usage rule ignored)", unit.key));
            result.admitted.push_back(unit);
            result.decisions.push_back(d);
            continue;
        }

        auto projected = policy.project(unit);
        if (projected.is_err()) {
            d.reason = projected.error;
            log_.warn(fmt::format("{}: {} ({}), skip", unit.key, projected.error,
                                  error_kind_name(projected.kind)));
            result.decisions.push_back(d);
            continue;
        }
        result.projections++;
        d.projected = projected.value;

        if (d.projected < result.remaining_budget) {
            d.admitted = true;
            d.reason = "fits";
            log_.info(fmt::format("{} ({}) fits {} free_to_use ({})", unit.key,
                                  format_size(d.projected), policy.name(),
                                  format_size(result.remaining_budget)));
            result.remaining_budget -= d.projected;
            result.admitted.push_back(unit);
        } else {
            d.reason = "does not fit";
            log_.debug(fmt::format("{} ({}) doesn't fit {} free_to_use ({})", unit.key,
                                   format_size(d.projected), policy.name(),
                                   format_size(result.remaining_budget)));
        }
        result.decisions.push_back(d);
    }

    return result;
}
