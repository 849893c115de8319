#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <cstdint>
#include "types.hpp"
#include "unit.hpp"
#include "completion_tracker.hpp"
#include "usage_estimator.hpp"

class RunLog;

// Why a candidate was passed over before any size check
struct SkipReason {
    std::string reason;
    bool warn = false;              // log at WARN instead of DEBUG
};

// What makes a unit eligible and how big it is projected to be.
// One implementation per admission variant.
class AdmissionPolicy {
public:
    virtual ~AdmissionPolicy() = default;

    virtual const char* name() const = 0;

    // nullopt when the unit may be considered
    virtual std::optional<SkipReason> skip(const Unit& unit) = 0;

    // Projected footprint; MetadataMissing when it cannot be estimated
    virtual Result<double> project(const Unit& unit) = 0;
};

// Local processing: anything not fully processed; sized from sras_info.yaml
class LocalProcessingPolicy : public AdmissionPolicy {
public:
    LocalProcessingPolicy(CompletionTracker& tracker, const UsageEstimator& estimator);

    const char* name() const override { return "local"; }
    std::optional<SkipReason> skip(const Unit& unit) override;
    Result<double> project(const Unit& unit) override;

private:
    CompletionTracker& tracker_;
    const UsageEstimator& estimator_;
};

// Remote transfer: converted units with a submit script; sized from fq_gzs_info.yaml
class RemoteTransferPolicy : public AdmissionPolicy {
public:
    RemoteTransferPolicy(CompletionTracker& tracker, const UsageEstimator& estimator);

    const char* name() const override { return "remote"; }
    std::optional<SkipReason> skip(const Unit& unit) override;
    Result<double> project(const Unit& unit) override;

private:
    CompletionTracker& tracker_;
    const UsageEstimator& estimator_;
};

struct AdmissionDecision {
    std::string key;
    bool admitted = false;
    double projected = 0;           // 0 when never estimated
    double budget_before = 0;       // remaining budget when the decision was made
    std::string reason;
};

struct AdmissionResult {
    std::vector<Unit> admitted;
    std::vector<AdmissionDecision> decisions;
    double initial_budget = 0;
    double remaining_budget = 0;
    size_t projections = 0;         // how many candidates were sized

    std::vector<std::string> admitted_keys() const;
};

// Greedy first-fit selection. Candidates are walked in the given order; a
// unit is admitted when projected < remaining, and the scan continues past
// units that do not fit.
class AdmissionSelector {
public:
    explicit AdmissionSelector(RunLog& log);

    AdmissionResult select(const std::vector<Unit>& candidates,
                           int64_t budget,
                           const std::set<std::string>& already_admitted,
                           AdmissionPolicy& policy,
                           bool ignore_budget = false);

private:
    RunLog& log_;
};
