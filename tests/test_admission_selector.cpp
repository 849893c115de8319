#include "test_support.hpp"
#include <core/admission_selector.hpp>
#include <core/unit.hpp>
#include <managers/run_log.hpp>

// Projects a fixed size per key
class FixedPolicy : public AdmissionPolicy {
public:
    std::map<std::string, double> sizes;
    std::set<std::string> finished;
    int project_calls = 0;

    const char* name() const override { return "fixed"; }

    std::optional<SkipReason> skip(const Unit& unit) override {
        if (finished.count(unit.key)) return SkipReason{"finished", false};
        return std::nullopt;
    }

    Result<double> project(const Unit& unit) override {
        project_calls++;
        auto it = sizes.find(unit.key);
        if (it == sizes.end()) {
            return Result<double>::Err(ErrorKind::MetadataMissing, "no size");
        }
        return Result<double>::Ok(it->second);
    }
};

static std::vector<Unit> units_named(const std::vector<std::string>& keys) {
    std::vector<Unit> units;
    for (const auto& k : keys) {
        Unit u;
        u.key = k;
        units.push_back(u);
    }
    return units;
}

class AdmissionSelectorTest : public ::testing::Test {
protected:
    RunLog log;
    AdmissionSelector selector{log};
    FixedPolicy policy;
};

TEST_F(AdmissionSelectorTest, GreedyContinuesPastUnitThatDoesNotFit) {
    policy.sizes = {{"u1", 500}, {"u2", 50}, {"u3", 2000}, {"u4", 10}};
    auto result = selector.select(units_named({"u1", "u2", "u3", "u4"}), 600, {}, policy);

    EXPECT_EQ(result.admitted_keys(), (std::vector<std::string>{"u1", "u2", "u4"}));
    EXPECT_DOUBLE_EQ(result.remaining_budget, 40.0);
    ASSERT_EQ(result.decisions.size(), 4u);
    EXPECT_FALSE(result.decisions[2].admitted);
    EXPECT_DOUBLE_EQ(result.decisions[2].projected, 2000.0);
    EXPECT_DOUBLE_EQ(result.decisions[2].budget_before, 50.0);
}

TEST_F(AdmissionSelectorTest, RemainingBudgetIsInitialMinusAdmitted) {
    policy.sizes = {{"a", 120}, {"b", 300}, {"c", 90}, {"d", 400}};
    auto result = selector.select(units_named({"a", "b", "c", "d"}), 600, {}, policy);

    double admitted_total = 0;
    for (const auto& d : result.decisions) {
        if (d.admitted) admitted_total += d.projected;
    }
    EXPECT_DOUBLE_EQ(result.remaining_budget, result.initial_budget - admitted_total);
    EXPECT_GE(result.remaining_budget, 0.0);
}

TEST_F(AdmissionSelectorTest, ExactFitIsRejected) {
    policy.sizes = {{"a", 600}};
    auto result = selector.select(units_named({"a"}), 600, {}, policy);
    EXPECT_TRUE(result.admitted.empty());
}

TEST_F(AdmissionSelectorTest, SameInputsSameSelection) {
    policy.sizes = {{"a", 300}, {"b", 500}, {"c", 100}};
    auto units = units_named({"a", "b", "c"});
    auto first = selector.select(units, 700, {}, policy);
    auto second = selector.select(units, 700, {}, policy);
    EXPECT_EQ(first.admitted_keys(), second.admitted_keys());
    EXPECT_EQ(first.admitted_keys(), (std::vector<std::string>{"a", "c"}));
}

TEST_F(AdmissionSelectorTest, RecordedKeysAreNeverAdmitted) {
    policy.sizes = {{"a", 1}, {"b", 1}, {"c", 1}};
    auto result = selector.select(units_named({"a", "b", "c"}), 1000, {"b"}, policy);
    EXPECT_EQ(result.admitted_keys(), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(result.projections, 2u);
}

TEST_F(AdmissionSelectorTest, NonPositiveBudgetSizesNothing) {
    policy.sizes = {{"a", 1}, {"b", 1}};
    auto units = units_named({"a", "b"});

    auto zero = selector.select(units, 0, {}, policy);
    auto negative = selector.select(units, -5000, {}, policy);

    EXPECT_TRUE(zero.admitted.empty());
    EXPECT_TRUE(negative.admitted.empty());
    EXPECT_TRUE(zero.decisions.empty());
    EXPECT_EQ(zero.projections, 0u);
    EXPECT_EQ(policy.project_calls, 0);
}

TEST_F(AdmissionSelectorTest, SkippedAndUnsizedUnitsDoNotAbort) {
    policy.sizes = {{"a", 10}, {"c", 10}};
    policy.finished = {"b"};
    auto result = selector.select(units_named({"a", "b", "x", "c"}), 100, {}, policy);

    EXPECT_EQ(result.admitted_keys(), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(result.decisions[1].reason, "finished");
    EXPECT_EQ(result.decisions[2].reason, "no size");
}

TEST_F(AdmissionSelectorTest, IgnoreBudgetAdmitsWithoutSizing) {
    policy.sizes = {{"a", 1e12}};
    policy.finished = {"b"};
    auto result = selector.select(units_named({"a", "b", "c"}), -1, {}, policy, true);
    EXPECT_EQ(result.admitted_keys(), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(policy.project_calls, 0);
}

// Real policy over an on-disk tree
class LocalAdmissionTest : public TreeTest {};

TEST_F(LocalAdmissionTest, ThreeUnitScenario) {
    make_unit_dir("GSE1/homo_sapiens/GSM1", {600000000, 400000000});    // A: 1.0e9
    make_unit_dir("GSE1/homo_sapiens/GSM2", {2000000000});              // B: 2.0e9
    make_unit_dir("GSE1/homo_sapiens/GSM3", {500000000});               // C: 0.5e9

    RunLog log;
    CompletionTracker tracker;
    UsageEstimator estimator(1.5);
    LocalProcessingPolicy policy(tracker, estimator);
    AdmissionSelector selector(log);

    auto result = selector.select(discover_units(top), 3000000000LL, {}, policy);

    EXPECT_EQ(result.admitted_keys(),
              (std::vector<std::string>{"GSE1/homo_sapiens/GSM1", "GSE1/homo_sapiens/GSM3"}));
    EXPECT_DOUBLE_EQ(result.decisions[0].projected, 1.5e9);
    EXPECT_DOUBLE_EQ(result.decisions[1].projected, 3.0e9);
    EXPECT_DOUBLE_EQ(result.decisions[1].budget_before, 1.5e9);
    EXPECT_DOUBLE_EQ(result.decisions[2].projected, 0.75e9);
    EXPECT_DOUBLE_EQ(result.remaining_budget, 0.75e9);
}

TEST_F(LocalAdmissionTest, FullyProcessedAndUnsizedUnitsAreSkipped) {
    make_unit_dir("GSE1/homo_sapiens/GSM1", {100});
    mark_converted("GSE1/homo_sapiens/GSM1", 1);
    touch("GSE1/homo_sapiens/GSM1/rsem.COMPLETE");
    fs::create_directories(top / "GSE1/homo_sapiens/GSM2");   // no sras_info.yaml
    make_unit_dir("GSE1/homo_sapiens/GSM3", {100});

    RunLog log;
    CompletionTracker tracker;
    UsageEstimator estimator(2.0);
    LocalProcessingPolicy policy(tracker, estimator);
    AdmissionSelector selector(log);

    auto result = selector.select(discover_units(top), 1000, {}, policy);
    EXPECT_EQ(result.admitted_keys(), (std::vector<std::string>{"GSE1/homo_sapiens/GSM3"}));
    EXPECT_EQ(result.projections, 1u);
}

TEST_F(LocalAdmissionTest, TransferPolicyNeedsConversionAndSubmitScript) {
    make_unit_dir("GSE1/mus_musculus/GSM1", {100});          // not converted
    make_unit_dir("GSE1/mus_musculus/GSM2", {100});
    mark_converted("GSE1/mus_musculus/GSM2", 1);
    fs::remove(top / "GSE1/mus_musculus/GSM2" / SUBMIT_SCRIPT_FILE);
    make_unit_dir("GSE1/mus_musculus/GSM3", {100});
    mark_converted("GSE1/mus_musculus/GSM3", 1);
    write_fq_gz_info("GSE1/mus_musculus/GSM3", 40);

    RunLog log;
    CompletionTracker tracker;
    UsageEstimator estimator(5.0);
    RemoteTransferPolicy policy(tracker, estimator);
    AdmissionSelector selector(log);

    auto result = selector.select(discover_units(top), 1000, {}, policy);
    EXPECT_EQ(result.admitted_keys(), (std::vector<std::string>{"GSE1/mus_musculus/GSM3"}));
    EXPECT_DOUBLE_EQ(result.decisions[2].projected, 200.0);
    EXPECT_EQ(result.decisions[1].reason, std::string(SUBMIT_SCRIPT_FILE) + " doesn't exist");
}

TEST_F(LocalAdmissionTest, TransferPolicySkipsUnitWithoutFastqGz) {
    make_unit_dir("GSE1/mus_musculus/GSM1", {100});
    mark_converted("GSE1/mus_musculus/GSM1", 1);

    RunLog log;
    CompletionTracker tracker;
    UsageEstimator estimator(5.0);
    RemoteTransferPolicy policy(tracker, estimator);
    AdmissionSelector selector(log);

    auto result = selector.select(discover_units(top), 1000, {}, policy);
    EXPECT_TRUE(result.admitted.empty());
    EXPECT_EQ(result.projections, 0u);
    ASSERT_EQ(result.decisions.size(), 1u);
    EXPECT_EQ(result.decisions[0].reason, "no fastq.gz files found");
    EXPECT_FALSE(fs::exists(top / "GSE1/mus_musculus/GSM1" / FQ_GZ_INFO_FILE));
}
