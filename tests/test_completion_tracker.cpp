#include "test_support.hpp"
#include <core/completion_tracker.hpp>
#include <core/unit.hpp>

class CompletionTrackerTest : public TreeTest {
protected:
    const std::string key = "GSE100/homo_sapiens/GSM200";

    Unit unit() { return make_unit(top, top / key); }

    void download(size_t i) {
        touch(fs::path(key) / ("SRR" + std::to_string(1000 + i) + ".sra" + DOWNLOAD_FLAG_SUFFIX));
    }
    void convert(size_t i) {
        touch(fs::path(key) / ("SRR" + std::to_string(1000 + i) + ".sra" + CONVERT_FLAG_SUFFIX));
    }
};

TEST_F(CompletionTrackerTest, MissingMetadataIsNotStarted) {
    fs::create_directories(top / key);
    CompletionTracker tracker;
    EXPECT_EQ(tracker.classify(unit()), UnitStage::NotStarted);
    EXPECT_FALSE(tracker.convert_complete(unit()));
}

TEST_F(CompletionTrackerTest, NoMarkersIsNotStarted) {
    make_unit_dir(key, {100, 200});
    CompletionTracker tracker;
    EXPECT_EQ(tracker.classify(unit()), UnitStage::NotStarted);
}

TEST_F(CompletionTrackerTest, StagesAdvanceInOrder) {
    make_unit_dir(key, {100, 200});

    download(0);
    EXPECT_EQ(CompletionTracker().classify(unit()), UnitStage::DownloadIncomplete);

    download(1);
    EXPECT_EQ(CompletionTracker().classify(unit()), UnitStage::ConvertIncomplete);

    convert(0);
    convert(1);
    EXPECT_EQ(CompletionTracker().classify(unit()), UnitStage::SubmitScriptMissing);

    touch(fs::path(key) / SUBMIT_SCRIPT_FILE);
    EXPECT_EQ(CompletionTracker().classify(unit()), UnitStage::AnalysisIncomplete);

    touch(fs::path(key) / ANALYSIS_COMPLETE_FLAG);
    EXPECT_EQ(CompletionTracker().classify(unit()), UnitStage::FullyProcessed);
}

TEST_F(CompletionTrackerTest, OneMissingConvertMarkerHoldsWholeUnit) {
    make_unit_dir(key, {100, 200, 300});
    for (size_t i = 0; i < 3; i++) download(i);
    convert(0);
    convert(2);
    // later-stage markers do not matter while a conversion is missing
    touch(fs::path(key) / SUBMIT_SCRIPT_FILE);
    touch(fs::path(key) / ANALYSIS_COMPLETE_FLAG);

    CompletionTracker tracker;
    EXPECT_EQ(tracker.classify(unit()), UnitStage::ConvertIncomplete);
    EXPECT_FALSE(tracker.convert_complete(unit()));
}

TEST_F(CompletionTrackerTest, ClassificationIsCachedPerCycle) {
    make_unit_dir(key, {100});
    mark_converted(key, 1);
    touch(fs::path(key) / ANALYSIS_COMPLETE_FLAG);

    CompletionTracker tracker;
    EXPECT_EQ(tracker.classify(unit()), UnitStage::FullyProcessed);

    fs::remove(top / key / ANALYSIS_COMPLETE_FLAG);
    EXPECT_EQ(tracker.classify(unit()), UnitStage::FullyProcessed);

    tracker.reset();
    EXPECT_EQ(tracker.classify(unit()), UnitStage::AnalysisIncomplete);
}

TEST_F(CompletionTrackerTest, FullyProcessedStaysFullyProcessed) {
    make_unit_dir(key, {100, 200});
    mark_converted(key, 2);
    touch(fs::path(key) / ANALYSIS_COMPLETE_FLAG);

    for (int i = 0; i < 3; i++) {
        CompletionTracker tracker;
        EXPECT_EQ(tracker.classify(unit()), UnitStage::FullyProcessed);
    }
}

TEST_F(CompletionTrackerTest, ConvertCompleteForTransfer) {
    make_unit_dir(key, {100, 200});
    CompletionTracker tracker;
    EXPECT_FALSE(tracker.convert_complete(unit()));
    mark_converted(key, 2);
    EXPECT_TRUE(tracker.convert_complete(unit()));
    EXPECT_TRUE(tracker.submit_script_present(unit()));
}

TEST(RemoteUnitNeedsSpace, CompletedUnitIsExcluded) {
    std::set<std::string> listing = {
        "/r/GSE1/hs/GSM1",
        "/r/GSE1/hs/GSM1/a.fastq.gz",
        "/r/GSE1/hs/GSM1/rsem.COMPLETE",
    };
    EXPECT_FALSE(CompletionTracker::remote_unit_needs_space("/r/GSE1/hs/GSM1", listing));
}

TEST(RemoteUnitNeedsSpace, EmptyDirectoryIsExcluded) {
    std::set<std::string> listing = {
        "/r/GSE1/hs/GSM1",
        "/r/GSE1/hs/GSM10",
        "/r/GSE1/hs/GSM10/a.fastq.gz",
    };
    EXPECT_FALSE(CompletionTracker::remote_unit_needs_space("/r/GSE1/hs/GSM1", listing));
    EXPECT_TRUE(CompletionTracker::remote_unit_needs_space("/r/GSE1/hs/GSM10", listing));
}
