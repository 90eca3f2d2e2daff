#include <gtest/gtest.h>

#include <stdexcept>

#include "core/AlignmentPanel.hpp"
#include "core/ProgressiveCoreTracker.hpp"
#include "core/SequenceCollapser.hpp"
#include "core/SiteClassifier.hpp"

using namespace PolyCore;

namespace {

PloidyCall haploid() {
    PloidyCall call;
    call.ploidy = 1;
    call.detected = 1;
    return call;
}

class ProgressiveCoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        panel.set_reference("Reference", "AAAA");
        panel.add_sample("s1", {"AAAT"}, haploid());
        panel.add_sample("s2", {"AANA"}, haploid());
        panel.add_sample("s3", {"NAAA"}, haploid());
        collapsed = SequenceCollapser().collapse(panel);
    }

    Classification classify(const ClassifierOptions& opts) const {
        return SiteClassifier(opts).classify(panel, collapsed);
    }

    static ClassifierOptions options(double min_gf, double min_cf) {
        ClassifierOptions opts;
        opts.thresholds.min_gf = min_gf;
        opts.thresholds.min_cf = min_cf;
        return opts;
    }

    AlignmentPanel panel;
    CollapsedPanel collapsed;
};

}  // namespace

TEST_F(ProgressiveCoreTest, TrajectoryShrinksAsSamplesAreAdmitted) {
    ClassifierOptions opts = options(0.7, 1.0);
    Classification classification = classify(opts);

    ProgressiveCoreTracker tracker(panel, collapsed, classification, opts);
    std::vector<CoreTrajectoryPoint> trajectory = tracker.run();

    ASSERT_EQ(trajectory.size(), 3u);
    EXPECT_EQ(trajectory[0].sample_id, "s1");
    EXPECT_EQ(trajectory[0].k, 1);
    EXPECT_DOUBLE_EQ(trajectory[0].core_fraction, 1.0);
    // s1 alone is a fixed difference from the reference at the last column
    EXPECT_EQ(trajectory[0].variant_sites, 1u);

    EXPECT_DOUBLE_EQ(trajectory[1].core_fraction, 0.75);
    // s1 carries T and s2 A at the last column
    EXPECT_EQ(trajectory[1].variant_sites, 1u);

    EXPECT_DOUBLE_EQ(trajectory[2].core_fraction, 0.5);
    EXPECT_EQ(trajectory[2].core_sites, 2u);

    // With every sample admitted the strict core equals the one-pass core
    EXPECT_EQ(trajectory.back().core_sites, classification.num_invariant + classification.num_variant);
}

TEST_F(ProgressiveCoreTest, DroppedSitesNeverReturn) {
    ClassifierOptions opts = options(0.7, 0.5);
    Classification classification = classify(opts);
    // Every column has 2 of 3 samples called, so the full panel keeps all four
    EXPECT_EQ(classification.num_excluded, 0u);

    // Admitting s3 first drops column 0 (0 of 1 called); it cannot come back later
    std::vector<int> order = {3, 1, 2};
    Classification reordered = classification;
    reordered.voting_rows = order;

    ProgressiveCoreTracker tracker(panel, collapsed, reordered, opts);
    std::vector<CoreTrajectoryPoint> trajectory = tracker.run();

    ASSERT_EQ(trajectory.size(), 3u);
    EXPECT_EQ(trajectory[0].sample_id, "s3");
    EXPECT_DOUBLE_EQ(trajectory[0].core_fraction, 0.75);
    for (size_t k = 1; k < trajectory.size(); ++k) {
        EXPECT_LE(trajectory[k].core_fraction, trajectory[k - 1].core_fraction);
    }
    EXPECT_DOUBLE_EQ(trajectory.back().core_fraction, 0.75);
}

TEST_F(ProgressiveCoreTest, AscendingMissingnessPutsCompleteSamplesFirst) {
    ClassifierOptions opts = options(0.7, 1.0);
    Classification classification = classify(opts);
    classification.voting_rows = {2, 3, 1};

    ProgressiveCoreTracker input(panel, collapsed, classification, opts, SampleOrder::INPUT);
    EXPECT_EQ(input.order(), (std::vector<int>{2, 3, 1}));

    // s1 is complete; s2 and s3 tie and keep their relative order
    ProgressiveCoreTracker sorted(panel, collapsed, classification, opts, SampleOrder::ASCENDING_MISSINGNESS);
    EXPECT_EQ(sorted.order(), (std::vector<int>{1, 2, 3}));
}

TEST_F(ProgressiveCoreTest, LazyStepsAndReset) {
    ClassifierOptions opts = options(0.7, 1.0);
    Classification classification = classify(opts);
    ProgressiveCoreTracker tracker(panel, collapsed, classification, opts);

    EXPECT_EQ(tracker.core_sites(), 4u);
    ASSERT_TRUE(tracker.has_next());
    CoreTrajectoryPoint first = tracker.next();
    EXPECT_EQ(first.k, 1);

    tracker.next();
    tracker.next();
    EXPECT_FALSE(tracker.has_next());
    EXPECT_THROW(tracker.next(), std::out_of_range);

    tracker.reset();
    EXPECT_TRUE(tracker.has_next());
    EXPECT_EQ(tracker.core_sites(), 4u);
    CoreTrajectoryPoint again = tracker.next();
    EXPECT_EQ(again.sample_id, first.sample_id);
    EXPECT_DOUBLE_EQ(again.core_fraction, first.core_fraction);
}

TEST_F(ProgressiveCoreTest, RequireReferenceBaseStartsWithoutMissingColumns) {
    AlignmentPanel gapped;
    gapped.set_reference("Reference", "A-AA");
    gapped.add_sample("s1", {"AAAA"}, haploid());
    CollapsedPanel gapped_collapsed = SequenceCollapser().collapse(gapped);

    ClassifierOptions opts = options(0.7, 1.0);
    opts.require_reference_base = true;
    Classification classification = SiteClassifier(opts).classify(gapped, gapped_collapsed);

    ProgressiveCoreTracker tracker(gapped, gapped_collapsed, classification, opts);
    EXPECT_EQ(tracker.core_sites(), 3u);
    EXPECT_DOUBLE_EQ(tracker.next().core_fraction, 0.75);
}
