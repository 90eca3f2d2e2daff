/**
 * @file test_site_classifier.cpp
 * @brief Unit tests for site calls, tallies and the one-pass classifier
 */

#include <gtest/gtest.h>

#include "core/AlignmentPanel.hpp"
#include "core/Errors.hpp"
#include "core/Expander.hpp"
#include "core/SequenceCollapser.hpp"
#include "core/SiteClassifier.hpp"

using namespace PolyCore;

namespace {

PloidyCall ploidy(int p) {
    PloidyCall call;
    call.ploidy = p;
    call.detected = p;
    return call;
}

ClassifierOptions options(double min_gf, double min_cf, double min_pf, int min_pn) {
    ClassifierOptions opts;
    opts.thresholds.min_gf = min_gf;
    opts.thresholds.min_cf = min_cf;
    opts.thresholds.min_pf = min_pf;
    opts.thresholds.min_pn = min_pn;
    return opts;
}

Classification classify(const AlignmentPanel& panel, const ClassifierOptions& opts) {
    CollapsedPanel collapsed = SequenceCollapser().collapse(panel);
    return SiteClassifier(opts).classify(panel, collapsed);
}

}  // namespace

// ============================================================================
// Site calls and tallies
// ============================================================================

TEST(SiteTallyTest, CallSiteRespectsGenomeFraction) {
    // Tetraploid with one copy missing: 3/4 observed
    const char symbols[] = {'A', 'A', 'T', 'N'};
    SampleSiteCall strict = call_site(symbols, 4, 4, 0.9);
    EXPECT_EQ(strict.present, 3);
    EXPECT_FALSE(strict.called);

    SampleSiteCall loose = call_site(symbols, 4, 4, 0.75);
    EXPECT_TRUE(loose.called);
    EXPECT_EQ(loose.counts[0], 2);
    EXPECT_EQ(loose.counts[3], 1);
}

TEST(SiteTallyTest, NothingObservedIsNeverCalled) {
    const char symbols[] = {'N'};
    EXPECT_FALSE(call_site(symbols, 1, 2, 0.0).called);
}

TEST(SiteTallyTest, MajorAlleleTieGoesToReference) {
    SiteTally tally;
    const char a[] = {'A'};
    const char t[] = {'T'};
    tally = admit(tally, call_site(a, 1, 1, 1.0), 1);
    tally = admit(tally, call_site(t, 1, 1, 1.0), 1);

    CoreThresholds thresholds;
    SiteStat with_t_ref = classify_site(0, tally, 2, 'T', thresholds);
    EXPECT_EQ(with_t_ref.major_allele, 'T');
    EXPECT_EQ(with_t_ref.alt_allele, 'A');

    SiteStat with_n_ref = classify_site(0, tally, 2, 'N', thresholds);
    EXPECT_EQ(with_n_ref.major_allele, 'A');
    EXPECT_EQ(with_n_ref.alt_allele, 'T');
}

TEST(SiteTallyTest, ThresholdsAreValidated) {
    CoreThresholds thresholds;
    thresholds.min_cf = 1.5;
    EXPECT_THROW(thresholds.validate(), ThresholdRangeError);

    thresholds.min_cf = 0.5;
    thresholds.min_pn = -1;
    EXPECT_THROW(thresholds.validate(), ThresholdRangeError);
}

// ============================================================================
// Classification
// ============================================================================

TEST(SiteClassifierTest, SingleVariantAmongHaploids) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AAAAAAAAAA");
    panel.add_sample("sample1", {"AAAAAAAAAA"}, ploidy(1));
    panel.add_sample("sample2", {"AAAAAAAAAT"}, ploidy(1));

    Classification result = classify(panel, options(1.0, 1.0, 0.0, 1));

    EXPECT_EQ(result.voting_samples, 2);
    EXPECT_EQ(result.num_invariant, 9u);
    EXPECT_EQ(result.num_variant, 1u);
    EXPECT_EQ(result.num_excluded, 0u);

    const SiteStat& site = result.sites[9];
    EXPECT_EQ(site.label, SiteClass::CORE_VARIANT);
    EXPECT_EQ(site.major_allele, 'A');
    EXPECT_EQ(site.alt_allele, 'T');
    EXPECT_DOUBLE_EQ(site.alt_fraction, 0.5);
    EXPECT_EQ(site.alt_sample_count, 1);

    EXPECT_EQ(result.positions(SiteSet::CORE_VARIANT), (std::vector<size_t>{9}));
    EXPECT_EQ(result.positions(SiteSet::CORE_ALL).size(), 10u);

    auto composition = result.invariant_composition();
    EXPECT_EQ(composition[0], 9u);
    EXPECT_EQ(composition[3], 0u);
}

TEST(SiteClassifierTest, MinPnDemotesRareVariant) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AAAAAAAAAA");
    panel.add_sample("sample1", {"AAAAAAAAAA"}, ploidy(1));
    panel.add_sample("sample2", {"AAAAAAAAAT"}, ploidy(1));

    Classification result = classify(panel, options(1.0, 1.0, 0.0, 2));
    EXPECT_EQ(result.num_variant, 0u);
    EXPECT_EQ(result.sites[9].label, SiteClass::CORE_INVARIANT);
}

TEST(SiteClassifierTest, MinPfDemotesLowFrequencyVariant) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AAAA");
    panel.add_sample("s1", {"AAAA"}, ploidy(1));
    panel.add_sample("s2", {"AAAA"}, ploidy(1));
    panel.add_sample("s3", {"AAAA"}, ploidy(1));
    panel.add_sample("s4", {"AAAC"}, ploidy(1));

    EXPECT_EQ(classify(panel, options(1.0, 1.0, 0.25, 0)).sites[3].label, SiteClass::CORE_VARIANT);
    EXPECT_EQ(classify(panel, options(1.0, 1.0, 0.3, 0)).sites[3].label, SiteClass::CORE_INVARIANT);
}

TEST(SiteClassifierTest, LowGenomeFractionSampleDoesNotVote) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AAAAAAAAAA");
    panel.add_sample("good1", {"AAAAAAAAAA"}, ploidy(1));
    panel.add_sample("half", {"AAAAANNNNN"}, ploidy(1));
    panel.add_sample("good2", {"AAAAAAAAAA"}, ploidy(1));

    CollapsedPanel collapsed = SequenceCollapser().collapse(panel);
    Classification result = SiteClassifier(options(0.9, 1.0, 0.0, 0)).classify(panel, collapsed);

    EXPECT_EQ(result.voting_rows, (std::vector<int>{1, 3}));
    EXPECT_EQ(result.voting_samples, 2);

    const int half_profile = collapsed.row_profile[2];
    EXPECT_FALSE(result.profile_passes_gf[half_profile]);
    EXPECT_DOUBLE_EQ(result.profile_genome_fraction[half_profile], 0.5);
    EXPECT_EQ(result.profile_missing_copies[half_profile], 5u);

    // Sites where "half" is missing still reach min-cf = 1 over the two voters
    EXPECT_EQ(result.num_invariant, 10u);
    EXPECT_DOUBLE_EQ(result.sites[7].core_fraction, 1.0);

    // Site coverage still counts the non-voting sample
    EXPECT_NEAR(result.sites[7].genome_fraction, 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(result.sites[2].genome_fraction, 1.0);
}

TEST(SiteClassifierTest, MinCfExcludesPoorlyCalledSites) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "ACGT");
    panel.add_sample("s1", {"ACGT"}, ploidy(1));
    panel.add_sample("s2", {"ACG-"}, ploidy(1));
    panel.add_sample("s3", {"ACGT"}, ploidy(1));

    Classification strict = classify(panel, options(0.0, 1.0, 0.0, 0));
    EXPECT_EQ(strict.sites[3].label, SiteClass::EXCLUDED);
    EXPECT_NEAR(strict.sites[3].core_fraction, 2.0 / 3.0, 1e-12);

    Classification soft = classify(panel, options(0.0, 0.6, 0.0, 0));
    EXPECT_EQ(soft.sites[3].label, SiteClass::CORE_INVARIANT);
}

TEST(SiteClassifierTest, PolyploidGenotypesAreDecodedByDosage) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AAA");
    // Column 1: R on a diploid is A/G; column 2: R on a tetraploid is unresolvable
    panel.add_sample("dip", {"ARA"}, ploidy(2));
    panel.add_sample("tet", {"AAR"}, ploidy(4));

    // Genome fraction of the tetraploid is 8/12
    Classification result = classify(panel, options(0.6, 1.0, 0.0, 0));
    EXPECT_EQ(result.voting_samples, 2);

    EXPECT_EQ(result.sites[0].label, SiteClass::CORE_INVARIANT);
    EXPECT_EQ(result.sites[1].label, SiteClass::CORE_VARIANT);
    EXPECT_EQ(result.sites[1].alt_allele, 'G');
    EXPECT_EQ(result.sites[1].called_copies, 6);
    EXPECT_DOUBLE_EQ(result.sites[1].alt_fraction, 1.0 / 6.0);
    // The tetraploid is not called at column 2
    EXPECT_EQ(result.sites[2].called_samples, 1);
    EXPECT_EQ(result.sites[2].label, SiteClass::EXCLUDED);
}

TEST(SiteClassifierTest, ReferenceVotesOnlyWhenIncluded) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AAAA");
    panel.add_sample("s1", {"AAAT"}, ploidy(1));
    panel.add_sample("s2", {"AAAT"}, ploidy(1));

    Classification without = classify(panel, options(1.0, 1.0, 0.0, 0));
    EXPECT_EQ(without.voting_samples, 2);
    EXPECT_EQ(without.sites[3].major_allele, 'T');
    EXPECT_EQ(without.sites[3].alt_allele, 'N');
    EXPECT_TRUE(without.sites[3].fixed_difference);
    EXPECT_EQ(without.sites[3].label, SiteClass::CORE_VARIANT);
    EXPECT_EQ(SiteClassifier::effective_ref(without.sites[3]), 'A');

    ClassifierOptions opts = options(1.0, 1.0, 0.0, 0);
    opts.include_reference = true;
    Classification with = classify(panel, opts);
    EXPECT_EQ(with.voting_samples, 3);
    EXPECT_EQ(with.sites[3].label, SiteClass::CORE_VARIANT);
    EXPECT_EQ(with.sites[3].alt_allele, 'A');
    EXPECT_FALSE(with.sites[3].fixed_difference);
}

TEST(SiteClassifierTest, FixedDifferenceFromReferenceIsVariant) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AAAA");
    panel.add_sample("s1", {"AAAT"}, ploidy(1));
    panel.add_sample("s2", {"AAAT"}, ploidy(1));

    CollapsedPanel collapsed = SequenceCollapser().collapse(panel);
    Classification result = SiteClassifier(options(1.0, 1.0, 0.0, 1)).classify(panel, collapsed);

    EXPECT_EQ(result.num_invariant, 3u);
    EXPECT_EQ(result.num_variant, 1u);
    EXPECT_EQ(result.sites[3].label, SiteClass::CORE_VARIANT);
    EXPECT_EQ(result.positions(SiteSet::CORE_VARIANT), (std::vector<size_t>{3}));

    // The T column is not a constant of the reference base
    auto composition = result.invariant_composition();
    EXPECT_EQ(composition[0], 3u);
    EXPECT_EQ(composition[3], 0u);

    const int profile = collapsed.row_profile[1];
    EXPECT_EQ(result.profile_counts[profile].variant_sites, 1u);
    EXPECT_EQ(result.profile_counts[collapsed.row_profile[0]].variant_sites, 0u);

    // Too few carriers for min-pn keeps it constant
    Classification rare = SiteClassifier(options(1.0, 1.0, 0.0, 3)).classify(panel, collapsed);
    EXPECT_EQ(rare.sites[3].label, SiteClass::CORE_INVARIANT);
}

TEST(SiteClassifierTest, TiedAlternatesGoToLowestRank) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "A");
    panel.add_sample("s1", {"A"}, ploidy(1));
    panel.add_sample("s2", {"A"}, ploidy(1));
    panel.add_sample("s3", {"G"}, ploidy(1));
    panel.add_sample("s4", {"C"}, ploidy(1));

    CollapsedPanel collapsed = SequenceCollapser().collapse(panel);
    Classification result = SiteClassifier(options(1.0, 1.0, 0.0, 1)).classify(panel, collapsed);

    const SiteStat& site = result.sites[0];
    EXPECT_EQ(site.label, SiteClass::CORE_VARIANT);
    EXPECT_EQ(site.major_allele, 'A');
    EXPECT_EQ(site.alt_allele, 'C');
    EXPECT_EQ(site.alt_alleles, "CG");
    EXPECT_DOUBLE_EQ(site.alt_fraction, 0.25);
    EXPECT_EQ(site.alt_sample_count, 1);

    Expander expander(panel, collapsed);
    ExpandedAlignment variants = expander.expand_sites(result, SiteSet::CORE_VARIANT, {0, 1, 2, 3, 4});
    std::vector<VariantRecord> records = Expander::variant_records(result, variants);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].ref, 'A');
    EXPECT_EQ(records[0].alts, (std::vector<char>{'C', 'G'}));
    EXPECT_EQ(records[0].genotypes, (std::vector<std::vector<int>>{{0}, {0}, {0}, {2}, {1}}));
}

TEST(SiteClassifierTest, RequireReferenceBase) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AN-A");
    panel.add_sample("s1", {"AAAA"}, ploidy(1));

    EXPECT_EQ(classify(panel, options(0.0, 1.0, 0.0, 0)).num_excluded, 0u);

    ClassifierOptions opts = options(0.0, 1.0, 0.0, 0);
    opts.require_reference_base = true;
    Classification result = classify(panel, opts);
    EXPECT_EQ(result.num_excluded, 2u);
    EXPECT_EQ(result.sites[1].label, SiteClass::EXCLUDED);
    EXPECT_EQ(result.sites[3].label, SiteClass::CORE_INVARIANT);
}

TEST(SiteClassifierTest, NoVotingSampleExcludesEverySite) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "AAAA");
    panel.add_sample("s1", {"NNNA"}, ploidy(1));

    Classification result = classify(panel, options(0.9, 0.5, 0.0, 0));
    EXPECT_EQ(result.voting_samples, 0);
    EXPECT_EQ(result.num_excluded, 4u);
}

TEST(SiteClassifierTest, ThreadCountDoesNotChangeLabels) {
    AlignmentPanel panel;
    panel.set_reference("Reference", "ACGTACGTAC");
    panel.add_sample("s1", {"ACGTACGTAC"}, ploidy(2));
    panel.add_sample("s2", {"AYGTRCGNAC"}, ploidy(2));
    panel.add_sample("s3", {"ACKTACG-AC"}, ploidy(2));

    ClassifierOptions single = options(0.5, 0.6, 0.0, 0);
    ClassifierOptions multi = single;
    multi.num_threads = 4;

    Classification a = classify(panel, single);
    Classification b = classify(panel, multi);
    ASSERT_EQ(a.sites.size(), b.sites.size());
    for (size_t c = 0; c < a.sites.size(); ++c) {
        EXPECT_EQ(a.sites[c].label, b.sites[c].label) << "column " << c;
        EXPECT_EQ(a.sites[c].called_copies, b.sites[c].called_copies);
    }
}
