/**
 * @file test_distance_matrix.cpp
 * @brief Unit tests for DistanceMatrix and DistanceCalculator
 *
 * Tests cover:
 * 1. Per-site dissimilarity under both copy aggregations
 * 2. Pairwise distances over haploid and polyploid samples
 * 3. Minimum common sites and NaN strategies
 * 4. Chunk width and thread count invariance
 * 5. Helpers (long form, lookup by id, statistics file)
 */

#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/DistanceMatrix.hpp"

using namespace PolyCore;

namespace {

ExpandedSample sample(const std::string& id, int ploidy, std::vector<std::string> strands) {
    ExpandedSample s;
    s.id = id;
    s.ploidy = ploidy;
    s.strands = std::move(strands);
    return s;
}

ExpandedAlignment alignment(std::vector<ExpandedSample> samples) {
    ExpandedAlignment aln;
    aln.samples = std::move(samples);
    const size_t length = aln.samples.empty() ? 0 : aln.samples.front().strands.front().size();
    for (size_t c = 0; c < length; ++c) {
        aln.positions.push_back(c);
    }
    return aln;
}

DistanceConfig config(CopyAggregation aggregation = CopyAggregation::BEST_MATCH) {
    DistanceConfig dc;
    dc.aggregation = aggregation;
    dc.min_gf = 0.5;
    return dc;
}

}  // namespace

// ============================================================================
// Per-site dissimilarity
// ============================================================================

TEST(SiteDissimilarityTest, BestMatch) {
    const AlleleCounts a{1, 0, 0, 0};
    const AlleleCounts t{0, 0, 0, 1};
    const AlleleCounts aa{2, 0, 0, 0};
    const AlleleCounts ag{1, 0, 1, 0};
    const AlleleCounts aaaa{4, 0, 0, 0};

    EXPECT_DOUBLE_EQ(DistanceCalculator::site_dissimilarity(a, t, CopyAggregation::BEST_MATCH), 1.0);
    EXPECT_DOUBLE_EQ(DistanceCalculator::site_dissimilarity(ag, aa, CopyAggregation::BEST_MATCH), 0.5);
    EXPECT_DOUBLE_EQ(DistanceCalculator::site_dissimilarity(ag, ag, CopyAggregation::BEST_MATCH), 0.0);
    // Same genotype frequency at different ploidy
    EXPECT_DOUBLE_EQ(DistanceCalculator::site_dissimilarity(aa, aaaa, CopyAggregation::BEST_MATCH), 0.0);
}

TEST(SiteDissimilarityTest, MeanPair) {
    const AlleleCounts ag{1, 0, 1, 0};
    const AlleleCounts aa{2, 0, 0, 0};
    const AlleleCounts aaag{3, 0, 1, 0};

    EXPECT_DOUBLE_EQ(DistanceCalculator::site_dissimilarity(ag, ag, CopyAggregation::MEAN_PAIR), 0.5);
    EXPECT_DOUBLE_EQ(DistanceCalculator::site_dissimilarity(aa, aa, CopyAggregation::MEAN_PAIR), 0.0);
    EXPECT_DOUBLE_EQ(DistanceCalculator::site_dissimilarity(aa, aaag, CopyAggregation::MEAN_PAIR), 0.25);
}

TEST(SiteDissimilarityTest, PackedCellsKeepCounts) {
    const AlleleCounts counts{3, 0, 255, 1};
    EXPECT_EQ(DistanceCalculator::unpack_counts(DistanceCalculator::pack_counts(counts)), counts);
    EXPECT_EQ(DistanceCalculator::pack_counts(AlleleCounts{1, 0, 0, 0}), 1u);
}

// ============================================================================
// Distance matrix
// ============================================================================

TEST(DistanceMatrixTest, SingleDifferenceOverTenSites) {
    ExpandedAlignment aln = alignment({
        sample("Reference", 1, {"AAAAAAAAAA"}),
        sample("sample1", 1, {"AAAAAAAAAA"}),
        sample("sample2", 1, {"AAAAAAAAAT"}),
    });

    DistanceMatrix dm = DistanceCalculator(config()).compute(aln, 0);

    ASSERT_EQ(dm.size(), 3);
    EXPECT_DOUBLE_EQ(dm.get_distance("sample1", "sample2"), 0.1);
    EXPECT_DOUBLE_EQ(dm.get_distance("Reference", "sample1"), 0.0);
    EXPECT_DOUBLE_EQ(dm.get_distance("Reference", "sample2"), 0.1);
    EXPECT_EQ(dm.compared(1, 2), 10);
    EXPECT_DOUBLE_EQ(dm.diff_sums(1, 2), 1.0);

    for (int i = 0; i < dm.size(); ++i) {
        EXPECT_DOUBLE_EQ(dm.dist_matrix(i, i), 0.0);
        for (int j = 0; j < dm.size(); ++j) {
            EXPECT_DOUBLE_EQ(dm.dist_matrix(i, j), dm.dist_matrix(j, i));
            EXPECT_GE(dm.dist_matrix(i, j), 0.0);
            EXPECT_LE(dm.dist_matrix(i, j), 1.0);
        }
    }
    EXPECT_EQ(dm.num_valid_pairs, 3);
    EXPECT_EQ(dm.num_invalid_pairs, 0);
}

TEST(DistanceMatrixTest, PolyploidGenotypes) {
    // Diploid AG heterozygote vs homozygous A at 1 of 2 sites
    ExpandedAlignment aln = alignment({
        sample("het", 2, {"RA"}),
        sample("hom", 2, {"AA"}),
        sample("phased", 2, {"AA", "GA"}),
    });

    DistanceMatrix best = DistanceCalculator(config()).compute(aln, 0);
    EXPECT_DOUBLE_EQ(best.get_distance("het", "hom"), 0.25);
    EXPECT_DOUBLE_EQ(best.get_distance("het", "phased"), 0.0);

    DistanceMatrix mean = DistanceCalculator(config(CopyAggregation::MEAN_PAIR)).compute(aln, 0);
    EXPECT_DOUBLE_EQ(mean.get_distance("het", "hom"), 0.25);
    // Identical heterozygotes still differ by chance under MEAN_PAIR
    EXPECT_DOUBLE_EQ(mean.get_distance("het", "phased"), 0.25);
}

TEST(DistanceMatrixTest, OnlyCommonlyCalledSitesAreCompared) {
    ExpandedAlignment aln = alignment({
        sample("s1", 1, {"ACGT"}),
        sample("s2", 1, {"ACGA"}),
        sample("s3", 1, {"NNGA"}),
    });

    DistanceMatrix dm = DistanceCalculator(config()).compute(aln, 0);
    EXPECT_EQ(dm.compared(0, 2), 2);
    EXPECT_DOUBLE_EQ(dm.get_distance("s1", "s3"), 0.5);
    EXPECT_DOUBLE_EQ(dm.get_distance("s2", "s3"), 0.0);
    EXPECT_DOUBLE_EQ(dm.avg_common_sites, (4.0 + 2.0 + 2.0) / 3.0);
}

TEST(DistanceMatrixTest, NanStrategies) {
    ExpandedAlignment aln = alignment({
        sample("s1", 1, {"ACGT"}),
        sample("s2", 1, {"ACGA"}),
        sample("empty", 1, {"NNNN"}),
    });

    DistanceConfig max_dist = config();
    max_dist.max_distance_value = 2.0;
    DistanceMatrix dm_max = DistanceCalculator(max_dist).compute(aln, 0);
    EXPECT_DOUBLE_EQ(dm_max.get_distance("s1", "empty"), 2.0);
    EXPECT_EQ(dm_max.num_invalid_pairs, 2);
    EXPECT_EQ(dm_max.num_valid_pairs, 1);

    DistanceConfig skip = config();
    skip.nan_strategy = NanDistanceStrategy::SKIP;
    DistanceMatrix dm_skip = DistanceCalculator(skip).compute(aln, 0);
    EXPECT_TRUE(std::isnan(dm_skip.get_distance("s1", "empty")));
    EXPECT_DOUBLE_EQ(dm_skip.get_distance("s1", "s2"), 0.25);

    // 4 common sites < 5 required
    DistanceConfig strict = config();
    strict.min_common_sites = 5;
    strict.nan_strategy = NanDistanceStrategy::SKIP;
    DistanceMatrix dm_strict = DistanceCalculator(strict).compute(aln, 0);
    EXPECT_TRUE(std::isnan(dm_strict.get_distance("s1", "s2")));
    EXPECT_EQ(dm_strict.num_valid_pairs, 0);
}

TEST(DistanceMatrixTest, ChunkWidthAndThreadsDoNotChangeResult) {
    ExpandedAlignment aln = alignment({
        sample("a", 2, {"ACGTRYACGTNNACGTKM"}),
        sample("b", 2, {"ACGTACACGTACACGTGA"}),
        sample("c", 2, {"ACTTATACG-ACACGTGA", "ACTTCCACG-ACACGTGC"}),
        sample("d", 2, {"TCGTRYACGTAAACGTKM"}),
    });

    DistanceConfig dc = config(CopyAggregation::MEAN_PAIR);
    DistanceMatrix whole = DistanceCalculator(dc).compute(aln, 0);

    for (size_t width : {size_t(1), size_t(3), size_t(7), size_t(18), size_t(100)}) {
        DistanceConfig threaded = dc;
        threaded.num_threads = 3;
        DistanceMatrix chunked = DistanceCalculator(threaded).compute(aln, width);
        for (int i = 0; i < whole.size(); ++i) {
            for (int j = 0; j < whole.size(); ++j) {
                EXPECT_EQ(whole.dist_matrix(i, j), chunked.dist_matrix(i, j)) << "width " << width;
                EXPECT_EQ(whole.compared(i, j), chunked.compared(i, j));
            }
        }
    }

    DistanceMatrix by_one = DistanceCalculator(dc).compute(aln, 1);
    EXPECT_EQ(by_one.num_chunks, 18u);
    EXPECT_EQ(by_one.chunk_width, 1u);
}

TEST(DistanceMatrixTest, LongFormAndLookup) {
    ExpandedAlignment aln = alignment({
        sample("x", 1, {"AC"}),
        sample("y", 1, {"AT"}),
        sample("z", 1, {"GT"}),
    });
    DistanceMatrix dm = DistanceCalculator(config()).compute(aln, 0);

    std::vector<DistanceCell> cells = dm.to_long_form();
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_EQ(cells[0].sample_i, "x");
    EXPECT_EQ(cells[0].sample_j, "y");
    EXPECT_DOUBLE_EQ(cells[0].distance, 0.5);
    EXPECT_EQ(cells[2].sample_i, "y");
    EXPECT_EQ(cells[2].sample_j, "z");

    EXPECT_EQ(dm.index_of("z"), 2);
    EXPECT_EQ(dm.index_of("missing"), -1);
    EXPECT_TRUE(std::isnan(dm.get_distance("x", "missing")));
}

TEST(DistanceMatrixTest, NoSitesStillBuildsMatrix) {
    ExpandedAlignment aln;
    aln.samples.push_back(sample("a", 1, {""}));
    aln.samples.push_back(sample("b", 1, {""}));

    DistanceMatrix dm = DistanceCalculator(config()).compute(aln, 0);
    EXPECT_EQ(dm.num_chunks, 0u);
    EXPECT_EQ(dm.num_invalid_pairs, 1);
    EXPECT_DOUBLE_EQ(dm.get_distance(0, 1), 1.0);
}

TEST(DistanceMatrixTest, WriteStats) {
    ExpandedAlignment aln = alignment({
        sample("s1", 1, {"ACGT"}),
        sample("s2", 1, {"ACGA"}),
    });
    DistanceMatrix dm = DistanceCalculator(config()).compute(aln, 2);

    const std::string path = (std::filesystem::temp_directory_path() / "polycore_distance_stats.txt").string();
    dm.write_stats(path);

    std::ifstream ifs(path);
    std::stringstream content;
    content << ifs.rdbuf();
    EXPECT_NE(content.str().find("Number of samples: 2"), std::string::npos);
    EXPECT_NE(content.str().find("Chunk width: 2 (2 chunks)"), std::string::npos);
    EXPECT_NE(content.str().find("Copy aggregation: BEST_MATCH"), std::string::npos);
    std::remove(path.c_str());

    EXPECT_THROW(dm.write_stats("/nonexistent_dir/stats.txt"), std::runtime_error);
}

TEST(DistanceCalculatorTest, StringConversions) {
    EXPECT_EQ(DistanceCalculator::string_to_aggregation("mean-pair"), CopyAggregation::MEAN_PAIR);
    EXPECT_EQ(DistanceCalculator::string_to_site_set("core_variant"), SiteSet::CORE_VARIANT);
    EXPECT_EQ(DistanceCalculator::string_to_nan_strategy("skip"), NanDistanceStrategy::SKIP);
    EXPECT_EQ(DistanceCalculator::aggregation_to_string(CopyAggregation::BEST_MATCH), "BEST_MATCH");
    EXPECT_THROW(DistanceCalculator::string_to_aggregation("median"), std::invalid_argument);
    EXPECT_THROW(DistanceCalculator::string_to_nan_strategy("zero"), std::invalid_argument);
}
