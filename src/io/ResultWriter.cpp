#include "io/ResultWriter.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "io/VcfWriter.hpp"
#include "utils/Logger.hpp"

namespace PolyCore {

namespace {

std::ofstream open_output(const std::string& filepath) {
    std::ofstream ofs(filepath);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filepath);
    }
    return ofs;
}

void finish(std::ofstream& ofs, const std::string& filepath) {
    ofs.close();
    if (ofs.fail()) {
        throw std::runtime_error("Failed to write file: " + filepath);
    }
    LOG_INFO("Saved file -> " + filepath);
}

}  // namespace

ResultWriter::ResultWriter(const std::string& output_dir) : output_dir_(output_dir) {
    // Create output directory if it doesn't exist
    std::filesystem::create_directories(output_dir_);
}

std::string ResultWriter::path(const std::string& filename) const {
    return (std::filesystem::path(output_dir_) / filename).string();
}

void ResultWriter::write_all(const CoreResult& result, bool write_vcf) const {
    Utils::ScopedLogger scope("Writing outputs to " + output_dir_);

    write_distance_wide("dist_wide.csv", result.distances);
    write_distance_long("dist_long.csv", result.distances);
    result.distances.write_stats(path("distance_stats.txt"));

    write_alignment("core.full.aln", result.core_alignment);
    write_alignment("core.aln", result.variant_alignment);
    if (write_vcf) {
        VcfWriter(path("core.vcf")).write(result.variant_alignment, result.variants, result.classification.sites.size());
    }

    write_summary("summary.csv", result.summaries);
    if (!result.trajectory.empty()) {
        write_trajectory("core_fraction.csv", result.trajectory);
    }
    write_sites("sites.tsv", result.classification);
    write_fconst("fconst.txt", result.fconst);
}

void ResultWriter::write_alignment(const std::string& filename, const ExpandedAlignment& alignment) const {
    const std::string filepath = path(filename);
    std::ofstream ofs = open_output(filepath);

    for (const auto& sample : alignment.samples) {
        if (sample.num_strands() == 1) {
            ofs << ">" << sample.id << "\n" << sample.strands.front() << "\n";
            continue;
        }
        for (int copy = 0; copy < sample.num_strands(); ++copy) {
            ofs << ">" << sample.id << "_" << (copy + 1) << "\n" << sample.strands[copy] << "\n";
        }
    }
    finish(ofs, filepath);
}

void ResultWriter::write_distance_wide(const std::string& filename, const DistanceMatrix& matrix) const {
    const std::string filepath = path(filename);
    std::ofstream ofs = open_output(filepath);

    // Header
    ofs << "name";
    for (const auto& id : matrix.sample_ids) {
        ofs << "," << id;
    }
    ofs << "\n";

    // Data
    const int n = matrix.size();
    for (int i = 0; i < n; ++i) {
        ofs << matrix.sample_ids[i];
        for (int j = 0; j < n; ++j) {
            ofs << ",";
            double val = matrix.dist_matrix(i, j);
            if (std::isfinite(val)) {
                ofs << std::fixed << std::setprecision(6) << val;
            }
        }
        ofs << "\n";
    }
    finish(ofs, filepath);
}

void ResultWriter::write_distance_long(const std::string& filename, const DistanceMatrix& matrix) const {
    const std::string filepath = path(filename);
    std::ofstream ofs = open_output(filepath);

    ofs << "sample1,sample2,distance,diff,compared\n";
    const int n = matrix.size();
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            ofs << matrix.sample_ids[i] << "," << matrix.sample_ids[j] << ",";
            double val = matrix.dist_matrix(i, j);
            if (std::isfinite(val)) {
                ofs << std::fixed << std::setprecision(6) << val;
            } else {
                ofs << "NA";
            }
            ofs << "," << std::setprecision(6) << matrix.diff_sums(i, j) << "," << matrix.compared(i, j) << "\n";
        }
    }
    finish(ofs, filepath);
    LOG_INFO("Distance matrices: " + std::to_string(static_cast<long long>(n) * (n - 1) / 2) +
             " pairwise comparisons");
}

void ResultWriter::write_summary(const std::string& filename, const std::vector<SampleSummary>& summaries) const {
    const std::string filepath = path(filename);
    std::ofstream ofs = open_output(filepath);

    ofs << "name,ploidy,ploidy_source,length,missing,genome_fraction,core_fraction,core_sites,variants,voting,"
           "warning\n";
    for (const auto& s : summaries) {
        ofs << s.id << "," << s.ploidy << "," << ploidy_source_to_string(s.ploidy_source) << "," << s.length << ","
            << s.missing_copies << "," << std::fixed << std::setprecision(6) << s.genome_fraction << ","
            << s.core_fraction << "," << s.called_core_sites << "," << s.variant_sites << ","
            << (s.voting ? "yes" : "no") << ",";
        if (!s.warning.empty()) {
            ofs << "\"" << s.warning << "\"";
        }
        ofs << "\n";
    }
    finish(ofs, filepath);
}

void ResultWriter::write_trajectory(const std::string& filename,
                                    const std::vector<CoreTrajectoryPoint>& trajectory) const {
    const std::string filepath = path(filename);
    std::ofstream ofs = open_output(filepath);

    ofs << "k,name,core_fraction,core_sites,variant_sites\n";
    for (const auto& point : trajectory) {
        ofs << point.k << "," << point.sample_id << "," << std::fixed << std::setprecision(6) << point.core_fraction
            << "," << point.core_sites << "," << point.variant_sites << "\n";
    }
    finish(ofs, filepath);
}

void ResultWriter::write_sites(const std::string& filename, const Classification& classification) const {
    const std::string filepath = path(filename);
    std::ofstream ofs = open_output(filepath);

    ofs << "pos\tref\tmajor\talt\talt_alleles\tgenome_fraction\tcore_fraction\talt_fraction\talt_samples\t"
           "called_samples\tcalled_copies\tclass\n";
    for (const auto& site : classification.sites) {
        ofs << (site.position + 1) << "\t" << site.ref_symbol << "\t" << site.major_allele << "\t"
            << site.alt_allele << "\t" << (site.alt_alleles.empty() ? "." : site.alt_alleles) << "\t" << std::fixed
            << std::setprecision(4) << site.genome_fraction << "\t" << site.core_fraction << "\t"
            << site.alt_fraction << "\t" << site.alt_sample_count << "\t" << site.called_samples << "\t"
            << site.called_copies << "\t" << site_class_to_string(site.label) << "\n";
    }
    finish(ofs, filepath);
}

void ResultWriter::write_fconst(const std::string& filename, const std::array<size_t, 4>& fconst) const {
    const std::string filepath = path(filename);
    std::ofstream ofs = open_output(filepath);
    ofs << fconst[0] << "," << fconst[1] << "," << fconst[2] << "," << fconst[3] << "\n";
    finish(ofs, filepath);
}

}  // namespace PolyCore
