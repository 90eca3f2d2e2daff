#include "io/VcfWriter.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace PolyCore {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

VcfWriter::VcfWriter(const std::string& filepath) : filepath_(filepath) {
    const char* mode = ends_with(filepath, ".gz") ? "wz" : "w";
    fp_ = hts_open(filepath.c_str(), mode);
    if (fp_ == NULL) {
        throw std::runtime_error("Cannot open VCF for writing: " + filepath);
    }
}

VcfWriter::~VcfWriter() {
    if (hdr_) {
        bcf_hdr_destroy(hdr_);
    }
    if (fp_) {
        hts_close(fp_);
    }
}

void VcfWriter::write_header(const ExpandedAlignment& alignment, size_t contig_length) {
    hdr_ = bcf_hdr_init("w");
    if (hdr_ == NULL) {
        throw std::runtime_error("Failed to create VCF header: " + filepath_);
    }

    const std::string contig = "##contig=<ID=1,length=" + std::to_string(contig_length) + ">";
    bcf_hdr_append(hdr_, "##source=PolyCore");
    bcf_hdr_append(hdr_, contig.c_str());
    bcf_hdr_append(hdr_, "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">");

    for (const auto& sample : alignment.samples) {
        if (bcf_hdr_add_sample(hdr_, sample.id.c_str()) != 0) {
            throw std::runtime_error("Cannot add sample '" + sample.id + "' to VCF header");
        }
    }
    if (bcf_hdr_sync(hdr_) != 0) {
        throw std::runtime_error("Failed to finalize VCF header: " + filepath_);
    }
    if (bcf_hdr_write(fp_, hdr_) != 0) {
        throw std::runtime_error("Failed to write VCF header: " + filepath_);
    }
}

void VcfWriter::write(const ExpandedAlignment& alignment, const std::vector<VariantRecord>& records,
                      size_t contig_length) {
    write_header(alignment, contig_length);

    const int num_samples = alignment.num_samples();
    int max_ploidy = 1;
    for (const auto& sample : alignment.samples) {
        max_ploidy = std::max(max_ploidy, sample.ploidy);
    }

    bcf1_t* rec = bcf_init();
    std::vector<int32_t> gt(static_cast<size_t>(num_samples) * max_ploidy);
    const int rid = bcf_hdr_name2id(hdr_, "1");

    for (const auto& record : records) {
        bcf_clear(rec);
        rec->rid = rid;
        rec->pos = static_cast<hts_pos_t>(record.position);

        std::string alleles(1, record.ref);
        for (char alt : record.alts) {
            alleles += ',';
            alleles += alt;
        }

        std::fill(gt.begin(), gt.end(), bcf_int32_vector_end);
        for (int s = 0; s < num_samples; ++s) {
            const std::vector<int>& genotype = record.genotypes[s];
            const bool phased = record.phased[s];
            for (size_t c = 0; c < genotype.size() && c < static_cast<size_t>(max_ploidy); ++c) {
                int32_t& cell = gt[static_cast<size_t>(s) * max_ploidy + c];
                if (genotype[c] < 0) {
                    cell = phased ? (bcf_gt_missing | 1) : bcf_gt_missing;
                } else {
                    cell = phased ? bcf_gt_phased(genotype[c]) : bcf_gt_unphased(genotype[c]);
                }
            }
        }

        if (bcf_update_alleles_str(hdr_, rec, alleles.c_str()) < 0 ||
            bcf_update_genotypes(hdr_, rec, gt.data(), static_cast<int>(gt.size())) < 0 ||
            bcf_write(fp_, hdr_, rec) != 0) {
            bcf_destroy(rec);
            throw std::runtime_error("Failed to write VCF record at position " + std::to_string(record.position + 1));
        }
    }

    bcf_destroy(rec);
    LOG_INFO("Saved file -> " + filepath_ + " (" + std::to_string(records.size()) + " variants)");
}

}  // namespace PolyCore
