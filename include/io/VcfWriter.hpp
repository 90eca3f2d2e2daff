#pragma once

#include <htslib/hts.h>
#include <htslib/vcf.h>

#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/Expander.hpp"

namespace PolyCore {

/**
 * @brief Writes variant records as VCF through htslib.
 *
 * One contig "1" spans the whole alignment; POS is the 1-based alignment column.
 * Samples of different ploidy share the file; shorter genotypes are padded with the
 * vector-end marker. Output is bgzip-compressed when the file name ends in ".gz".
 */
class VcfWriter {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit VcfWriter(const std::string& filepath);
    ~VcfWriter();

    VcfWriter(const VcfWriter&) = delete;
    VcfWriter& operator=(const VcfWriter&) = delete;

    /**
     * @brief Writes the header and one line per record.
     *
     * @param alignment Supplies sample names, ploidies and the contig length.
     * @param records Variant records whose genotypes follow the sample order of alignment.
     * @param contig_length Length of the full alignment.
     * @throws std::runtime_error on any htslib write failure.
     */
    void write(const ExpandedAlignment& alignment, const std::vector<VariantRecord>& records,
               size_t contig_length);

    const std::string& get_path() const { return filepath_; }

private:
    std::string filepath_;
    htsFile* fp_ = nullptr;
    bcf_hdr_t* hdr_ = nullptr;

    void write_header(const ExpandedAlignment& alignment, size_t contig_length);
};

}  // namespace PolyCore
