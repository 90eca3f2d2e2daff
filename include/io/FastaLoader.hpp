#pragma once

#include <htslib/faidx.h>

#include <cstdint>
#include <string>
#include <vector>

namespace PolyCore {

/**
 * @brief One named FASTA record.
 */
struct FastaRecord {
    std::string name;
    std::string sequence;  ///< Uppercase
};

/**
 * @brief RAII wrapper for FASTA file reading with HTSlib.
 *
 * Reads whole records through faidx; the .fai index is built next to the file when
 * it does not exist yet. Plain and bgzip-compressed files are supported.
 *
 * Usage:
 *   FastaLoader fasta("sample1.fa");
 *   std::string genome = fasta.read_concatenated();
 */
class FastaLoader {
public:
    /**
     * @brief Opens (and indexes if needed) a FASTA file.
     * @throws std::runtime_error if file cannot be opened or indexed.
     */
    explicit FastaLoader(const std::string& fasta_path);

    ~FastaLoader();

    // Disable copy, allow move
    FastaLoader(const FastaLoader&) = delete;
    FastaLoader& operator=(const FastaLoader&) = delete;
    FastaLoader(FastaLoader&&) noexcept;
    FastaLoader& operator=(FastaLoader&&) noexcept;

    /// Number of records in file order.
    int num_records() const;

    /// Name of the i-th record.
    std::string record_name(int index) const;

    /**
     * @brief Gets the length of a record.
     * @return Length in bp, or -1 if the record is not found.
     */
    int64_t record_length(const std::string& name) const;

    /**
     * @brief Fetches a whole record, uppercased.
     * @throws std::runtime_error if the record cannot be read.
     */
    std::string fetch_record(const std::string& name) const;

    /// Every record in file order.
    std::vector<FastaRecord> read_all() const;

    /// Every record joined in file order (one multi-contig genome).
    std::string read_concatenated() const;

    const std::string& get_path() const { return fasta_path_; }

    /// File name without directory and last extension ("data/s1.fasta" -> "s1").
    static std::string sample_name(const std::string& path);

private:
    std::string fasta_path_;
    faidx_t* fai_;
};

}  // namespace PolyCore
