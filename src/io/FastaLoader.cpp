#include "io/FastaLoader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace PolyCore {

FastaLoader::FastaLoader(const std::string& fasta_path) : fasta_path_(fasta_path), fai_(nullptr) {
    // Load FASTA index, building it when missing
    fai_ = fai_load(fasta_path.c_str());
    if (!fai_) {
        throw std::runtime_error("Failed to open or index FASTA: " + fasta_path);
    }
}

FastaLoader::~FastaLoader() {
    if (fai_) {
        fai_destroy(fai_);
    }
}

FastaLoader::FastaLoader(FastaLoader&& other) noexcept : fasta_path_(std::move(other.fasta_path_)), fai_(other.fai_) {
    other.fai_ = nullptr;
}

FastaLoader& FastaLoader::operator=(FastaLoader&& other) noexcept {
    if (this != &other) {
        if (fai_) {
            fai_destroy(fai_);
        }
        fasta_path_ = std::move(other.fasta_path_);
        fai_ = other.fai_;
        other.fai_ = nullptr;
    }
    return *this;
}

int FastaLoader::num_records() const {
    return fai_ ? faidx_nseq(fai_) : 0;
}

std::string FastaLoader::record_name(int index) const {
    const char* name = fai_ ? faidx_iseq(fai_, index) : nullptr;
    if (!name) {
        throw std::runtime_error("No record " + std::to_string(index) + " in " + fasta_path_);
    }
    return name;
}

int64_t FastaLoader::record_length(const std::string& name) const {
    if (!fai_) {
        return -1;
    }
    return faidx_seq_len(fai_, name.c_str());
}

std::string FastaLoader::fetch_record(const std::string& name) const {
    const int64_t length = record_length(name);
    if (length < 0) {
        throw std::runtime_error("Record '" + name + "' not found in " + fasta_path_);
    }
    if (length == 0) {
        return "";
    }

    hts_pos_t fetched = 0;
    char* seq = faidx_fetch_seq64(fai_, name.c_str(), 0, length - 1, &fetched);
    if (!seq || fetched != length) {
        if (seq) free(seq);
        throw std::runtime_error("Failed to read record '" + name + "' from " + fasta_path_);
    }

    std::string result(seq, static_cast<size_t>(fetched));
    free(seq);

    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::vector<FastaRecord> FastaLoader::read_all() const {
    std::vector<FastaRecord> records;
    const int n = num_records();
    records.reserve(n);
    for (int i = 0; i < n; ++i) {
        FastaRecord record;
        record.name = record_name(i);
        record.sequence = fetch_record(record.name);
        records.push_back(std::move(record));
    }
    return records;
}

std::string FastaLoader::read_concatenated() const {
    std::string genome;
    const int n = num_records();
    for (int i = 0; i < n; ++i) {
        genome += fetch_record(record_name(i));
    }
    return genome;
}

std::string FastaLoader::sample_name(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

}  // namespace PolyCore
