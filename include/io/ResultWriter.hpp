#pragma once

#include <array>
#include <string>
#include <vector>

#include "core/CorePipeline.hpp"
#include "core/DataStructs.hpp"
#include "core/DistanceMatrix.hpp"
#include "core/Expander.hpp"
#include "core/SiteClassifier.hpp"

namespace PolyCore {

/**
 * @brief 負責將一次執行的所有結果輸出到檔案
 *
 * 輸出目錄結構：
 * ```
 * output/
 *   core.full.aln          # CORE_ALL 位點的比對（FASTA）
 *   core.aln               # CORE_VARIANT 位點的比對（FASTA）
 *   core.vcf               # 變異位點（htslib 寫出）
 *   dist_wide.csv          # 樣本 × 樣本距離矩陣
 *   dist_long.csv          # sample1,sample2,distance,diff,compared
 *   distance_stats.txt     # 距離矩陣統計
 *   summary.csv            # 每個樣本的摘要
 *   core_fraction.csv      # 漸進式 core 軌跡（僅 --progressive）
 *   sites.tsv              # 每個位點的統計與分類
 *   fconst.txt             # 不變位點的 A,C,G,T 數量
 * ```
 *
 * 每個寫入函式在檔案無法開啟時拋出 std::runtime_error。
 */
class ResultWriter {
public:
    /**
     * @brief 建構 ResultWriter，並建立輸出目錄
     * @param output_dir 輸出根目錄
     */
    explicit ResultWriter(const std::string& output_dir);

    /**
     * @brief 寫出完整結果
     *
     * @param result Pipeline 結果
     * @param write_vcf 是否寫出 core.vcf
     */
    void write_all(const CoreResult& result, bool write_vcf = true) const;

    /**
     * @brief 寫出 FASTA 比對；per-copy 樣本每個 copy 一筆紀錄（id_1, id_2, ...）
     */
    void write_alignment(const std::string& filename, const ExpandedAlignment& alignment) const;

    /**
     * @brief 寫出寬格式距離矩陣（NaN 輸出為空字串）
     */
    void write_distance_wide(const std::string& filename, const DistanceMatrix& matrix) const;

    /**
     * @brief 寫出長格式距離（上三角）
     */
    void write_distance_long(const std::string& filename, const DistanceMatrix& matrix) const;

    void write_summary(const std::string& filename, const std::vector<SampleSummary>& summaries) const;

    void write_trajectory(const std::string& filename, const std::vector<CoreTrajectoryPoint>& trajectory) const;

    /**
     * @brief 寫出每個位點的統計（1-based 座標）
     */
    void write_sites(const std::string& filename, const Classification& classification) const;

    void write_fconst(const std::string& filename, const std::array<size_t, 4>& fconst) const;

    /// Full path of a file inside the output directory.
    std::string path(const std::string& filename) const;

private:
    std::string output_dir_;
};

}  // namespace PolyCore
