#include <iostream>

#include "core/Config.hpp"
#include "core/CorePipeline.hpp"
#include "io/PanelLoader.hpp"
#include "io/ResultWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    PolyCore::Utils::ResourceMonitor monitor;

    PolyCore::Config config;

    if (!PolyCore::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    auto& logger = PolyCore::Utils::Logger::instance();
    logger.set_log_level(config.log_level);

    try {
        if (!config.log_file.empty()) {
            logger.set_log_file(config.log_file);
        }

        if (!config.validate()) {
            LOG_ERROR("Configuration validation failed.");
            return 1;
        }

        config.print();
        LOG_INFO("Configuration valid. Starting analysis...");

        PolyCore::Utils::ScopedLogger main_scope("Main Execution");

        LOG_INFO("[1] Loading " + std::to_string(config.sample_paths.size()) + " samples...");
        PolyCore::PanelLoader loader(config.ploidy, config.phased_records);
        PolyCore::AlignmentPanel panel = loader.load(config.reference_fasta_path, config.sample_paths);

        LOG_INFO("[2] Identifying core genome...");
        PolyCore::CorePipeline pipeline(config);
        PolyCore::CoreResult result = pipeline.run(panel);

        LOG_INFO("[3] Writing outputs...");
        PolyCore::ResultWriter writer(config.output_dir);
        writer.write_all(result, config.write_vcf);

        for (const auto& warning : result.warnings) {
            LOG_WARNING(warning);
        }
        LOG_INFO("Output directory: " + config.output_dir);

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    if (logger.warning_count() > 0) {
        LOG_INFO("Finished with " + std::to_string(logger.warning_count()) + " warnings");
    }
    LOG_INFO(monitor.format_stats("Total Execution"));

    return 0;
}
