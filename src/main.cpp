#include <fstream>
#include <iostream>

#include "core/AgpProcessor.hpp"
#include "core/Config.hpp"
#include "utils/ArgParser.hpp"
#include "utils/FastaReader.hpp"
#include "utils/Logger.hpp"

int main(int argc, char** argv) {
    AgpAssembler::Config config;

    if (!AgpAssembler::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    // Configure Logger
    auto& logger = AgpAssembler::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty()) {
        logger.set_log_file(config.log_file);
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    config.print();

    try {
        AgpAssembler::FastaReader components(config.components_path);
        LOG_INFO("Loaded index for " + std::to_string(components.num_sequences()) + " component sequences");

        std::ofstream out_file;
        if (!config.writes_to_stdout()) {
            out_file.open(config.output_path);
            if (!out_file.is_open()) {
                LOG_ERROR("Cannot open output file: " + config.output_path);
                return 1;
            }
        }
        std::ostream& out = config.writes_to_stdout() ? std::cout : out_file;

        AgpAssembler::AgpProcessor processor(components, config.builder_options());
        AgpAssembler::ProcessResult result;
        {
            AgpAssembler::Utils::ScopedLogger scope("Building " + config.agp_path);
            result = processor.process_file(config.agp_path, out);
        }

        if (!result.success) {
            LOG_ERROR(std::string(AgpAssembler::error_kind_to_string(result.error->kind)) + ": " +
                      result.error->message());
            return 1;
        }

        AgpAssembler::AgpProcessor::print_summary(result);

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
