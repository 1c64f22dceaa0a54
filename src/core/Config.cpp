#include "core/Config.hpp"

#include <htslib/hts.h>

#include <filesystem>

#include "utils/Logger.hpp"

namespace AgpAssembler {

bool Config::validate() const {
    bool valid = true;

    if (agp_path.empty()) {
        LOG_ERROR("AGP path is required.");
        valid = false;
    } else if (!std::filesystem::is_regular_file(agp_path)) {
        LOG_ERROR("Cannot open AGP file: " + agp_path);
        valid = false;
    }

    if (components_path.empty()) {
        LOG_ERROR("Components FASTA path is required.");
        valid = false;
    } else {
        // Verify the component file is FASTA and randomly accessible
        htsFile* fp = hts_open(components_path.c_str(), "r");
        if (fp == NULL) {
            LOG_ERROR("Cannot open components FASTA: " + components_path);
            valid = false;
        } else {
            const htsFormat* fmt = hts_get_format(fp);
            if (fmt->compression == gzip) {
                LOG_ERROR("Components FASTA must not be gzipped (bgzip is accepted): " + components_path);
                valid = false;
            } else if (fmt->format != fasta_format) {
                LOG_ERROR("Components file is not FASTA: " + components_path);
                valid = false;
            }
            if (hts_close(fp) != 0) {
                LOG_WARNING("Error while closing " + components_path);
            }
        }
    }

    if (line_width < 0) {
        LOG_ERROR("line_width must not be negative.");
        valid = false;
    }

    return valid;
}

void Config::print() const {
    LOG_INFO("--- Configuration ---");
    LOG_INFO("AGP: " + agp_path);
    LOG_INFO("Components: " + components_path);
    LOG_INFO("Output: " + (writes_to_stdout() ? std::string("stdout") : output_path));
    LOG_INFO("Line width: " + (line_width > 0 ? std::to_string(line_width) : std::string("unwrapped")));
    LOG_INFO(std::string("Component mode: ") + (slice_components ? "slice declared range" : "full sequence"));
    LOG_INFO("---------------------");
}

}  // namespace AgpAssembler
