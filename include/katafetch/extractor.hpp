#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace katafetch {

struct ExtractorConfig {
    std::filesystem::path extract_root;   // Output goes to <extract_root>/<date>/
    std::string member_pattern = "*.sgf"; // Empty extracts every member
    std::string tar_program = "tar";      // Resolved through PATH
};

struct ExtractResult {
    bool success = false;
    std::filesystem::path output_dir;
    size_t files_present = 0;  // Regular files under output_dir afterwards
    int exit_code = -1;
    std::string error_message;
};

/// Decompresses completed archives with the external tar program.
/// Members already present in the output directory are left untouched, so
/// extracting the same archive twice is harmless.
class Extractor {
public:
    explicit Extractor(ExtractorConfig config);

    ExtractResult extract(const std::filesystem::path& archive, const std::string& date_id) const;

    const ExtractorConfig& config() const { return config_; }

private:
    ExtractorConfig config_;
};

}  // namespace katafetch
