#pragma once

#include <filesystem>
#include <string>

namespace safeio {

    struct FileGuardConfig {
        // Where temporary pre-operation copies are written; empty means the system temporary directory
        std::filesystem::path temp_directory{};
        // Placed between the stem and the hex ID of a permanent backup: {stem}{separator}{8hex}{ext}
        std::string backup_separator{"_"};
        // Extension used when protected_store generates its own file name
        std::string default_extension{".json"};

        [[nodiscard]] std::filesystem::path resolved_temp_directory() const {
            return temp_directory.empty() ? std::filesystem::temp_directory_path() : temp_directory;
        }
    };

} // namespace safeio
