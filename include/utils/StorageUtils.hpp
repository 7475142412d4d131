#ifndef VIGIL_STORAGEUTILS_HPP
#define VIGIL_STORAGEUTILS_HPP

#include <string>

namespace VigilUtils {
    // Debug-level console output (--verbose)
    extern bool VERBOSE;

    /**
     * @brief Write-temp-then-rename. Readers see either the old file or the complete new one.
     * The temp file is fsync'ed before the rename; on failure it is removed and false is returned.
     */
    bool writeFileAtomic(const std::string& path, const std::string& content);

    /**
     * @brief Creates the directory (and parents) with owner-only (0700) permissions if missing.
     */
    bool ensureSecureDirectory(const std::string& path);

    /**
     * @brief Whole file as a string. Returns false if the file cannot be opened.
     */
    bool readFile(const std::string& path, std::string& out);
}

#endif
