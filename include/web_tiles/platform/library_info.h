#pragma once

/**
 * @file library_info.h
 * @brief Library information and utilities
 *
 * Provides version information, build details, and transport capability checks.
 */

#include <string>

namespace web_tiles {

/**
 * @brief Library information and utilities
 */
class LibraryInfo {
public:
    /**
     * @brief Get library version
     *
     * @return std::string Version string in format "major.minor.patch"
     */
    static std::string GetVersion();

    /**
     * @brief Get build information
     *
     * @return std::string Build timestamp and transport library version
     */
    static std::string GetBuildInfo();

    /**
     * @brief Check the HTTP transport can reach tile servers
     *
     * @return true if libcurl was built with HTTP and HTTPS support
     */
    static bool CheckSystemRequirements();
};

} // namespace web_tiles
