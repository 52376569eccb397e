// include/portfolio_recon/core/env_loader.hpp
#pragma once

#include <optional>
#include <string>
#include "portfolio_recon/core/error.hpp"

namespace portfolio_recon {

/**
 * @brief Loads KEY=VALUE lines from a .env file into the process environment
 */
class EnvLoader {
public:
    /**
     * @brief Load a .env file
     *
     * Blank lines and lines starting with '#' are skipped, an optional leading
     * "export " is dropped and matching surrounding quotes are stripped.
     *
     * @param filepath Path to the .env file
     * @param overwrite Replace variables that are already set
     * @return Result indicating success or failure
     */
    static Result<void> load(const std::string& filepath, bool overwrite = true);

    /**
     * @brief Read an environment variable
     * @return The value, or std::nullopt when unset or empty
     */
    static std::optional<std::string> get(const std::string& name);
};

}  // namespace portfolio_recon
