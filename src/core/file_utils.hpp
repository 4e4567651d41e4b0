#pragma once

#include <filesystem>
#include <string>

namespace cityfuse::core {

/**
 * @brief Unique temporary path next to a destination file
 *
 * The temporary file lives in the destination's directory so the final
 * rename never crosses file systems.
 */
[[nodiscard]] std::filesystem::path temporary_path_for(const std::filesystem::path& destination);

/**
 * @brief Move a finished temporary file over its destination
 *
 * The temporary file is removed when the rename fails.
 *
 * @throws PipelineError (WriteError) on failure
 */
void commit_file(const std::filesystem::path& temporary, const std::filesystem::path& destination);

/**
 * @brief Write text to a file atomically (temporary file + rename)
 * @throws PipelineError (WriteError) on failure
 */
void write_text_file(const std::filesystem::path& destination, const std::string& content);

} // namespace cityfuse::core
