#include "core/file_utils.hpp"
#include "core/errors.hpp"
#include <atomic>
#include <fstream>

namespace cityfuse::core {

std::filesystem::path temporary_path_for(const std::filesystem::path& destination) {
    static std::atomic<unsigned long> counter{0};
    std::filesystem::path temporary = destination;
    temporary += ".tmp" + std::to_string(counter.fetch_add(1));
    return temporary;
}

void commit_file(const std::filesystem::path& temporary, const std::filesystem::path& destination) {
    std::error_code ec;
    std::filesystem::rename(temporary, destination, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        throw PipelineError(FailureKind::WriteError,
                            "cannot move " + temporary.filename().string() + " to " +
                            destination.string() + ": " + ec.message());
    }
}

void write_text_file(const std::filesystem::path& destination, const std::string& content) {
    const std::filesystem::path temporary = temporary_path_for(destination);
    {
        std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PipelineError(FailureKind::WriteError, "cannot open " + temporary.string());
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temporary, ignored);
            throw PipelineError(FailureKind::WriteError, "write failed for " + destination.string());
        }
    }
    commit_file(temporary, destination);
}

} // namespace cityfuse::core
