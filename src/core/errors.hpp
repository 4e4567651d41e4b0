/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the merge pipeline
 *
 * Index misuse is a programming error and aborts the run. Per-object
 * failures are caught by the batch driver, recorded, and skipped.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cityfuse {

/**
 * @brief Misuse of the geometry index
 */
enum class IndexErrorKind {
    IndexEmpty,     ///< Index built from zero buildings
    NotBuilt        ///< Query issued before build()
};

/**
 * @brief Per-object failure recorded in the run summary
 */
enum class FailureKind {
    NoMatch,            ///< No building within the search radius
    GeometryMismatch,   ///< Coordinate alignment impossible
    DegenerateSolid,    ///< Every surface collapsed during triangulation
    WriteError,         ///< Output file could not be written
    ReadError           ///< Merged-record file could not be read
};

[[nodiscard]] inline const char* index_error_name(IndexErrorKind kind) {
    switch (kind) {
        case IndexErrorKind::IndexEmpty: return "IndexEmpty";
        case IndexErrorKind::NotBuilt:   return "NotBuilt";
    }
    return "Unknown";
}

[[nodiscard]] inline const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::NoMatch:          return "NoMatch";
        case FailureKind::GeometryMismatch: return "GeometryMismatch";
        case FailureKind::DegenerateSolid:  return "DegenerateSolid";
        case FailureKind::WriteError:       return "WriteError";
        case FailureKind::ReadError:        return "ReadError";
    }
    return "Unknown";
}

/**
 * @brief Thrown on geometry index misuse; fatal for the run
 */
class IndexError : public std::logic_error {
public:
    IndexError(IndexErrorKind kind, const std::string& message)
        : std::logic_error(std::string(index_error_name(kind)) + ": " + message)
        , m_kind(kind) {}

    [[nodiscard]] IndexErrorKind kind() const { return m_kind; }

private:
    IndexErrorKind m_kind;
};

/**
 * @brief Thrown for a failure that only affects one OSM object
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(FailureKind kind, const std::string& message)
        : std::runtime_error(message)
        , m_kind(kind) {}

    [[nodiscard]] FailureKind kind() const { return m_kind; }

private:
    FailureKind m_kind;
};

} // namespace cityfuse
