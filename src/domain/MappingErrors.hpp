/**
 * @file MappingErrors.hpp
 * @brief Error taxonomy of a mapping run.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace foldermapper::domain {

/** @brief Base of every error raised by the mapping pipeline. */
class MappingError : public std::runtime_error {
public:
    explicit MappingError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Input missing or not a readable archive. Fatal. */
class ExtractionError : public MappingError {
public:
    using MappingError::MappingError;
};

/** @brief Access to a path was refused. The item is kept as inaccessible. */
class PermissionDenied : public MappingError {
public:
    using MappingError::MappingError;
};

/** @brief A single item could not be classified. The item is dropped. */
class ClassificationError : public MappingError {
public:
    using MappingError::MappingError;
};

/** @brief The report could not be produced or written. Fatal. */
class RenderError : public MappingError {
public:
    using MappingError::MappingError;
};

} // namespace foldermapper::domain
