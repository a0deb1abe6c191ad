/**
 * @file SourceFile.hpp
 * @brief Domain value representing one source excerpt handed to the pipeline.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace archlens::domain {

/**
 * @struct SourceFile
 * @brief A caller-owned file excerpt. The pipeline only reads it.
 */
struct SourceFile {
    std::string path;                    ///< Repository-relative path, '/'-separated. Unique key.
    std::string content;                 ///< File text (may be an excerpt).
    std::size_t sizeBytes = 0;           ///< Size reported by the corpus provider.
    std::optional<std::string> language; ///< Optional language hint ("typescript", ...).

    SourceFile() = default;
    SourceFile(std::string p, std::string c)
        : path(std::move(p)), content(std::move(c)), sizeBytes(content.size()) {}
};

} // namespace archlens::domain
