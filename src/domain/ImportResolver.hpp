#pragma once

#include "domain/SourceFile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace archlens::domain {

/**
 * @brief Static import analysis over a corpus of source files.
 * This service is stateless; it never invents paths that are not in the corpus.
 */
class ImportResolver {
public:
    /**
     * @brief Extracts module specifiers from `import ... from "X"`, `import "X"`,
     *        `export ... from "X"` and `require("X")`.
     * @return Distinct specifiers in order of first appearance.
     */
    static std::vector<std::string> ExtractImports(const std::string& content);

    /**
     * @brief Resolves one specifier written in @p fromPath to a corpus path.
     * @param literal Specifier as written ("./util", "../models/user", "lodash").
     * @param fromPath Path of the importing file.
     * @param corpus Files that may be targets.
     * @return The matching corpus path, or std::nullopt when nothing corresponds.
     */
    static std::optional<std::string> Resolve(const std::string& literal,
                                              const std::string& fromPath,
                                              const std::vector<SourceFile>& corpus);

    /** @brief Joins a relative specifier to a directory and folds "." and ".." segments. */
    static std::string NormalizeRelative(const std::string& literal, const std::string& fromDir);

    /** @brief Drops a trailing .ts/.tsx/.js/.jsx/.mjs/.cjs extension. */
    static std::string StripSourceExtension(const std::string& path);
};

} // namespace archlens::domain
