/**
 * @file ImportanceScorer.hpp
 * @brief Ranks source files by heuristic centrality so large corpora can be down-selected.
 */

#pragma once

#include "domain/SourceFile.hpp"
#include <string>
#include <vector>

namespace archlens::domain {

/**
 * @class ImportanceScorer
 * @brief Pure scoring over a corpus. Uses ImportResolver for import degrees.
 */
class ImportanceScorer {
public:
    /**
     * @brief Per-file score, aligned with the input order.
     */
    static std::vector<int> Score(const std::vector<SourceFile>& files);

    /**
     * @brief Returns the @p maxFiles most important files.
     *
     * Inputs no larger than @p maxFiles come back unchanged. Otherwise the top scores are
     * taken (ties keep input order) and every detected entry point is forced in, evicting the
     * lowest-scoring non-entry-point so the size stays @p maxFiles.
     */
    static std::vector<SourceFile> SelectImportant(const std::vector<SourceFile>& files, size_t maxFiles);

    static bool IsEntryPoint(const std::string& path);
    static bool IsCoreFile(const std::string& path);
    static bool IsConfigFile(const std::string& path);
    static bool IsServiceFile(const std::string& path);
    static bool IsTestFile(const std::string& path);
};

} // namespace archlens::domain
