/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the architecture-analysis prompts.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "domain/SourceFile.hpp"

namespace archlens::infrastructure {

class PromptCatalog {
public:
    /** @brief System message sent with every chat request. */
    static std::string GetSystemPrompt();

    /** @brief Appended to the user prompt when falling back to plain completion. */
    static std::string GetCompletionHint();

    /**
     * @brief Builds the user prompt for one chunk.
     * @param chunk Files of this chunk, in order.
     * @param corpusSize Number of files in the whole analysis.
     * @param testSuite Use the test-suite template instead of the general one.
     * @param chunkNumber One-based chunk number.
     * @param totalChunks Number of chunks in the run.
     */
    static std::string BuildChunkPrompt(const std::vector<domain::SourceFile>& chunk,
                                        std::size_t corpusSize,
                                        bool testSuite,
                                        std::size_t chunkNumber,
                                        std::size_t totalChunks);

    /** @brief "=== File: path ===" header plus content cut to @p maxLength characters. */
    static std::string FormatExcerpt(const domain::SourceFile& file, std::size_t maxLength);
};

} // namespace archlens::infrastructure
