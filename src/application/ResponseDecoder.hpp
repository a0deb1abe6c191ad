/**
 * @file ResponseDecoder.hpp
 * @brief Fault-tolerant decoding of one inference response into a RecoveryFragment.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/ArchitectureGraph.hpp"
#include "domain/DiagnosticSink.hpp"
#include "domain/SourceFile.hpp"

namespace archlens::application {

/**
 * @class ResponseDecoder
 * @brief Walks the recovery ladder: clean parse, balanced repair, field salvage, fallback.
 *
 * decode() never throws and always returns a fragment; the fragment's tier records how much
 * of the ladder was needed. A tier succeeds only when it yields an object carrying at least
 * one architecture field.
 */
class ResponseDecoder {
public:
    explicit ResponseDecoder(std::shared_ptr<domain::DiagnosticSink> sink = nullptr);

    /**
     * @brief Decodes @p raw for the files in @p batch.
     * @param label Prefix for diagnostics (e.g. "Chunk 2/3").
     */
    domain::RecoveryFragment decode(const std::string& raw,
                                    const std::vector<domain::SourceFile>& batch,
                                    const std::string& label = "Chunk") const;

    /** @brief Tier 3 fragment: one synthesized module per batch file, Unknown pattern at 0. */
    static domain::RecoveryFragment MinimalFragment(const std::vector<domain::SourceFile>& batch);

    /** @brief Parses @p text as a JSON object; std::nullopt on syntax error or non-object. */
    static std::optional<nlohmann::json> ParseObject(const std::string& text);

    /**
     * @brief Locates @p field by name and returns its raw value text.
     *
     * Containers are bracket-matched; a container left open by truncation runs to end of text.
     * String values are returned with their quotes.
     */
    static std::optional<std::string> LocateFieldValue(const std::string& text, const std::string& field);

    /**
     * @brief Parses the elements of a possibly truncated or damaged array one at a time.
     * Elements that cannot be repaired are skipped; parsing stops at the first element cut
     * off by end of text.
     */
    static nlohmann::json SalvageArray(const std::string& arrayText);

private:
    std::optional<domain::RecoveryFragment> tryCleanParse(const std::string& text,
                                                          const std::vector<domain::SourceFile>& batch) const;
    std::optional<domain::RecoveryFragment> tryBalancedRepair(const std::string& text,
                                                              const std::vector<domain::SourceFile>& batch) const;
    std::optional<domain::RecoveryFragment> trySalvageFields(const std::string& text,
                                                             const std::vector<domain::SourceFile>& batch) const;

    std::shared_ptr<domain::DiagnosticSink> m_sink;
};

} // namespace archlens::application
