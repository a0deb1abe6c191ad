/**
 * @file DiagnosticSink.hpp
 * @brief Injected progress/diagnostic reporting for the analysis pipeline.
 */

#pragma once
#include <string>

namespace archlens::domain {

/**
 * @class DiagnosticSink
 * @brief Receives progress and error lines. Implementations must be safe to call from
 *        several chunk threads at once.
 */
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void info(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

/** @brief Discards everything. */
class NullDiagnosticSink : public DiagnosticSink {
public:
    void info(const std::string&) override {}
    void error(const std::string&) override {}
};

} // namespace archlens::domain
