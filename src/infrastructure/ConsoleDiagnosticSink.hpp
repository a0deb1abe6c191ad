/**
 * @file ConsoleDiagnosticSink.hpp
 * @brief DiagnosticSink that prints "[Tag] message" lines to the console.
 */

#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include "domain/DiagnosticSink.hpp"

namespace archlens::infrastructure {

/**
 * @class ConsoleDiagnosticSink
 * @brief Info goes to @p out, errors to @p err; one mutex keeps lines from interleaving.
 */
class ConsoleDiagnosticSink : public domain::DiagnosticSink {
public:
    explicit ConsoleDiagnosticSink(std::string tag = "ArchLens",
                                   bool verbose = true,
                                   std::ostream& out = std::cout,
                                   std::ostream& err = std::cerr);

    void info(const std::string& message) override;
    void error(const std::string& message) override;

    void setVerbose(bool verbose);

private:
    std::string m_tag;
    bool m_verbose;
    std::ostream& m_out;
    std::ostream& m_err;
    std::mutex m_mutex;
};

} // namespace archlens::infrastructure
