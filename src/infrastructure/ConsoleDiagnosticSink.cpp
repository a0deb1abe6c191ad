#include "infrastructure/ConsoleDiagnosticSink.hpp"
#include <utility>

namespace archlens::infrastructure {

ConsoleDiagnosticSink::ConsoleDiagnosticSink(std::string tag, bool verbose, std::ostream& out, std::ostream& err)
    : m_tag(std::move(tag)), m_verbose(verbose), m_out(out), m_err(err) {}

void ConsoleDiagnosticSink::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_verbose) return;
    m_out << "[" << m_tag << "] " << message << std::endl;
}

void ConsoleDiagnosticSink::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_err << "[" << m_tag << "] ERROR: " << message << std::endl;
}

void ConsoleDiagnosticSink::setVerbose(bool verbose) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_verbose = verbose;
}

} // namespace archlens::infrastructure
