/**
 * @file ChunkDispatcher.hpp
 * @brief Concurrent fan-out of file chunks to the inference service.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/ResponseDecoder.hpp"
#include "domain/ArchitectureGraph.hpp"
#include "domain/DiagnosticSink.hpp"
#include "domain/InferenceService.hpp"
#include "domain/SourceFile.hpp"

namespace archlens::application {

/**
 * @struct ChunkRequest
 * @brief One batch of files plus what the prompt needs to know about the whole run.
 */
struct ChunkRequest {
    std::size_t index = 0;       ///< Zero-based chunk index.
    std::size_t totalChunks = 0;
    std::vector<domain::SourceFile> files;
    std::size_t corpusSize = 0;  ///< Files in the whole analysis, for the prompt.
    bool testSuite = false;      ///< Selects the test-suite prompt template.
};

/**
 * @struct ChunkResult
 * @brief Decoded outcome of one chunk. `protocol` is empty when every protocol failed.
 */
struct ChunkResult {
    std::size_t index = 0;
    domain::RecoveryFragment fragment;
    std::optional<domain::RequestProtocol> protocol;
};

/**
 * @class ChunkDispatcher
 * @brief Sends every chunk concurrently and decodes each response.
 *
 * Each chunk walks the protocol strategy in order. A transport failure (no response, an
 * exception, or an attempt exceeding the timeout) moves on to the next protocol; when all of
 * them fail the chunk gets a minimal fallback fragment. A response that arrives, however
 * malformed, goes to the decoder and is not retried.
 */
class ChunkDispatcher {
public:
    struct Options {
        std::size_t chunkSize = 5;
        std::chrono::milliseconds attemptTimeout{60000};
        std::vector<domain::RequestProtocol> strategy{domain::RequestProtocol::Chat,
                                                      domain::RequestProtocol::Completion};
    };

    ChunkDispatcher(std::shared_ptr<domain::InferenceService> service,
                    std::shared_ptr<domain::DiagnosticSink> sink,
                    Options options);

    /**
     * @brief Splits @p files into ordered batches of at most @p chunkSize.
     * A chunk size of zero is treated as one.
     */
    static std::vector<ChunkRequest> Partition(const std::vector<domain::SourceFile>& files,
                                               std::size_t chunkSize,
                                               std::size_t corpusSize,
                                               bool testSuite);

    /**
     * @brief Runs every request concurrently and waits for all of them.
     * @return One result per request, in chunk-index order. Never throws.
     */
    std::vector<ChunkResult> dispatch(const std::vector<ChunkRequest>& requests) const;

    /** @brief Handles a single chunk on the calling thread. */
    ChunkResult processChunk(const ChunkRequest& request) const;

    const Options& options() const { return m_options; }

private:
    std::optional<std::string> attempt(domain::RequestProtocol protocol,
                                       const std::string& prompt,
                                       const std::string& label) const;

    std::shared_ptr<domain::InferenceService> m_service;
    std::shared_ptr<domain::DiagnosticSink> m_sink;
    Options m_options;
    ResponseDecoder m_decoder;
};

} // namespace archlens::application
