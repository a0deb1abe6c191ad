/**
 * @file ChunkDispatcher.cpp
 * @brief Implementation of ChunkDispatcher.
 */

#include "application/ChunkDispatcher.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <cstddef>
#include <future>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace archlens::application {

using domain::InferenceService;
using domain::RequestProtocol;

namespace {

std::string ChunkLabel(const ChunkRequest& request) {
    return "Chunk " + std::to_string(request.index + 1) + "/" + std::to_string(request.totalChunks);
}

std::string JoinPaths(const std::vector<domain::SourceFile>& files) {
    std::ostringstream oss;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << files[i].path;
    }
    return oss.str();
}

} // namespace

ChunkDispatcher::ChunkDispatcher(std::shared_ptr<InferenceService> service,
                                 std::shared_ptr<domain::DiagnosticSink> sink,
                                 Options options)
    : m_service(std::move(service)),
      m_sink(sink ? std::move(sink) : std::make_shared<domain::NullDiagnosticSink>()),
      m_options(std::move(options)),
      m_decoder(m_sink) {}

std::vector<ChunkRequest> ChunkDispatcher::Partition(const std::vector<domain::SourceFile>& files,
                                                     std::size_t chunkSize,
                                                     std::size_t corpusSize,
                                                     bool testSuite) {
    const std::size_t size = std::max<std::size_t>(1, chunkSize);
    const std::size_t total = (files.size() + size - 1) / size;

    std::vector<ChunkRequest> requests;
    requests.reserve(total);
    for (std::size_t start = 0, index = 0; start < files.size(); start += size, ++index) {
        ChunkRequest request;
        request.index = index;
        request.totalChunks = total;
        request.corpusSize = corpusSize;
        request.testSuite = testSuite;
        const std::size_t end = std::min(files.size(), start + size);
        request.files.assign(files.begin() + static_cast<std::ptrdiff_t>(start),
                             files.begin() + static_cast<std::ptrdiff_t>(end));
        requests.push_back(std::move(request));
    }
    return requests;
}

std::vector<ChunkResult> ChunkDispatcher::dispatch(const std::vector<ChunkRequest>& requests) const {
    std::vector<std::future<ChunkResult>> pending;
    pending.reserve(requests.size());
    for (const auto& request : requests) {
        pending.push_back(std::async(std::launch::async, [this, &request]() { return processChunk(request); }));
    }

    std::vector<ChunkResult> results;
    results.reserve(requests.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            results.push_back(pending[i].get());
        } catch (const std::exception& e) {
            m_sink->error(ChunkLabel(requests[i]) + ": failed: " + e.what());
            results.push_back({requests[i].index, ResponseDecoder::MinimalFragment(requests[i].files), std::nullopt});
        }
    }
    return results;
}

ChunkResult ChunkDispatcher::processChunk(const ChunkRequest& request) const {
    const std::string label = ChunkLabel(request);
    m_sink->info(label + ": analyzing " + std::to_string(request.files.size()) + " files: " + JoinPaths(request.files));

    const std::string prompt = infrastructure::PromptCatalog::BuildChunkPrompt(
        request.files, request.corpusSize, request.testSuite, request.index + 1, request.totalChunks);

    const auto started = std::chrono::steady_clock::now();
    for (RequestProtocol protocol : m_options.strategy) {
        auto raw = attempt(protocol, prompt, label);
        if (!raw) continue;

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        m_sink->info(label + ": " + domain::ToString(protocol) + " answered in " +
                     std::to_string(elapsed.count()) + " ms (" + std::to_string(raw->size()) + " chars)");
        return {request.index, m_decoder.decode(*raw, request.files, label), protocol};
    }

    m_sink->error(label + ": every request protocol failed, using fallback analysis");
    return {request.index, ResponseDecoder::MinimalFragment(request.files), std::nullopt};
}

std::optional<std::string> ChunkDispatcher::attempt(RequestProtocol protocol,
                                                    const std::string& prompt,
                                                    const std::string& label) const {
    if (!m_service) {
        m_sink->error(label + ": no inference service configured");
        return std::nullopt;
    }

    // The worker owns copies of everything it touches, so an attempt abandoned on timeout can
    // finish after this chunk (or the whole run) is gone.
    auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
    auto future = promise->get_future();
    auto service = m_service;
    std::vector<InferenceService::ChatMessage> messages{
        {InferenceService::ChatMessage::Role::System, infrastructure::PromptCatalog::GetSystemPrompt()},
        {InferenceService::ChatMessage::Role::User, prompt}};
    std::string completionPrompt = prompt + infrastructure::PromptCatalog::GetCompletionHint();

    std::thread([promise, service, protocol, messages = std::move(messages),
                 completionPrompt = std::move(completionPrompt)]() {
        try {
            if (protocol == RequestProtocol::Chat) {
                promise->set_value(service->chat(messages));
            } else {
                promise->set_value(service->generate(completionPrompt));
            }
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        } catch (...) {
            promise->set_exception(std::make_exception_ptr(std::runtime_error("non-standard exception")));
        }
    }).detach();

    if (future.wait_for(m_options.attemptTimeout) != std::future_status::ready) {
        m_sink->error(label + ": " + domain::ToString(protocol) + " request timed out after " +
                      std::to_string(m_options.attemptTimeout.count()) + " ms");
        return std::nullopt;
    }

    try {
        auto response = future.get();
        if (!response) {
            m_sink->error(label + ": " + domain::ToString(protocol) + " request failed");
        }
        return response;
    } catch (const std::exception& e) {
        m_sink->error(label + ": " + domain::ToString(protocol) + " request threw: " + e.what());
    }
    return std::nullopt;
}

} // namespace archlens::application
