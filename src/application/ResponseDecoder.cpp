/**
 * @file ResponseDecoder.cpp
 * @brief Implementation of the ResponseDecoder recovery ladder.
 */

#include "application/ResponseDecoder.hpp"
#include "application/FragmentBuilder.hpp"
#include "domain/JsonRepair.hpp"
#include "domain/ResultNormalizer.hpp"
#include <algorithm>
#include <cctype>

namespace archlens::application {

using domain::JsonRepair;
using domain::RecoveryFragment;
using domain::RecoveryTier;

namespace {

const char* const kSalvageFields[] = {
    "modules", "relationships", "pattern", "summary", "layers", "entryPoints", "coreComponents"};

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<nlohmann::json> ParseValue(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

size_t SkipBlanks(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) ++pos;
    return pos;
}

// Index just past `<key> : ` for the first occurrence of @p key that is followed by a colon.
// With @p wholeWord the key must not touch other identifier characters. Each blank run is
// walked once, since the next candidate always starts after it.
size_t FindKeyValueStart(const std::string& text, const std::string& key, bool wholeWord) {
    size_t pos = text.find(key);
    while (pos != std::string::npos) {
        const size_t after = pos + key.size();
        const bool bounded = !wholeWord ||
            ((pos == 0 || !IsWordChar(text[pos - 1])) && (after >= text.size() || !IsWordChar(text[after])));
        if (bounded) {
            const size_t colon = SkipBlanks(text, after);
            if (colon < text.size() && text[colon] == ':') {
                return SkipBlanks(text, colon + 1);
            }
        }
        pos = text.find(key, pos + 1);
    }
    return std::string::npos;
}

std::string Describe(const RecoveryFragment& fragment) {
    return std::string("tier ") + std::to_string(static_cast<int>(fragment.tier)) + " (" +
           domain::ToString(fragment.tier) + "), " + std::to_string(fragment.modules.size()) + " modules, " +
           std::to_string(fragment.relationships.size()) + " relationships";
}

} // namespace

ResponseDecoder::ResponseDecoder(std::shared_ptr<domain::DiagnosticSink> sink)
    : m_sink(sink ? std::move(sink) : std::make_shared<domain::NullDiagnosticSink>()) {}

RecoveryFragment ResponseDecoder::decode(const std::string& raw,
                                         const std::vector<domain::SourceFile>& batch,
                                         const std::string& label) const {
    if (IsBlank(raw)) {
        m_sink->error(label + ": empty response, using fallback analysis");
        return MinimalFragment(batch);
    }

    try {
        const std::string unfenced = JsonRepair::StripCodeFences(raw);

        std::optional<RecoveryFragment> fragment = tryCleanParse(JsonRepair::TrimToBraces(unfenced), batch);
        if (!fragment) fragment = tryBalancedRepair(unfenced, batch);
        if (!fragment) fragment = trySalvageFields(unfenced, batch);

        if (fragment) {
            m_sink->info(label + ": decoded at " + Describe(*fragment));
            return *fragment;
        }
        m_sink->error(label + ": no recoverable structure in response, using fallback analysis");
    } catch (const nlohmann::json::exception& e) {
        m_sink->error(label + ": JSON error while decoding: " + e.what());
    } catch (const std::exception& e) {
        m_sink->error(label + ": decoding failed: " + e.what());
    }
    return MinimalFragment(batch);
}

RecoveryFragment ResponseDecoder::MinimalFragment(const std::vector<domain::SourceFile>& batch) {
    RecoveryFragment fragment;
    fragment.tier = RecoveryTier::MinimalFallback;
    for (const auto& file : batch) {
        fragment.modules.push_back(domain::ResultNormalizer::SynthesizeModule(file));
    }
    fragment.pattern = domain::PatternClassification{domain::PatternName::Unknown, 0.0, "Chunk analysis failed"};
    fragment.layers = domain::ResultNormalizer::GroupByLayers(fragment.modules);
    fragment.summary = "Fallback analysis for " + std::to_string(batch.size()) + " files";
    return fragment;
}

std::optional<nlohmann::json> ResponseDecoder::ParseObject(const std::string& text) {
    auto value = ParseValue(text);
    if (!value || !value->is_object()) return std::nullopt;
    return value;
}

std::optional<std::string> ResponseDecoder::LocateFieldValue(const std::string& text, const std::string& field) {
    // Quoted keys first, so a bare word in some description does not shadow the real key.
    size_t start = FindKeyValueStart(text, "\"" + field + "\"", false);
    if (start == std::string::npos) {
        start = std::min(FindKeyValueStart(text, "'" + field + "'", false),
                         FindKeyValueStart(text, field, true));
    }
    if (start >= text.size()) return std::nullopt;

    const char open = text[start];
    if (open == '{' || open == '[') {
        auto close = JsonRepair::FindMatchingClose(text, start);
        return close ? text.substr(start, *close - start + 1) : text.substr(start);
    }
    if (open == '"') {
        size_t end = JsonRepair::SkipStringLiteral(text, start);
        return end == std::string::npos ? text.substr(start) : text.substr(start, end - start);
    }

    size_t end = text.find_first_of(",}]\n", start);
    return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

nlohmann::json ResponseDecoder::SalvageArray(const std::string& arrayText) {
    nlohmann::json items = nlohmann::json::array();
    if (arrayText.empty() || arrayText[0] != '[') return items;

    size_t i = 1;
    while (i < arrayText.size()) {
        const char c = arrayText[i];
        if (c == ',' || c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            ++i;
            continue;
        }
        if (c == ']') break;

        size_t next = std::string::npos;
        if (c == '{' || c == '[') {
            auto close = JsonRepair::FindMatchingClose(arrayText, i);
            if (!close) break;
            next = *close + 1;
        } else if (c == '"') {
            next = JsonRepair::SkipStringLiteral(arrayText, i);
            if (next == std::string::npos) break;
        } else {
            next = arrayText.find_first_of(",]", i);
            if (next == std::string::npos) break;
        }

        if (auto element = ParseValue(JsonRepair::Repair(arrayText.substr(i, next - i)))) {
            items.push_back(std::move(*element));
        }
        i = next;
    }
    return items;
}

std::optional<RecoveryFragment> ResponseDecoder::tryCleanParse(const std::string& text,
                                                               const std::vector<domain::SourceFile>& batch) const {
    auto doc = ParseObject(text);
    if (!doc || !FragmentBuilder::HasRecognizedField(*doc)) return std::nullopt;
    return FragmentBuilder::Build(*doc, batch, RecoveryTier::CleanParse);
}

std::optional<RecoveryFragment> ResponseDecoder::tryBalancedRepair(const std::string& text,
                                                                   const std::vector<domain::SourceFile>& batch) const {
    std::vector<std::string> candidates;
    if (auto balanced = JsonRepair::ExtractBalancedObject(text)) {
        candidates.push_back(*balanced);
    }
    const std::string trimmed = JsonRepair::TrimToBraces(text);
    if (candidates.empty() || candidates.front() != trimmed) {
        candidates.push_back(trimmed);
    }

    for (const auto& candidate : candidates) {
        auto doc = ParseObject(JsonRepair::Repair(candidate));
        if (doc && FragmentBuilder::HasRecognizedField(*doc)) {
            return FragmentBuilder::Build(*doc, batch, RecoveryTier::BalancedRepair);
        }
    }
    return std::nullopt;
}

std::optional<RecoveryFragment> ResponseDecoder::trySalvageFields(const std::string& text,
                                                                  const std::vector<domain::SourceFile>& batch) const {
    nlohmann::json doc = nlohmann::json::object();

    for (const char* field : kSalvageFields) {
        auto valueText = LocateFieldValue(text, field);
        if (!valueText || valueText->empty()) continue;

        const std::string repaired = JsonRepair::Repair(*valueText);
        auto value = ParseValue(repaired);
        if ((!value || !value->is_array()) && (*valueText)[0] == '[') {
            nlohmann::json salvaged = SalvageArray(*valueText);
            if (!salvaged.empty()) value = std::move(salvaged);
        }
        if (value && !value->is_null()) {
            doc[field] = std::move(*value);
        }
    }

    if (!FragmentBuilder::HasRecognizedField(doc)) return std::nullopt;

    RecoveryFragment fragment = FragmentBuilder::Build(doc, batch, RecoveryTier::FieldSalvage);
    if (!doc.contains("pattern")) {
        fragment.pattern = domain::PatternClassification{domain::PatternName::Unknown, 0.3, "Partial recovery"};
    }
    if (!doc.contains("layers")) {
        fragment.layers.clear();
    }
    return fragment;
}

} // namespace archlens::application
