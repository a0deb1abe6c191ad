/**
 * @file ImportanceScorer.cpp
 * @brief Implementation of ImportanceScorer.
 */

#include "domain/ImportanceScorer.hpp"
#include "domain/ImportResolver.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <numeric>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace archlens::domain {

namespace {

constexpr int kEntryPointWeight = 100;
constexpr int kCoreFileWeight = 80;
constexpr int kInboundWeight = 5;
constexpr int kOutboundWeight = 3;
constexpr int kConfigWeight = 50;
constexpr int kServiceWeight = 30;
constexpr int kTestPenalty = 20;
constexpr int kSourceRootWeight = 10;

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string FileName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool AnyMatch(const std::string& text, const std::vector<std::regex>& patterns) {
    for (const auto& pattern : patterns) {
        if (std::regex_search(text, pattern)) return true;
    }
    return false;
}

const auto kIcase = std::regex::ECMAScript | std::regex::icase;

} // namespace

bool ImportanceScorer::IsEntryPoint(const std::string& path) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(^(src/)?(index|main|app|server|entry)\.(ts|tsx|js|jsx)$)", kIcase),
        std::regex(R"(package\.json$)"),
    };
    return AnyMatch(FileName(path), patterns) || AnyMatch(ToLower(path), patterns);
}

bool ImportanceScorer::IsCoreFile(const std::string& path) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(/services?/)", kIcase),
        std::regex(R"(/core/)", kIcase),
        std::regex(R"(/utils?/)", kIcase),
        std::regex(R"(/models?/)", kIcase),
        std::regex(R"(/lib/)", kIcase),
        std::regex(R"(service\.(ts|tsx|js|jsx)$)", kIcase),
        std::regex(R"(util\.(ts|tsx|js|jsx)$)", kIcase),
    };
    return AnyMatch("/" + ToLower(path), patterns);
}

bool ImportanceScorer::IsConfigFile(const std::string& path) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(config\.(ts|tsx|js|jsx)$)", kIcase),
        std::regex(R"(package\.json$)", kIcase),
        std::regex(R"(tsconfig\.json$)", kIcase),
    };
    return AnyMatch(path, patterns);
}

bool ImportanceScorer::IsServiceFile(const std::string& path) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(service\.(ts|tsx|js|jsx)$)", kIcase),
        std::regex(R"(/services?/)", kIcase),
    };
    return AnyMatch("/" + ToLower(path), patterns);
}

bool ImportanceScorer::IsTestFile(const std::string& path) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"((test|spec)\.(ts|tsx|js|jsx)$)", kIcase),
        std::regex(R"(/test)", kIcase),
        std::regex(R"(/spec)", kIcase),
    };
    return AnyMatch("/" + ToLower(path), patterns);
}

std::vector<int> ImportanceScorer::Score(const std::vector<SourceFile>& files) {
    std::unordered_map<std::string, std::unordered_set<std::string>> importedBy;
    std::vector<size_t> outbound(files.size(), 0);

    for (size_t i = 0; i < files.size(); ++i) {
        const auto imports = ImportResolver::ExtractImports(files[i].content);
        outbound[i] = imports.size();
        for (const auto& literal : imports) {
            auto target = ImportResolver::Resolve(literal, files[i].path, files);
            if (target && *target != files[i].path) {
                importedBy[*target].insert(files[i].path);
            }
        }
    }

    std::vector<int> scores(files.size(), 0);
    for (size_t i = 0; i < files.size(); ++i) {
        const std::string& path = files[i].path;
        const std::string lower = ToLower(path);
        int score = 0;

        if (IsEntryPoint(path)) score += kEntryPointWeight;
        if (IsCoreFile(path)) score += kCoreFileWeight;

        auto inbound = importedBy.find(path);
        if (inbound != importedBy.end()) {
            score += static_cast<int>(inbound->second.size()) * kInboundWeight;
        }
        score += static_cast<int>(outbound[i]) * kOutboundWeight;

        if (IsConfigFile(path)) score += kConfigWeight;
        if (IsServiceFile(path)) score += kServiceWeight;
        if (IsTestFile(path)) score -= kTestPenalty;

        if (lower.rfind("src/", 0) == 0 || lower.rfind("lib/", 0) == 0 ||
            lower.find("/src/") != std::string::npos || lower.find("/lib/") != std::string::npos) {
            score += kSourceRootWeight;
        }
        scores[i] = score;
    }
    return scores;
}

std::vector<SourceFile> ImportanceScorer::SelectImportant(const std::vector<SourceFile>& files, size_t maxFiles) {
    if (files.size() <= maxFiles) {
        return files;
    }

    const std::vector<int> scores = Score(files);
    std::vector<size_t> order(files.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });

    std::vector<size_t> selected(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(maxFiles));
    std::vector<bool> isEntry(files.size(), false);
    for (size_t i = 0; i < files.size(); ++i) {
        isEntry[i] = IsEntryPoint(files[i].path);
    }

    for (size_t i = 0; i < files.size(); ++i) {
        if (!isEntry[i] || std::find(selected.begin(), selected.end(), i) != selected.end()) continue;

        // Non-entry slots stay in score order, so the last one is the lowest scorer.
        auto victim = std::find_if(selected.rbegin(), selected.rend(), [&isEntry](size_t idx) { return !isEntry[idx]; });
        if (victim == selected.rend()) break;
        selected.erase(std::next(victim).base());
        selected.push_back(i);
    }

    std::vector<SourceFile> result;
    result.reserve(selected.size());
    for (size_t idx : selected) {
        result.push_back(files[idx]);
    }
    return result;
}

} // namespace archlens::domain
