#include "domain/ImportResolver.hpp"
#include <cctype>
#include <unordered_set>

namespace archlens::domain {

namespace {
    // Specifiers live at the top of a file.
    constexpr std::size_t kMaxScanBytes = 64 * 1024;

    const char* kSourceExtensions[] = {".tsx", ".jsx", ".mjs", ".cjs", ".ts", ".js"};

    bool EndsWith(const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string DirectoryOf(const std::string& path) {
        size_t slash = path.find_last_of('/');
        return slash == std::string::npos ? std::string() : path.substr(0, slash);
    }

    std::string LastSegment(const std::string& path) {
        size_t slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }

    bool IsWordChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    bool IsBlank(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    /**
     * Cursor over the statements that carry module specifiers. Every rule either advances
     * @p pos past what it accepted or leaves it untouched. The only unbounded lookahead is the
     * search for a closing brace, which is cached so repeated `import {` stays linear.
     */
    class SpecifierScanner {
    public:
        explicit SpecifierScanner(const std::string& text) : m_text(text) {}

        // `import [clause from] "X"`
        std::optional<std::string> importAt(size_t& pos) {
            size_t at = pos;
            if (!keyword(at, "import") || !blanks(at)) return std::nullopt;
            if (auto literal = quoted(at)) {
                pos = at;
                return literal;
            }
            size_t afterType = at;
            if (keyword(afterType, "type") && blanks(afterType)) {
                if (auto literal = fromClause(afterType)) {
                    pos = afterType;
                    return literal;
                }
            }
            if (auto literal = fromClause(at)) {
                pos = at;
                return literal;
            }
            return std::nullopt;
        }

        // `export {..} from "X"`, `export * [as ns] from "X"`
        std::optional<std::string> reExportAt(size_t& pos) {
            size_t at = pos;
            if (!keyword(at, "export") || !blanks(at)) return std::nullopt;
            if (!braces(at)) {
                if (!symbol(at, '*')) return std::nullopt;
                size_t alias = at;
                if (blanks(alias) && keyword(alias, "as") && blanks(alias) && word(alias)) at = alias;
            }
            if (!blanks(at) || !keyword(at, "from") || !blanks(at)) return std::nullopt;
            auto literal = quoted(at);
            if (literal) pos = at;
            return literal;
        }

        // `require ( "X" )`
        std::optional<std::string> requireAt(size_t& pos) {
            size_t at = pos;
            if (!keyword(at, "require")) return std::nullopt;
            blanks(at);
            if (!symbol(at, '(')) return std::nullopt;
            blanks(at);
            auto literal = quoted(at);
            if (!literal) return std::nullopt;
            blanks(at);
            if (!symbol(at, ')')) return std::nullopt;
            pos = at;
            return literal;
        }

    private:
        // A default binding, `{...}` or `* as ns`, optionally followed by one more after a comma.
        std::optional<std::string> fromClause(size_t& pos) {
            size_t at = pos;
            if (!binding(at)) return std::nullopt;
            size_t second = at;
            blanks(second);
            if (symbol(second, ',')) {
                blanks(second);
                if (!binding(second)) return std::nullopt;
                at = second;
            }
            if (!blanks(at) || !keyword(at, "from") || !blanks(at)) return std::nullopt;
            auto literal = quoted(at);
            if (literal) pos = at;
            return literal;
        }

        bool binding(size_t& pos) {
            if (braces(pos)) return true;
            size_t at = pos;
            if (symbol(at, '*')) {
                if (blanks(at) && keyword(at, "as") && blanks(at) && word(at)) {
                    pos = at;
                    return true;
                }
                return false;
            }
            return word(pos);
        }

        bool keyword(size_t& pos, const char* name) const {
            const size_t length = std::char_traits<char>::length(name);
            if (m_text.compare(pos, length, name) != 0) return false;
            pos += length;
            return true;
        }

        bool symbol(size_t& pos, char c) const {
            if (pos >= m_text.size() || m_text[pos] != c) return false;
            ++pos;
            return true;
        }

        // One or more blanks.
        bool blanks(size_t& pos) const {
            const size_t start = pos;
            while (pos < m_text.size() && IsBlank(m_text[pos])) ++pos;
            return pos > start;
        }

        bool word(size_t& pos) const {
            const size_t start = pos;
            while (pos < m_text.size() && IsWordChar(m_text[pos])) ++pos;
            return pos > start;
        }

        bool braces(size_t& pos) {
            if (pos >= m_text.size() || m_text[pos] != '{') return false;
            if (m_closeFrom == std::string::npos || pos < m_closeFrom ||
                (m_close != std::string::npos && pos > m_close)) {
                m_closeFrom = pos;
                m_close = m_text.find('}', pos);
            }
            if (m_close == std::string::npos) return false;
            pos = m_close + 1;
            return true;
        }

        // A non-empty specifier between quotes, on one line.
        std::optional<std::string> quoted(size_t& pos) const {
            if (pos >= m_text.size() || (m_text[pos] != '\'' && m_text[pos] != '"')) return std::nullopt;
            size_t end = pos + 1;
            while (end < m_text.size() && m_text[end] != '\'' && m_text[end] != '"' && m_text[end] != '\n') ++end;
            if (end >= m_text.size() || m_text[end] == '\n' || end == pos + 1) return std::nullopt;
            std::string literal = m_text.substr(pos + 1, end - pos - 1);
            pos = end + 1;
            return literal;
        }

        const std::string& m_text;
        size_t m_closeFrom = std::string::npos;
        size_t m_close = std::string::npos;
    };

    using Rule = std::optional<std::string> (SpecifierScanner::*)(size_t&);

    void Collect(const std::string& text, const char* keyword, Rule rule,
                 std::vector<std::string>& out, std::unordered_set<std::string>& seen) {
        SpecifierScanner scanner(text);
        size_t pos = text.find(keyword);
        while (pos != std::string::npos) {
            size_t next = pos + 1;
            if (auto spec = (scanner.*rule)(pos)) {
                if (seen.insert(*spec).second) out.push_back(*spec);
                next = pos;
            }
            pos = text.find(keyword, next);
        }
    }
}

std::vector<std::string> ImportResolver::ExtractImports(const std::string& content) {
    const std::string text = content.size() > kMaxScanBytes ? content.substr(0, kMaxScanBytes) : content;

    std::vector<std::string> imports;
    std::unordered_set<std::string> seen;
    Collect(text, "import", &SpecifierScanner::importAt, imports, seen);
    Collect(text, "export", &SpecifierScanner::reExportAt, imports, seen);
    Collect(text, "require", &SpecifierScanner::requireAt, imports, seen);
    return imports;
}

std::string ImportResolver::StripSourceExtension(const std::string& path) {
    for (const char* ext : kSourceExtensions) {
        if (EndsWith(path, ext)) {
            return path.substr(0, path.size() - std::char_traits<char>::length(ext));
        }
    }
    return path;
}

std::string ImportResolver::NormalizeRelative(const std::string& literal, const std::string& fromDir) {
    std::vector<std::string> segments;
    auto push = [&segments](const std::string& part) {
        if (part.empty() || part == ".") return;
        if (part == "..") {
            if (!segments.empty()) segments.pop_back();
            return;
        }
        segments.push_back(part);
    };

    size_t start = 0;
    while (start <= fromDir.size() && !fromDir.empty()) {
        size_t slash = fromDir.find('/', start);
        if (slash == std::string::npos) slash = fromDir.size();
        push(fromDir.substr(start, slash - start));
        start = slash + 1;
    }
    start = 0;
    while (start <= literal.size()) {
        size_t slash = literal.find('/', start);
        if (slash == std::string::npos) slash = literal.size();
        push(literal.substr(start, slash - start));
        start = slash + 1;
    }

    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) joined += '/';
        joined += segment;
    }
    return joined;
}

std::optional<std::string> ImportResolver::Resolve(const std::string& literal,
                                                   const std::string& fromPath,
                                                   const std::vector<SourceFile>& corpus) {
    if (literal.empty()) return std::nullopt;
    const std::string clean = StripSourceExtension(literal);

    if (clean[0] == '.') {
        const std::string resolved = NormalizeRelative(clean, DirectoryOf(fromPath));
        if (resolved.empty()) return std::nullopt;

        for (const auto& file : corpus) {
            const std::string noExt = StripSourceExtension(file.path);
            if (file.path == resolved || noExt == resolved || EndsWith(noExt, "/" + resolved)) {
                return file.path;
            }
        }
        // "./components" may name a directory with an index module.
        const std::string indexPath = resolved + "/index";
        for (const auto& file : corpus) {
            if (StripSourceExtension(file.path) == indexPath) {
                return file.path;
            }
        }
        return std::nullopt;
    }

    const std::string name = LastSegment(clean);
    if (name.empty()) return std::nullopt;
    for (const auto& file : corpus) {
        if (LastSegment(StripSourceExtension(file.path)) == name) {
            return file.path;
        }
    }
    return std::nullopt;
}

} // namespace archlens::domain
