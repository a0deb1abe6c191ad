/**
 * @file JsonRepair.cpp
 * @brief Implementation of the JsonRepair scanners.
 */

#include "domain/JsonRepair.hpp"
#include <cctype>
#include <vector>

namespace archlens::domain {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

bool IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$' || c == '-';
}

bool IsValidEscape(char c) {
    switch (c) {
        case '"': case '\\': case '/': case 'b': case 'f': case 'n': case 'r': case 't': case 'u':
            return true;
        default:
            return false;
    }
}

// Position of the next character that is neither whitespace nor inside a comment, for every
// position of one text. Built right to left in one pass so each lookup is O(1), even when the
// text is full of unterminated comments.
class SignificantIndex {
public:
    explicit SignificantIndex(const std::string& text) : m_next(text.size() + 1, std::string::npos) {
        const size_t n = text.size();
        std::vector<size_t> newline(n + 1, std::string::npos);
        std::vector<size_t> blockClose(n + 2, std::string::npos);
        for (size_t i = n; i-- > 0;) {
            newline[i] = text[i] == '\n' ? i : newline[i + 1];
            blockClose[i] = (text[i] == '*' && i + 1 < n && text[i + 1] == '/') ? i : blockClose[i + 1];
        }
        for (size_t i = n; i-- > 0;) {
            const char c = text[i];
            const char next = i + 1 < n ? text[i + 1] : '\0';
            if (IsSpace(c)) {
                m_next[i] = m_next[i + 1];
            } else if (c == '/' && next == '/') {
                const size_t eol = newline[i];
                m_next[i] = eol == std::string::npos ? std::string::npos : m_next[eol + 1];
            } else if (c == '/' && next == '*') {
                const size_t close = blockClose[i + 2];
                m_next[i] = close == std::string::npos ? std::string::npos : m_next[close + 2];
            } else {
                m_next[i] = i;
            }
        }
    }

    size_t from(size_t pos) const {
        return pos < m_next.size() ? m_next[pos] : std::string::npos;
    }

private:
    std::vector<size_t> m_next;
};

bool ClosesString(const std::string& text, const SignificantIndex& index, size_t quotePos) {
    size_t next = index.from(quotePos + 1);
    if (next == std::string::npos) return true;
    char c = text[next];
    return c == ':' || c == ',' || c == '}' || c == ']';
}

bool AtLineStart(const std::string& text, size_t pos) {
    while (pos > 0 && (text[pos - 1] == ' ' || text[pos - 1] == '\t')) --pos;
    return pos == 0 || text[pos - 1] == '\n';
}

} // namespace

std::string JsonRepair::StripCodeFences(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 3, "```") == 0 && AtLineStart(text, i)) {
            i += 3;
            while (i < text.size() && std::isalnum(static_cast<unsigned char>(text[i]))) ++i;
            continue;
        }
        out += text[i++];
    }
    return out;
}

std::string JsonRepair::TrimToBraces(const std::string& text) {
    size_t first = text.find('{');
    size_t last = text.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        size_t start = text.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = text.find_last_not_of(" \t\r\n");
        return text.substr(start, end - start + 1);
    }
    return text.substr(first, last - first + 1);
}

std::optional<size_t> JsonRepair::FindMatchingClose(const std::string& text, size_t openPos) {
    if (openPos >= text.size() || (text[openPos] != '{' && text[openPos] != '[')) {
        return std::nullopt;
    }

    ScanState state = ScanState::Normal;
    int depth = 0;
    for (size_t i = openPos; i < text.size(); ++i) {
        const char c = text[i];
        switch (state) {
            case ScanState::Escaped:
                state = ScanState::InString;
                break;
            case ScanState::InString:
                if (c == '\\') state = ScanState::Escaped;
                else if (c == '"') state = ScanState::Normal;
                break;
            case ScanState::Normal:
                if (c == '"') {
                    state = ScanState::InString;
                } else if (c == '{' || c == '[') {
                    ++depth;
                } else if (c == '}' || c == ']') {
                    if (--depth == 0) return i;
                }
                break;
        }
    }
    return std::nullopt;
}

std::optional<std::string> JsonRepair::ExtractBalancedObject(const std::string& text) {
    size_t open = text.find('{');
    if (open == std::string::npos) return std::nullopt;
    auto close = FindMatchingClose(text, open);
    if (!close) return std::nullopt;
    return text.substr(open, *close - open + 1);
}

size_t JsonRepair::SkipStringLiteral(const std::string& text, size_t quotePos) {
    ScanState state = ScanState::InString;
    for (size_t i = quotePos + 1; i < text.size(); ++i) {
        if (state == ScanState::Escaped) {
            state = ScanState::InString;
        } else if (text[i] == '\\') {
            state = ScanState::Escaped;
        } else if (text[i] == '"') {
            return i + 1;
        }
    }
    return std::string::npos;
}

std::string JsonRepair::StripComments(const std::string& text) {
    enum class Mode { Code, String, Escape, LineComment, BlockComment };

    std::string out;
    out.reserve(text.size());
    Mode mode = Mode::Code;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';
        switch (mode) {
            case Mode::Code:
                if (c == '/' && next == '/') {
                    mode = Mode::LineComment;
                    ++i;
                } else if (c == '/' && next == '*') {
                    mode = Mode::BlockComment;
                    ++i;
                } else {
                    if (c == '"') mode = Mode::String;
                    out += c;
                }
                break;
            case Mode::String:
                if (c == '\\') mode = Mode::Escape;
                else if (c == '"') mode = Mode::Code;
                out += c;
                break;
            case Mode::Escape:
                mode = Mode::String;
                out += c;
                break;
            case Mode::LineComment:
                if (c == '\n') {
                    mode = Mode::Code;
                    out += c;
                }
                break;
            case Mode::BlockComment:
                if (c == '*' && next == '/') {
                    mode = Mode::Code;
                    ++i;
                }
                break;
        }
    }
    return out;
}

std::string JsonRepair::RepairStringLiterals(const std::string& text) {
    const SignificantIndex index(text);
    std::string out;
    out.reserve(text.size() + 16);
    ScanState state = ScanState::Normal;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (state) {
            case ScanState::Normal:
                out += c;
                if (c == '"') state = ScanState::InString;
                break;
            case ScanState::InString:
                if (c == '\\') {
                    state = ScanState::Escaped;
                } else if (c == '"') {
                    if (ClosesString(text, index, i)) {
                        out += c;
                        state = ScanState::Normal;
                    } else {
                        out += "\\\"";
                    }
                } else if (c == '\n') {
                    out += "\\n";
                } else if (c == '\r') {
                    out += "\\r";
                } else if (c == '\t') {
                    out += "\\t";
                } else if (static_cast<unsigned char>(c) >= 0x20) {
                    out += c;
                }
                break;
            case ScanState::Escaped:
                // A backslash before anything JSON does not know is kept as a literal backslash.
                if (c == '\n') {
                    out += "\\n";
                } else {
                    out += IsValidEscape(c) ? "\\" : "\\\\";
                    out += c;
                }
                state = ScanState::InString;
                break;
        }
    }

    if (state == ScanState::Escaped) {
        out += "\\\\\"";
    } else if (state == ScanState::InString) {
        out += '"';
    }
    return out;
}

std::string JsonRepair::StripTrailingCommas(const std::string& text) {
    const SignificantIndex index(text);
    std::string out;
    out.reserve(text.size());
    ScanState state = ScanState::Normal;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (state) {
            case ScanState::Normal:
                if (c == ',') {
                    size_t next = index.from(i + 1);
                    if (next != std::string::npos && (text[next] == '}' || text[next] == ']')) {
                        break;
                    }
                }
                if (c == '"') state = ScanState::InString;
                out += c;
                break;
            case ScanState::InString:
                if (c == '\\') state = ScanState::Escaped;
                else if (c == '"') state = ScanState::Normal;
                out += c;
                break;
            case ScanState::Escaped:
                state = ScanState::InString;
                out += c;
                break;
        }
    }
    return out;
}

std::string JsonRepair::QuoteUnquotedKeys(const std::string& text) {
    const SignificantIndex index(text);
    std::string out;
    out.reserve(text.size() + 16);
    ScanState state = ScanState::Normal;
    char lastSignificant = '\0';

    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (state == ScanState::InString) {
            if (c == '\\') state = ScanState::Escaped;
            else if (c == '"') state = ScanState::Normal;
            out += c;
            ++i;
            if (state == ScanState::Normal) lastSignificant = '"';
            continue;
        }
        if (state == ScanState::Escaped) {
            state = ScanState::InString;
            out += c;
            ++i;
            continue;
        }

        if (c == '"') {
            state = ScanState::InString;
            out += c;
            ++i;
            continue;
        }

        if (IsIdentifierStart(c) && (lastSignificant == '{' || lastSignificant == ',')) {
            size_t end = i;
            while (end < text.size() && IsIdentifierChar(text[end])) ++end;
            const std::string identifier = text.substr(i, end - i);
            size_t next = index.from(end);
            if (next != std::string::npos && text[next] == ':') {
                out += '"';
                out += identifier;
                out += '"';
            } else {
                out += identifier;
            }
            lastSignificant = identifier.back();
            i = end;
            continue;
        }

        if (!IsSpace(c)) lastSignificant = c;
        out += c;
        ++i;
    }
    return out;
}

std::string JsonRepair::Repair(const std::string& text) {
    std::string repaired = RepairStringLiterals(text);
    repaired = StripComments(repaired);
    repaired = StripTrailingCommas(repaired);
    return QuoteUnquotedKeys(repaired);
}

} // namespace archlens::domain
