#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace archlens::domain {

/**
 * @brief Character-level scanning and repair of almost-JSON text.
 *
 * Every routine is a single left-to-right state machine over {Normal, InString, Escaped}
 * (plus comment states where needed), so the cost stays linear in the input and a hostile
 * response cannot trigger regex backtracking. Nothing here throws.
 */
class JsonRepair {
public:
    enum class ScanState {
        Normal,
        InString,
        Escaped
    };

    /** @brief Removes markdown fence markers ("```", "```json") that open a line. */
    static std::string StripCodeFences(const std::string& text);

    /** @brief Drops prose before the first '{' and after the last '}'. */
    static std::string TrimToBraces(const std::string& text);

    /**
     * @brief Finds the bracket closing the '{' or '[' at @p openPos.
     * Brackets inside string literals are ignored.
     * @return Index of the closing bracket, or std::nullopt when the text ends first.
     */
    static std::optional<size_t> FindMatchingClose(const std::string& text, size_t openPos);

    /** @brief The first balanced {...} span in @p text, if any. */
    static std::optional<std::string> ExtractBalancedObject(const std::string& text);

    /** @brief Index one past the string literal opening at @p quotePos, or npos if unterminated. */
    static size_t SkipStringLiteral(const std::string& text, size_t quotePos);

    /** @brief Removes // line and block comments outside string literals. */
    static std::string StripComments(const std::string& text);

    /**
     * @brief Escapes interior quotes and raw control characters and closes a string left
     *        open at end of text.
     *
     * A quote seen inside a string terminates it only when the next significant character is
     * ':', ',', '}', ']' or end of text; otherwise it is an unescaped interior quote.
     */
    static std::string RepairStringLiterals(const std::string& text);

    /** @brief Removes commas directly followed by '}' or ']'. */
    static std::string StripTrailingCommas(const std::string& text);

    /** @brief Quotes bare identifiers in key position ({key: ...} -> {"key": ...}). */
    static std::string QuoteUnquotedKeys(const std::string& text);

    /** @brief All repairs, in the order string literals, comments, trailing commas, keys. */
    static std::string Repair(const std::string& text);
};

} // namespace archlens::domain
