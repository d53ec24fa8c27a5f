#pragma once

/// @file xml_format.hpp
/// @brief Escaping and layout of generated XML
///
/// Envelopes come out of xmlrpc-c with markup already escaped and one
/// CRLF between elements. The helpers here apply the remaining output
/// options to such a document, and escape the text of the documents
/// Rivet writes itself (introspection XML, the documentation page).

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace rivet::xml {

/// Whitespace between elements
enum class verbosity {
    no_white_space,  ///< Everything on one line
    newlines_only,   ///< One element per line, no indentation
    pretty,          ///< One element per line, indented
};

/// Character escaping applied to text content (bit flags)
enum class escaping : uint8_t {
    none = 0,
    markup = 1 << 0,     ///< & < > as entities
    non_ascii = 1 << 1,  ///< Code points above 0x7F as numeric references
    non_print = 1 << 2,  ///< Control characters as numeric references
};

inline constexpr escaping operator|(escaping a, escaping b) noexcept {
    return static_cast<escaping>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr escaping operator&(escaping a, escaping b) noexcept {
    return static_cast<escaping>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline constexpr escaping operator~(escaping a) noexcept {
    return static_cast<escaping>(~static_cast<uint8_t>(a) & 0x07);
}

inline constexpr bool has_flag(escaping set, escaping flag) noexcept {
    return (set & flag) != escaping::none;
}

namespace detail {

/// Decode one UTF-8 sequence at text[i]. Returns the code point and
/// advances i, or returns -1 (leaving i on the bad byte) if malformed.
inline int32_t next_code_point(std::string_view text, size_t& i) noexcept {
    auto lead = static_cast<uint8_t>(text[i]);
    int extra;
    int32_t cp;
    if (lead < 0x80) { cp = lead; extra = 0; }
    else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; extra = 1; }
    else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; extra = 2; }
    else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; extra = 3; }
    else return -1;

    if (i + static_cast<size_t>(extra) >= text.size()) return -1;
    for (int k = 1; k <= extra; ++k) {
        auto b = static_cast<uint8_t>(text[i + k]);
        if ((b & 0xC0) != 0x80) return -1;
        cp = (cp << 6) | (b & 0x3F);
    }
    i += static_cast<size_t>(extra) + 1;
    return cp;
}

/// Net element depth change of one line of markup. Text never holds
/// a raw '<', so every '<' starts a tag.
inline int tag_balance(std::string_view line) noexcept {
    int balance = 0;
    for (size_t i = line.find('<'); i != std::string_view::npos; i = line.find('<', i + 1)) {
        if (i + 1 >= line.size()) break;
        char next = line[i + 1];
        if (next == '/') { --balance; continue; }
        if (next == '?' || next == '!') continue;
        auto close = line.find('>', i);
        if (close != std::string_view::npos && close > 0 && line[close - 1] == '/') continue;
        ++balance;
    }
    return balance;
}

/// Number of closing tags the line starts with
inline int leading_closes(std::string_view line) noexcept {
    int count = 0;
    while (line.starts_with("</")) {
        auto close = line.find('>');
        if (close == std::string_view::npos) break;
        ++count;
        line.remove_prefix(close + 1);
    }
    return count;
}

} // namespace detail

/// Escape character data according to the escaping flags. Without
/// `markup` the text may itself be a document: tags pass through and
/// only the other flags apply.
inline std::string escape_text(std::string_view text, escaping flags) {
    const bool markup = has_flag(flags, escaping::markup);
    const bool non_ascii = has_flag(flags, escaping::non_ascii);
    const bool non_print = has_flag(flags, escaping::non_print);

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c >= 0x80) {
            if (!non_ascii) {
                out += static_cast<char>(c);
                ++i;
                continue;
            }
            size_t j = i;
            int32_t cp = detail::next_code_point(text, j);
            if (cp < 0) {
                out += fmt::format("&#{};", c);
                ++i;
            } else {
                out += fmt::format("&#{};", cp);
                i = j;
            }
            continue;
        }

        ++i;
        if (markup) {
            if (c == '&') { out += "&amp;"; continue; }
            if (c == '<') { out += "&lt;"; continue; }
            if (c == '>') { out += "&gt;"; continue; }
        }
        if (non_print && ((c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7F)) {
            out += fmt::format("&#{};", c);
            continue;
        }
        out += static_cast<char>(c);
    }
    return out;
}

/// Escape text for a quoted attribute value
inline std::string escape_attribute(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

/// Re-lay a document whose elements are separated by CRLF. String text
/// never holds a raw CR (it is written as a character reference); the
/// only other CRLFs wrap base64 text, where whitespace is insignificant.
///   - pretty: one break per line, markup lines indented two spaces per level
///   - newlines_only: the same lines, no indentation
///   - no_white_space: all breaks removed
inline std::string relayout(std::string_view doc, verbosity layout) {
    std::string out;
    out.reserve(doc.size());
    int depth = 0;
    size_t pos = 0;
    while (pos < doc.size()) {
        auto end = doc.find("\r\n", pos);
        auto line = doc.substr(pos, end == std::string_view::npos ? std::string_view::npos
                                                                  : end - pos);
        pos = end == std::string_view::npos ? doc.size() : end + 2;
        if (line.empty()) continue;

        if (layout == verbosity::pretty && line.front() == '<') {
            int level = std::max(depth - detail::leading_closes(line), 0);
            out.append(static_cast<size_t>(level) * 2, ' ');
        }
        out.append(line);
        if (layout != verbosity::no_white_space) out += '\n';
        depth += detail::tag_balance(line);
    }
    return out;
}

} // namespace rivet::xml
