#pragma once
// Chunker: long fragment text → sentence-aligned chunks
//
// Short text (<= max_chars code points) stays whole. Longer text is cut after
// sentence terminators (. ! ? ; newline and the full-width 。！？；) and
// adjacent short sentences are merged back up to max_chars. No chunk is ever
// produced by splitting inside a sentence.

#include <string>
#include <vector>

namespace resonance {

// Code points in a UTF-8 string
inline size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

inline size_t utf8_char_len(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

inline bool is_sentence_end(const std::string& ch) {
    if (ch.size() == 1) {
        char c = ch[0];
        return c == '.' || c == '!' || c == '?' || c == ';' || c == '\n';
    }
    return ch == "\xE3\x80\x82"      // 。
        || ch == "\xEF\xBC\x81"      // ！
        || ch == "\xEF\xBC\x9F"      // ？
        || ch == "\xEF\xBC\x9B";     // ；
}

inline std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;

    for (size_t i = 0; i < text.size();) {
        size_t len = utf8_char_len(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) len = text.size() - i;  // truncated sequence
        std::string ch = text.substr(i, len);
        current += ch;
        i += len;

        if (is_sentence_end(ch)) {
            std::string s = trim(current);
            if (!s.empty()) sentences.push_back(std::move(s));
            current.clear();
        }
    }

    std::string tail = trim(current);
    if (!tail.empty()) sentences.push_back(std::move(tail));
    return sentences;
}

// Empty (or whitespace-only) text yields no chunks
inline std::vector<std::string> split_chunks(const std::string& text, size_t max_chars) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return {};
    if (max_chars == 0 || utf8_length(trimmed) <= max_chars) return {trimmed};

    auto sentences = split_sentences(trimmed);
    if (sentences.empty()) return {trimmed};

    std::vector<std::string> chunks;
    std::string current = sentences[0];

    for (size_t i = 1; i < sentences.size(); ++i) {
        std::string merged = current + " " + sentences[i];
        if (utf8_length(merged) <= max_chars) {
            current = std::move(merged);
        } else {
            chunks.push_back(std::move(current));
            current = sentences[i];
        }
    }
    if (!current.empty()) chunks.push_back(std::move(current));

    return chunks;
}

} // namespace resonance
