#include "pageflow/text.h"
#include <algorithm>
#include <cctype>

namespace pageflow {

namespace {

bool isSentenceEnd(char c) {
    return c == '.' || c == '!' || c == '?';
}

/// Byte length of a closing quote/bracket at pos, or 0
size_t closerLength(const std::string& s, size_t pos) {
    char c = s[pos];
    if (c == ')' || c == ']' || c == '\'' || c == '"' || c == '`') {
        return 1;
    }
    // U+2019 right single quote, U+201D right double quote
    if (s.compare(pos, 3, "\xe2\x80\x99") == 0 || s.compare(pos, 3, "\xe2\x80\x9d") == 0) {
        return 3;
    }
    // U+00BB right guillemet
    if (s.compare(pos, 2, "\xc2\xbb") == 0) {
        return 2;
    }
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// UTF-8
// ---------------------------------------------------------------------------

int utf8CharLen(const char* ptr) {
    unsigned char c = static_cast<unsigned char>(*ptr);
    if (c < 0x80) { return 1; }
    if ((c & 0xE0) == 0xC0) { return 2; }
    if ((c & 0xF0) == 0xE0) { return 3; }
    if ((c & 0xF8) == 0xF0) { return 4; }
    return 1;
}

uint32_t utf8Decode(const char* ptr, int len) {
    if (len == 1) { return static_cast<unsigned char>(ptr[0]); }
    if (len == 2) { return ((ptr[0] & 0x1F) << 6) | (ptr[1] & 0x3F); }
    if (len == 3) { return ((ptr[0] & 0x0F) << 12) | ((ptr[1] & 0x3F) << 6) | (ptr[2] & 0x3F); }
    if (len == 4) {
        return ((ptr[0] & 0x07) << 18) | ((ptr[1] & 0x3F) << 12) |
               ((ptr[2] & 0x3F) << 6) | (ptr[3] & 0x3F);
    }
    return 0;
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

size_t utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string utf8Prefix(const std::string& text, size_t codePoints) {
    size_t pos = 0;
    size_t taken = 0;
    while (pos < text.size() && taken < codePoints) {
        int len = utf8CharLen(text.c_str() + pos);
        pos = std::min(text.size(), pos + static_cast<size_t>(len));
        ++taken;
    }
    return text.substr(0, pos);
}

// ---------------------------------------------------------------------------
// Whitespace and case
// ---------------------------------------------------------------------------

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

std::string collapseWhitespace(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    bool inSpace = false;
    for (char c : s) {
        if (isSpace(c)) {
            if (!inSpace) result += ' ';
            inSpace = true;
        } else {
            result += c;
            inSpace = false;
        }
    }
    return result;
}

std::string toLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string removeWhitespace(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (!isSpace(c)) result += c;
    }
    return result;
}

// ---------------------------------------------------------------------------
// Segmentation
// ---------------------------------------------------------------------------

std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        size_t start = i;
        size_t j = i;
        while (j < n && !isSentenceEnd(text[j])) ++j;

        // No terminator ahead, or the run starts on one: the rest is a sentence
        if (j == n || j == start) {
            sentences.push_back(text.substr(start));
            break;
        }

        while (j < n && isSentenceEnd(text[j])) ++j;
        while (j < n) {
            size_t len = closerLength(text, j);
            if (len == 0) break;
            j += len;
        }
        while (j < n && isSpace(text[j])) ++j;

        sentences.push_back(text.substr(start, j - start));
        i = j;
    }

    sentences.erase(std::remove_if(sentences.begin(), sentences.end(),
                                   [](const std::string& s) { return trim(s).empty(); }),
                    sentences.end());
    return sentences;
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isSpace(text[i])) ++i;
        size_t start = i;
        while (i < text.size() && !isSpace(text[i])) ++i;
        if (i > start) {
            words.push_back(text.substr(start, i - start));
        }
    }
    return words;
}

std::vector<std::string> packPieces(const std::vector<std::string>& pieces, size_t maxLength) {
    std::vector<std::string> parts;
    std::string current;
    size_t currentLen = 0;

    for (const auto& raw : pieces) {
        std::string piece = trim(raw);
        if (piece.empty()) continue;
        size_t pieceLen = utf8Length(piece);

        if (currentLen > 0 && currentLen + pieceLen + 1 > maxLength) {
            parts.push_back(current);
            current.clear();
            currentLen = 0;
        }
        if (currentLen > 0) {
            current += ' ';
            ++currentLen;
        }
        current += piece;
        currentLen += pieceLen;
    }

    if (currentLen > 0) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace pageflow
