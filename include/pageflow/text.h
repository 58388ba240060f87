#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pageflow {

// ---------------------------------------------------------------------------
// UTF-8 helpers. All chunk sizes in pageflow count code points.
// ---------------------------------------------------------------------------

/// Byte length of the UTF-8 sequence starting at ptr (1 for invalid lead bytes)
int utf8CharLen(const char* ptr);

/// Decode one code point of the given byte length
uint32_t utf8Decode(const char* ptr, int len);

/// Append a code point as UTF-8
void appendUtf8(std::string& out, uint32_t cp);

/// Number of code points in a UTF-8 string
size_t utf8Length(const std::string& text);

/// The first `codePoints` code points of text
std::string utf8Prefix(const std::string& text, size_t codePoints);

// ---------------------------------------------------------------------------
// Whitespace and case
// ---------------------------------------------------------------------------

bool isSpace(char c);

std::string trim(const std::string& s);

/// Replace every whitespace run with a single space (does not trim)
std::string collapseWhitespace(const std::string& s);

/// ASCII lower-case
std::string toLower(const std::string& s);

/// Drop every whitespace character
std::string removeWhitespace(const std::string& s);

// ---------------------------------------------------------------------------
// Sentence / word segmentation
// ---------------------------------------------------------------------------

/// Split text into sentences. A sentence is a run of text ending in one or
/// more of . ! ? followed by optional closing quotes or brackets and trailing
/// whitespace; the final unterminated run is a sentence of its own.
/// Whitespace-only pieces are dropped; the pieces are not trimmed, so their
/// concatenation reproduces the input minus dropped whitespace.
std::vector<std::string> splitSentences(const std::string& text);

/// Split text on whitespace runs, dropping empty words
std::vector<std::string> splitWords(const std::string& text);

/// Greedily join trimmed pieces with single spaces into parts of at most
/// maxLength code points. A piece that alone exceeds maxLength forms its own
/// part. Empty pieces are skipped.
std::vector<std::string> packPieces(const std::vector<std::string>& pieces, size_t maxLength);

} // namespace pageflow
