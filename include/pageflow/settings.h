#pragma once

#include <string>
#include <vector>

namespace pageflow {

/// Named page-density presets offered to the reader
enum class Density {
    Less,     // fewer characters per page, more pages
    Medium,
    More,     // more characters per page, fewer pages
};

/// Chunk size used for the very first chunking of a freshly loaded book
constexpr int kBulkLoadChunkSize = 400;

/// Map a density preset to its maxChunkSize (300 / 500 / 800)
int chunkSizeForDensity(Density density);

/// "less", "medium" or "more"
const char* densityName(Density density);

/// Parse "less" / "medium" / "more".
/// Throws PageflowError(InvalidDensity) for anything else.
Density parseDensity(const std::string& key);

/// Tunables for chapter classification
struct ClassifierSettings {
    /// Lower-case phrases marking a table of contents or publisher front matter
    std::vector<std::string> metadataPhrases = {
        "contents", "table of contents", "toc",
        "project gutenberg", "ebook", "copyright", "license",
    };
    std::vector<std::string> metadataPathMarkers = {"title", "cover", "copyright"};
    std::vector<std::string> metadataIdentifierMarkers = {"cover", "header"};

    /// A chapter with more links than this is treated as a navigation page
    int navigationLinkThreshold = 10;
};

/// Tunables for position matching after a re-chunk
struct ReflowSettings {
    int snippetMinLength = 50;    // code points; shorter snippets are not searched
    int snippetMaxLength = 200;   // code points
};

/// Tunables for the page-flip state machine
struct PaginationSettings {
    float swipeThreshold = 40.0f;          // drag distance needed to change page
    float transitionDurationMs = 300.0f;   // page-flip animation length
};

/// Reader-wide configuration
struct ReaderSettings {
    Density density = Density::Medium;
    bool bulkLoad = false;    // Chunk the first load at kBulkLoadChunkSize
    ClassifierSettings classifier;
    ReflowSettings reflow;
    PaginationSettings pagination;
};

} // namespace pageflow
