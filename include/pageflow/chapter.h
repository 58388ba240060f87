#pragma once

#include "pageflow/markup.h"
#include <optional>
#include <string>
#include <vector>

namespace pageflow {

/// A chapter as delivered by a content source, before classification
struct SourceChapter {
    MarkupNode root;          // Chapter body tree
    std::string label;        // Navigation label ("Chapter 3", "The Return", ...)
    std::string identifier;   // Spine identifier ("chapter-3", "cover", ...)
    std::string path;         // Source document path ("OEBPS/ch03.xhtml")
};

/// A classified chapter: the unit the Chunker consumes.
/// Immutable after classification; kept by the caller for re-chunking.
struct Chapter {
    std::optional<std::string> title;          // Display title (never an auto "Chapter N")
    std::string normalizedContent;             // Restricted page markup
    bool isMetadata = false;                   // Table of contents / front matter
    std::optional<int> explicitChapterNumber;  // From the source identifier
    int sourceIndex = 0;                       // Position in the source chapter list
};

/// Supplier of a book's chapters (EPUB spine reader, HTML splitter, ...)
class ContentSource {
public:
    virtual ~ContentSource() = default;

    /// Ordered chapters of the book
    virtual std::vector<SourceChapter> chapters() const = 0;
};

} // namespace pageflow
