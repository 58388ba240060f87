#pragma once

#include "pageflow/chapter.h"
#include "pageflow/settings.h"
#include <optional>
#include <string>
#include <vector>

namespace pageflow {

/// Parse "chapter" + optional '_' or '-' + digits out of a source identifier
/// (case-insensitive, anywhere in the string). "chapter-7" -> 7.
std::optional<int> chapterNumberFromIdentifier(const std::string& identifier);

/// The label as display title, unless it is empty or a bare "Chapter N" / "Ch N"
std::optional<std::string> displayTitleFromLabel(const std::string& label);

/// Number of <a> elements in a normalized chapter
int countLinks(const std::string& normalizedContent);

/// Running chapter numbering across a chapter list.
/// Explicit numbers are used as-is and raise the counter; chapters without
/// one take the next sequential number. Metadata chapters get no number and
/// do not advance the counter.
class ChapterNumberer {
public:
    std::optional<int> assign(const Chapter& chapter);

private:
    int lastNumber_ = 0;
};

/// Turns source chapters into classified Chapter records
class ChapterClassifier {
public:
    explicit ChapterClassifier(ClassifierSettings settings = {});

    /// True if the chapter looks like a table of contents or front matter
    bool isMetadata(const std::string& normalizedContent,
                    const std::string& path,
                    const std::string& identifier) const;

    /// Classify an already-normalized chapter
    Chapter classify(const std::string& normalizedContent,
                     const SourceChapter& source,
                     int sourceIndex) const;

    /// Normalize and classify every source chapter in order. Chapters whose
    /// normalization fails or whose text is empty are logged and skipped.
    std::vector<Chapter> classifyAll(const std::vector<SourceChapter>& sources) const;

private:
    ClassifierSettings settings_;
};

} // namespace pageflow
