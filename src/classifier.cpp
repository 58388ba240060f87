#include "pageflow/classifier.h"
#include "pageflow/normalizer.h"
#include "pageflow/text.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cctype>

namespace pageflow {

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

/// Digits are capped so that the value always fits in an int
constexpr size_t kMaxNumberDigits = 9;

int countElements(const MarkupNode& node, const std::string& tag) {
    int count = 0;
    for (const auto& child : node.children) {
        if (!child.isElement()) continue;
        if (child.tag == tag) ++count;
        count += countElements(child, tag);
    }
    return count;
}

bool containsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string& needle) {
        return !needle.empty() && haystack.find(needle) != std::string::npos;
    });
}

} // anonymous namespace

std::optional<int> chapterNumberFromIdentifier(const std::string& identifier) {
    static const std::string kKeyword = "chapter";
    std::string lower = toLower(identifier);

    size_t pos = lower.find(kKeyword);
    while (pos != std::string::npos) {
        size_t cursor = pos + kKeyword.size();
        if (cursor < lower.size() && (lower[cursor] == '_' || lower[cursor] == '-')) {
            ++cursor;
        }
        size_t digitsStart = cursor;
        while (cursor < lower.size() && isDigit(lower[cursor])) ++cursor;
        size_t digitCount = cursor - digitsStart;
        if (digitCount > 0 && digitCount <= kMaxNumberDigits) {
            return std::stoi(lower.substr(digitsStart, digitCount));
        }
        pos = lower.find(kKeyword, pos + 1);
    }
    return std::nullopt;
}

std::optional<std::string> displayTitleFromLabel(const std::string& label) {
    std::string title = trim(label);
    if (title.empty()) return std::nullopt;

    // Suppress "Chapter 12" / "ch 3": auto-generated labels are often misnumbered
    std::string lower = toLower(title);
    size_t cursor = 0;
    if (lower.compare(0, 7, "chapter") == 0) {
        cursor = 7;
    } else if (lower.compare(0, 2, "ch") == 0) {
        cursor = 2;
    } else {
        return title;
    }
    while (cursor < lower.size() && isSpace(lower[cursor])) ++cursor;
    size_t digitsStart = cursor;
    while (cursor < lower.size() && isDigit(lower[cursor])) ++cursor;
    if (cursor > digitsStart && cursor == lower.size()) {
        return std::nullopt;
    }
    return title;
}

int countLinks(const std::string& normalizedContent) {
    return countElements(parseMarkup(normalizedContent), "a");
}

// ---------------------------------------------------------------------------
// ChapterNumberer
// ---------------------------------------------------------------------------

std::optional<int> ChapterNumberer::assign(const Chapter& chapter) {
    if (chapter.isMetadata) return std::nullopt;

    if (chapter.explicitChapterNumber) {
        int number = *chapter.explicitChapterNumber;
        lastNumber_ = std::max(lastNumber_, number);
        return number;
    }
    return ++lastNumber_;
}

// ---------------------------------------------------------------------------
// ChapterClassifier
// ---------------------------------------------------------------------------

ChapterClassifier::ChapterClassifier(ClassifierSettings settings)
    : settings_(std::move(settings)) {}

bool ChapterClassifier::isMetadata(const std::string& normalizedContent,
                                   const std::string& path,
                                   const std::string& identifier) const {
    std::string text = toLower(collapseWhitespace(stripTags(normalizedContent)));
    for (const auto& phrase : settings_.metadataPhrases) {
        if (!phrase.empty() && text.find(phrase) != std::string::npos) {
            PF_LOGD("classifier: metadata phrase '%s' in '%s'", phrase.c_str(), identifier.c_str());
            return true;
        }
    }

    if (containsAny(toLower(path), settings_.metadataPathMarkers) ||
        containsAny(toLower(identifier), settings_.metadataIdentifierMarkers)) {
        PF_LOGD("classifier: metadata marker in path='%s' id='%s'", path.c_str(), identifier.c_str());
        return true;
    }

    int links = countLinks(normalizedContent);
    if (links > settings_.navigationLinkThreshold) {
        PF_LOGD("classifier: navigation page '%s' links=%d", identifier.c_str(), links);
        return true;
    }
    return false;
}

Chapter ChapterClassifier::classify(const std::string& normalizedContent,
                                    const SourceChapter& source,
                                    int sourceIndex) const {
    Chapter chapter;
    chapter.normalizedContent = normalizedContent;
    chapter.sourceIndex = sourceIndex;
    chapter.isMetadata = isMetadata(normalizedContent, source.path, source.identifier);

    if (!chapter.isMetadata) {
        chapter.title = displayTitleFromLabel(source.label);
        chapter.explicitChapterNumber = chapterNumberFromIdentifier(source.identifier);
    }
    return chapter;
}

std::vector<Chapter> ChapterClassifier::classifyAll(const std::vector<SourceChapter>& sources) const {
    std::vector<Chapter> chapters;
    chapters.reserve(sources.size());
    int metadataCount = 0;

    for (size_t i = 0; i < sources.size(); ++i) {
        const auto& source = sources[i];
        std::string normalized;
        try {
            normalized = normalizeMarkup(documentBody(source.root));
        } catch (const std::exception& e) {
            PF_LOGW("classifyAll: skipping chapter %zu '%s': %s",
                    i, source.identifier.c_str(), e.what());
            continue;
        }

        if (trim(stripTags(normalized)).empty()) {
            PF_LOGD("classifyAll: chapter %zu '%s' has no text", i, source.identifier.c_str());
            continue;
        }

        Chapter chapter = classify(normalized, source, static_cast<int>(i));
        if (chapter.isMetadata) ++metadataCount;
        chapters.push_back(std::move(chapter));
    }

    PF_LOGI("classifyAll: sources=%zu chapters=%zu metadata=%d",
            sources.size(), chapters.size(), metadataCount);
    return chapters;
}

} // namespace pageflow
