#include "pageflow/book_source.h"
#include "pageflow/normalizer.h"
#include "pageflow/text.h"
#include "pageflow/log.h"
#include <cstdlib>

namespace pageflow {

namespace {

/// Leading integer of an attribute value ("12", "12a" -> 12)
std::optional<int> parseLeadingInt(const std::string& value) {
    std::string s = trim(value);
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    size_t digitsStart = i;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9' && i - digitsStart < 9) ++i;
    if (i == digitsStart) return std::nullopt;
    int number = std::atoi(s.substr(0, i).c_str());
    if (number == 0) return std::nullopt;
    return number;
}

std::string headingText(const MarkupNode& node) {
    return trim(collapseWhitespace(node.plainText()));
}

bool hasText(const std::string& normalized) {
    return !trim(stripTags(normalized)).empty();
}

void collectDataChapters(const MarkupNode& node, std::vector<const MarkupNode*>& out) {
    for (const auto& child : node.children) {
        if (!child.isElement()) continue;
        if ((child.tag == "article" || child.tag == "section") && child.hasAttribute("data-chapter")) {
            out.push_back(&child);
        } else {
            collectDataChapters(child, out);
        }
    }
}

/// First h1, h2 or h3 in document order
const MarkupNode* findFirstHeading(const MarkupNode& node) {
    for (const auto& child : node.children) {
        if (!child.isElement()) continue;
        if (child.tag == "h1" || child.tag == "h2" || child.tag == "h3") return &child;
        if (const MarkupNode* found = findFirstHeading(child)) return found;
    }
    return nullptr;
}

/// "Chapter 12" anywhere in the text, or a leading "12."
bool isChapterHeadingText(const std::string& text) {
    std::string lower = toLower(text);
    size_t pos = lower.find("chapter");
    while (pos != std::string::npos) {
        size_t i = pos + 7;
        size_t spaceStart = i;
        while (i < lower.size() && isSpace(lower[i])) ++i;
        if (i > spaceStart && i < lower.size() && lower[i] >= '0' && lower[i] <= '9') return true;
        pos = lower.find("chapter", pos + 1);
    }
    size_t i = 0;
    while (i < lower.size() && lower[i] >= '0' && lower[i] <= '9') ++i;
    return i > 0 && i < lower.size() && lower[i] == '.';
}

Chapter makeChapter(std::optional<std::string> title, std::string content, int number, int sourceIndex) {
    Chapter chapter;
    chapter.title = std::move(title);
    chapter.normalizedContent = std::move(content);
    chapter.isMetadata = false;
    chapter.explicitChapterNumber = number;
    chapter.sourceIndex = sourceIndex;
    return chapter;
}

std::vector<Chapter> splitByDataChapters(const MarkupNode& body) {
    std::vector<const MarkupNode*> sections;
    collectDataChapters(body, sections);

    std::vector<Chapter> chapters;
    for (size_t i = 0; i < sections.size(); ++i) {
        const MarkupNode& section = *sections[i];
        std::string content = normalizeMarkup(section);
        if (!hasText(content)) continue;

        std::optional<int> number = parseLeadingInt(section.attribute("data-chapter"));
        if (!number) number = parseLeadingInt(section.attribute("data-chapter-number"));
        if (!number) number = static_cast<int>(i) + 1;

        std::optional<std::string> title;
        std::string titleAttr = trim(section.attribute("data-chapter-title"));
        if (!titleAttr.empty()) {
            title = titleAttr;
        } else if (const MarkupNode* heading = findFirstHeading(section)) {
            std::string text = headingText(*heading);
            if (!text.empty()) title = text;
        }

        chapters.push_back(makeChapter(std::move(title), std::move(content), *number, static_cast<int>(i)));
    }
    return chapters;
}

std::vector<Chapter> splitByHeadings(const MarkupNode& body) {
    std::vector<Chapter> chapters;
    if (!body.findFirst("h1") && !body.findFirst("h2")) return chapters;

    MarkupNode current = MarkupNode::element("");
    std::optional<std::string> currentTitle;
    int nextNumber = 1;
    int sourceIndex = 0;

    auto flush = [&]() {
        std::string content = normalizeMarkup(current);
        if (hasText(content)) {
            chapters.push_back(makeChapter(currentTitle, std::move(content), nextNumber++, sourceIndex));
        }
        ++sourceIndex;
        current = MarkupNode::element("");
    };

    bool sawHeading = false;
    for (const auto& child : body.children) {
        if (child.isElement() && (child.tag == "h1" || child.tag == "h2") &&
            isChapterHeadingText(headingText(child))) {
            flush();
            currentTitle = headingText(child);
            sawHeading = true;
            continue;
        }
        current.children.push_back(child);
    }
    flush();

    // Plain h1/h2 without chapter numbering: leave it to the next strategy
    if (!sawHeading) chapters.clear();
    return chapters;
}

std::vector<Chapter> wholeBody(const MarkupNode& root, const MarkupNode& body) {
    std::vector<Chapter> chapters;
    std::string content = normalizeMarkup(body);
    if (!hasText(content)) return chapters;

    std::optional<std::string> title;
    if (const MarkupNode* h1 = root.findFirst("h1")) {
        std::string text = headingText(*h1);
        if (!text.empty()) title = text;
    }
    if (!title) {
        if (const MarkupNode* docTitle = root.findFirst("title")) {
            std::string text = headingText(*docTitle);
            if (!text.empty()) title = text;
        }
    }
    chapters.push_back(makeChapter(std::move(title), std::move(content), 1, 0));
    return chapters;
}

const char* strategyName(HtmlSplitStrategy strategy) {
    switch (strategy) {
        case HtmlSplitStrategy::DataChapters:    return "data-chapters";
        case HtmlSplitStrategy::ChapterHeadings: return "chapter-headings";
        case HtmlSplitStrategy::WholeBody:       return "whole-body";
    }
    return "unknown";
}

} // anonymous namespace

HtmlBook splitHtmlBook(const std::string& html) {
    MarkupNode root = parseMarkup(html);
    const MarkupNode& body = documentBody(root);

    HtmlBook book;
    book.chapters = splitByDataChapters(body);
    book.strategy = HtmlSplitStrategy::DataChapters;

    if (book.chapters.empty()) {
        book.chapters = splitByHeadings(body);
        book.strategy = HtmlSplitStrategy::ChapterHeadings;
    }
    if (book.chapters.empty()) {
        book.chapters = wholeBody(root, body);
        book.strategy = HtmlSplitStrategy::WholeBody;
    }

    PF_LOGI("splitHtmlBook: html=%zu chapters=%zu strategy=%s",
            html.size(), book.chapters.size(), strategyName(book.strategy));
    return book;
}

// ---------------------------------------------------------------------------
// HtmlSpineSource
// ---------------------------------------------------------------------------

std::vector<SourceChapter> HtmlSpineSource::chapters() const {
    std::vector<SourceChapter> result;
    result.reserve(items_.size());
    for (const auto& item : items_) {
        SourceChapter chapter;
        try {
            chapter.root = parseMarkup(item.html);
        } catch (const std::exception& e) {
            // Keep an empty slot so later chapters keep their spine position
            PF_LOGW("spine: cannot parse '%s': %s", item.identifier.c_str(), e.what());
            chapter.root = MarkupNode::element("");
        }
        chapter.label = item.label;
        chapter.identifier = item.identifier;
        chapter.path = item.path;
        result.push_back(std::move(chapter));
    }
    return result;
}

} // namespace pageflow
