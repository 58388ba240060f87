#pragma once

#include "pageflow/chapter.h"
#include <string>
#include <vector>

namespace pageflow {

/// How a stand-alone HTML book was divided into chapters
enum class HtmlSplitStrategy {
    DataChapters,      // <article>/<section> elements carrying data-chapter
    ChapterHeadings,   // Body-level h1/h2 "Chapter N" or "N." headings
    WholeBody,         // The whole body as a single chapter
};

struct HtmlBook {
    std::vector<Chapter> chapters;
    HtmlSplitStrategy strategy = HtmlSplitStrategy::WholeBody;
};

/// Split a single HTML document into classified chapters. The first
/// strategy that yields a chapter wins. HTML chapters are never metadata
/// and always carry an explicit chapter number. Returns no chapters for a
/// document without text.
HtmlBook splitHtmlBook(const std::string& html);

/// Content source for EPUB-style books whose chapter documents are already
/// in memory, one HTML string per spine item
class HtmlSpineSource : public ContentSource {
public:
    struct Item {
        std::string html;
        std::string label;
        std::string identifier;
        std::string path;
    };

    void addItem(Item item) { items_.push_back(std::move(item)); }
    size_t size() const { return items_.size(); }

    /// Parses each item, one chapter per item in spine order. An item whose
    /// markup cannot be parsed is logged and yields a chapter with an empty
    /// tree, which classification drops.
    std::vector<SourceChapter> chapters() const override;

private:
    std::vector<Item> items_;
};

} // namespace pageflow
