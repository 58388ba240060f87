#include "pageflow/page.h"
#include "pageflow/markup.h"

namespace pageflow {

std::string Page::plainText() const {
    return stripTags(text);
}

const ChapterIndexEntry* ChapterIndex::entryForPage(int pageIndex) const {
    for (const auto& entry : entries) {
        if (pageIndex >= entry.startPageIndex && pageIndex <= entry.endPageIndex) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace pageflow
