#pragma once

#include "pageflow/chapter.h"
#include "pageflow/page.h"
#include <string>
#include <vector>

namespace pageflow {

/// Split a chapter's normalized markup into its top-level blocks
/// (p, h1-h6, div), descending through inline wrappers that contain blocks.
/// Loose inline content between blocks becomes a synthetic <p>.
std::vector<MarkupNode> flattenBlocks(const std::string& normalizedContent);

/// Split a block whose text exceeds maxChunkSize into same-tag fragments:
/// greedy sentence packing first, then word packing for any fragment that is
/// still too long. A block that already fits is returned unchanged.
std::vector<MarkupNode> splitOversizedBlock(const MarkupNode& block, int maxChunkSize);

/// The packing algorithm: turns classified chapters into size-bounded pages.
class Chunker {
public:
    /// Throws PageflowError(InvalidChunkSize) if maxChunkSize <= 0
    explicit Chunker(int maxChunkSize);

    /// Chunk every chapter in order. Chapters without text, or whose markup
    /// cannot be walked, are skipped; the result may be empty.
    ChunkResult build(const std::vector<Chapter>& chapters) const;

    int maxChunkSize() const { return maxChunkSize_; }

private:
    int maxChunkSize_;

    std::vector<std::string> chunkChapter(const Chapter& chapter) const;
};

/// Chunk chapters into pages of at most maxChunkSize code points of text.
/// Throws PageflowError(InvalidChunkSize) for a non-positive size and
/// PageflowError(NoExtractableContent) if no chapter yields a page.
ChunkResult chunk(const std::vector<Chapter>& chapters, int maxChunkSize);

} // namespace pageflow
