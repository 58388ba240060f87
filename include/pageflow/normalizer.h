#pragma once

#include "pageflow/markup.h"
#include <string>

namespace pageflow {

/// Walk a chapter's markup tree and produce the restricted page markup:
/// only p, br, h1-h6, em, strong, span, a and div survive, non-content
/// elements are dropped, text whitespace is collapsed and inline-only
/// block-wrappers are resegmented into paragraphs.
/// Throws PageflowError(MalformedMarkup) if the tree nests deeper than
/// kMaxMarkupDepth.
std::string normalizeMarkup(const MarkupNode& root);

/// Parse an HTML string and normalize its body
std::string normalizeHtml(const std::string& html);

} // namespace pageflow
