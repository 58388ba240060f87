#include "pageflow/normalizer.h"
#include "pageflow/errors.h"
#include "pageflow/text.h"
#include "pageflow/log.h"

namespace pageflow {

namespace {

/// A piece of normalized markup plus the whitespace state at its edges,
/// so that adjacent pieces can be joined with exactly one space.
struct Fragment {
    std::string markup;
    bool hasText = false;          // de-tagged content is non-empty
    bool leadingSpace = false;     // source had whitespace before the content
    bool trailingSpace = false;    // source had whitespace after the content
    bool startsWithBlock = false;
    bool endsWithBlock = false;
};

class FragmentBuilder {
public:
    /// Append inline content (text or an inline element)
    void addInline(const Fragment& piece) {
        if (piece.markup.empty()) {
            if (piece.leadingSpace || piece.trailingSpace) markSpace();
            return;
        }
        if (result_.markup.empty()) {
            result_.leadingSpace = result_.leadingSpace || pendingSpace_ || piece.leadingSpace;
            result_.startsWithBlock = piece.startsWithBlock;
        } else if ((pendingSpace_ || piece.leadingSpace) &&
                   !result_.endsWithBlock && !piece.startsWithBlock) {
            result_.markup += ' ';
        }
        result_.markup += piece.markup;
        result_.hasText = result_.hasText || piece.hasText;
        result_.endsWithBlock = piece.endsWithBlock;
        pendingSpace_ = piece.trailingSpace;
    }

    /// Append a block element or a line break; spacing never crosses it
    void addBlock(const std::string& markup, bool hasText) {
        if (result_.markup.empty()) result_.startsWithBlock = true;
        result_.markup += markup;
        result_.hasText = result_.hasText || hasText;
        result_.endsWithBlock = true;
        pendingSpace_ = false;
    }

    Fragment finish() {
        result_.trailingSpace = pendingSpace_;
        Fragment out = std::move(result_);
        result_ = Fragment{};
        pendingSpace_ = false;
        return out;
    }

private:
    Fragment result_;
    bool pendingSpace_ = false;

    void markSpace() {
        if (result_.markup.empty()) {
            result_.leadingSpace = true;
        } else {
            pendingSpace_ = true;
        }
    }
};

bool isUnwantedTag(const std::string& tag) {
    return tag == "script" || tag == "style" || tag == "nav" ||
           tag == "header" || tag == "footer" || tag == "head";
}

/// Tags whose presence below a div means it already has block structure
bool isStructuralTag(const std::string& tag) {
    return tag == "p" || tag == "div" || isHeadingTag(tag) ||
           tag == "section" || tag == "article";
}

void checkDepth(int depth) {
    if (depth > kMaxMarkupDepth) {
        throw PageflowError(ErrorCode::MalformedMarkup,
                            "markup tree nests deeper than " + std::to_string(kMaxMarkupDepth));
    }
}

bool hasStructuralDescendant(const MarkupNode& node, int depth) {
    checkDepth(depth);
    for (const auto& child : node.children) {
        if (!child.isElement() || isUnwantedTag(child.tag)) continue;
        if (isStructuralTag(child.tag) || hasStructuralDescendant(child, depth + 1)) return true;
    }
    return false;
}

/// Opening tag with the class/style attributes kept by the page markup subset
std::string openTag(const std::string& tag, const MarkupNode& source) {
    std::string out = "<" + tag;
    std::string cls = source.attribute("class");
    std::string style = source.attribute("style");
    if (!cls.empty()) out += " class=\"" + escapeAttribute(cls) + "\"";
    if (!style.empty()) out += " style=\"" + escapeAttribute(style) + "\"";
    out += ">";
    return out;
}

Fragment textFragment(const std::string& text) {
    Fragment f;
    std::string collapsed = collapseWhitespace(text);
    if (collapsed.empty()) return f;
    f.leadingSpace = collapsed.front() == ' ';
    f.trailingSpace = collapsed.back() == ' ';
    std::string content = trim(collapsed);
    f.markup = escapeText(content);
    f.hasText = !content.empty();
    return f;
}

Fragment wrapInline(const std::string& open, const std::string& close, Fragment inner) {
    if (!inner.hasText) {
        // Drop empty inline wrappers but keep the whitespace they carried
        Fragment f;
        f.leadingSpace = inner.leadingSpace || inner.trailingSpace;
        return f;
    }
    inner.markup = open + inner.markup + close;
    inner.startsWithBlock = false;
    inner.endsWithBlock = false;
    return inner;
}

class Normalizer {
public:
    Fragment children(const MarkupNode& node, int depth) {
        checkDepth(depth);
        FragmentBuilder builder;
        for (const auto& child : node.children) {
            append(builder, child, depth + 1);
        }
        return builder.finish();
    }

private:
    void append(FragmentBuilder& builder, const MarkupNode& node, int depth) {
        if (node.isText()) {
            builder.addInline(textFragment(node.text));
            return;
        }

        const std::string& tag = node.tag;
        if (isUnwantedTag(tag)) return;

        if (tag == "br") {
            builder.addBlock("<br>", false);
        } else if (tag == "p" || isHeadingTag(tag)) {
            Fragment inner = children(node, depth);
            if (inner.hasText) {
                builder.addBlock(openTag(tag, node) + inner.markup + "</" + tag + ">", true);
            }
        } else if (tag == "div") {
            appendDiv(builder, node, depth);
        } else if (tag == "em" || tag == "i") {
            builder.addInline(wrapInline("<em>", "</em>", children(node, depth)));
        } else if (tag == "strong" || tag == "b") {
            builder.addInline(wrapInline("<strong>", "</strong>", children(node, depth)));
        } else if (tag == "span") {
            Fragment inner = children(node, depth);
            if (node.hasAttribute("class") || node.hasAttribute("style")) {
                inner = wrapInline(openTag("span", node), "</span>", std::move(inner));
            }
            builder.addInline(inner);
        } else if (tag == "a") {
            Fragment inner = children(node, depth);
            std::string href = node.attribute("href");
            if (!href.empty()) {
                inner = wrapInline("<a href=\"" + escapeAttribute(href) + "\">", "</a>", std::move(inner));
            }
            builder.addInline(inner);
        } else {
            // section, article, main and anything unknown: keep only the content
            builder.addInline(children(node, depth));
        }
    }

    void appendDiv(FragmentBuilder& builder, const MarkupNode& node, int depth) {
        std::string content;
        bool hasText = false;

        if (hasStructuralDescendant(node, depth)) {
            Fragment inner = children(node, depth);
            content = inner.markup;
            hasText = inner.hasText;
        } else {
            // Inline-only wrapper: regroup its text into paragraphs
            FragmentBuilder group;
            auto flush = [&]() {
                Fragment para = group.finish();
                if (para.hasText) {
                    content += "<p>" + para.markup + "</p>";
                    hasText = true;
                }
            };
            for (const auto& child : node.children) {
                if (child.isElement() && isUnwantedTag(child.tag)) continue;
                if (child.isElement() && child.tag == "br") {
                    flush();
                } else if (child.isElement() && isBlockLevelTag(child.tag)) {
                    flush();
                    group.addInline(children(child, depth + 1));
                    flush();
                } else {
                    append(group, child, depth + 1);
                }
            }
            flush();
        }

        if (hasText) {
            builder.addBlock(openTag("div", node) + content + "</div>", true);
        }
    }
};

} // anonymous namespace

std::string normalizeMarkup(const MarkupNode& root) {
    Normalizer normalizer;
    Fragment result = normalizer.children(root, 0);
    if (!result.hasText) {
        return "";
    }
    return result.markup;
}

std::string normalizeHtml(const std::string& html) {
    MarkupNode root = parseMarkup(html);
    std::string normalized = normalizeMarkup(documentBody(root));
    PF_LOGD("normalizeHtml: html=%zu normalized=%zu", html.size(), normalized.size());
    return normalized;
}

} // namespace pageflow
