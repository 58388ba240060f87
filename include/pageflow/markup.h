#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pageflow {

/// Kind of node in a markup tree
enum class NodeKind {
    Element,
    Text,
};

/// A node of a chapter's markup tree.
/// This is the traversal contract between a content source and the core:
/// element nodes carry a lower-case tag, ordered attributes and children;
/// text nodes carry entity-decoded text.
struct MarkupNode {
    NodeKind kind = NodeKind::Element;
    std::string tag;                                           // Element only, lower-case
    std::vector<std::pair<std::string, std::string>> attributes;
    std::vector<MarkupNode> children;
    std::string text;                                          // Text only

    static MarkupNode element(const std::string& tag) {
        MarkupNode node;
        node.kind = NodeKind::Element;
        node.tag = tag;
        return node;
    }
    static MarkupNode textNode(const std::string& t) {
        MarkupNode node;
        node.kind = NodeKind::Text;
        node.text = t;
        return node;
    }

    bool isElement() const { return kind == NodeKind::Element; }
    bool isText() const { return kind == NodeKind::Text; }

    /// Attribute value, or "" if absent
    std::string attribute(const std::string& name) const;
    bool hasAttribute(const std::string& name) const;
    void setAttribute(const std::string& name, const std::string& value);

    /// Concatenated text of all descendant text nodes
    std::string plainText() const;

    /// First descendant element (depth-first, excluding this node) with the tag
    const MarkupNode* findFirst(const std::string& tagName) const;
};

/// Maximum element nesting accepted by the parser and the tree walkers
constexpr int kMaxMarkupDepth = 512;

/// Parse an HTML fragment or document into a tree rooted at an element
/// with an empty tag. Throws PageflowError(MalformedMarkup) when the
/// nesting exceeds kMaxMarkupDepth.
MarkupNode parseMarkup(const std::string& html);

/// The <body> element of a parsed document, or the root itself if none
const MarkupNode& documentBody(const MarkupNode& root);

/// Serialize a node (element with its tags, or escaped text)
std::string serialize(const MarkupNode& node);

/// Serialize only the children of a node
std::string innerMarkup(const MarkupNode& node);

/// De-tagged, entity-decoded text of a markup string
std::string stripTags(const std::string& markup);

/// Decode named and numeric HTML entities
std::string decodeEntities(const std::string& text);

/// Escape & < > for text content
std::string escapeText(const std::string& text);

/// Escape & " < > for attribute values
std::string escapeAttribute(const std::string& value);

/// True for p, div, h1-h6 and the other tags that start a new block
bool isBlockLevelTag(const std::string& tag);

/// True for h1-h6
bool isHeadingTag(const std::string& tag);

} // namespace pageflow
