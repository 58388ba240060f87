#include "pageflow/markup.h"
#include "pageflow/errors.h"
#include "pageflow/text.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace pageflow {

namespace {

/// Simple HTML tag info
struct Tag {
    std::string name;
    bool isClosing = false;
    bool isSelfClosing = false;
    std::vector<std::pair<std::string, std::string>> attributes;
};

bool isVoidTag(const std::string& name) {
    return name == "br" || name == "hr" || name == "img" || name == "meta" ||
           name == "link" || name == "input" || name == "wbr" || name == "col" ||
           name == "area" || name == "base" || name == "source";
}

bool isRawTextTag(const std::string& name) {
    return name == "script" || name == "style";
}

/// Find the end of a tag starting at pos ('<'), honoring quoted attribute values
size_t findTagEnd(const std::string& html, size_t pos) {
    char quote = 0;
    for (size_t i = pos + 1; i < html.size(); ++i) {
        char c = html[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i;
        }
    }
    return std::string::npos;
}

/// Parse the attribute list of a raw tag body (after the tag name)
void parseAttributes(const std::string& raw, size_t pos,
                     std::vector<std::pair<std::string, std::string>>& out) {
    while (pos < raw.size()) {
        while (pos < raw.size() && (isSpace(raw[pos]) || raw[pos] == '/')) ++pos;
        if (pos >= raw.size()) break;

        size_t nameStart = pos;
        while (pos < raw.size() && !isSpace(raw[pos]) && raw[pos] != '=' && raw[pos] != '/') ++pos;
        std::string name = toLower(raw.substr(nameStart, pos - nameStart));

        while (pos < raw.size() && isSpace(raw[pos])) ++pos;
        std::string value;
        if (pos < raw.size() && raw[pos] == '=') {
            ++pos;
            while (pos < raw.size() && isSpace(raw[pos])) ++pos;
            if (pos < raw.size() && (raw[pos] == '"' || raw[pos] == '\'')) {
                char quote = raw[pos];
                auto valEnd = raw.find(quote, pos + 1);
                if (valEnd == std::string::npos) valEnd = raw.size();
                value = raw.substr(pos + 1, valEnd - pos - 1);
                pos = valEnd + 1;
            } else {
                size_t valStart = pos;
                while (pos < raw.size() && !isSpace(raw[pos])) ++pos;
                value = raw.substr(valStart, pos - valStart);
            }
        }
        if (!name.empty()) {
            out.emplace_back(name, decodeEntities(value));
        }
    }
}

/// Parse the tag at pos, returns the position after '>' (or pos on failure)
size_t parseTag(const std::string& html, size_t pos, Tag& tag) {
    if (pos >= html.size() || html[pos] != '<') return pos;

    auto end = findTagEnd(html, pos);
    if (end == std::string::npos) return pos;

    std::string raw = html.substr(pos + 1, end - pos - 1);
    tag.isClosing = (!raw.empty() && raw[0] == '/');
    tag.isSelfClosing = (!raw.empty() && raw.back() == '/');

    // Extract tag name
    size_t nameStart = tag.isClosing ? 1 : 0;
    size_t nameEnd = raw.find_first_of(" \t\n\r/", nameStart);
    if (nameEnd == std::string::npos) nameEnd = raw.size();
    tag.name = toLower(raw.substr(nameStart, nameEnd - nameStart));

    if (!tag.isClosing) {
        parseAttributes(raw, nameEnd, tag.attributes);
    }
    return end + 1;
}

/// Case-insensitive search for "</name" starting at pos
size_t findClosingTag(const std::string& html, const std::string& name, size_t pos) {
    std::string needle = "</" + name;
    while (pos < html.size()) {
        auto lt = html.find("</", pos);
        if (lt == std::string::npos) return std::string::npos;
        if (toLower(html.substr(lt, needle.size())) == needle) return lt;
        pos = lt + 2;
    }
    return std::string::npos;
}

/// Tree builder state: a stack of open elements, each owned by value until closed
class TreeBuilder {
public:
    TreeBuilder() { stack_.push_back(MarkupNode::element("")); }

    void open(MarkupNode node) {
        if (static_cast<int>(stack_.size()) > kMaxMarkupDepth) {
            throw PageflowError(ErrorCode::MalformedMarkup,
                                "markup nesting exceeds " + std::to_string(kMaxMarkupDepth) + " levels");
        }
        stack_.push_back(std::move(node));
    }

    void append(MarkupNode node) {
        stack_.back().children.push_back(std::move(node));
    }

    void appendText(const std::string& text) {
        auto& children = stack_.back().children;
        if (!children.empty() && children.back().isText()) {
            children.back().text += text;
        } else {
            children.push_back(MarkupNode::textNode(text));
        }
    }

    const std::string& currentTag() const { return stack_.back().tag; }

    /// Close the innermost open element named `name` and everything opened after it
    bool close(const std::string& name) {
        for (size_t i = stack_.size(); i-- > 1;) {
            if (stack_[i].tag == name) {
                while (stack_.size() > i) {
                    popOne();
                }
                return true;
            }
        }
        return false;
    }

    MarkupNode finish() {
        while (stack_.size() > 1) {
            popOne();
        }
        return std::move(stack_.front());
    }

private:
    std::vector<MarkupNode> stack_;

    void popOne() {
        MarkupNode node = std::move(stack_.back());
        stack_.pop_back();
        stack_.back().children.push_back(std::move(node));
    }
};

/// Line breaks read as a space
void collectText(const MarkupNode& node, std::string& out) {
    if (node.isText()) {
        out += node.text;
        return;
    }
    if (node.tag == "br") {
        out += ' ';
        return;
    }
    for (const auto& child : node.children) {
        collectText(child, out);
    }
}

void serializeInto(const MarkupNode& node, std::string& out) {
    if (node.isText()) {
        out += escapeText(node.text);
        return;
    }
    if (node.tag.empty()) {
        for (const auto& child : node.children) serializeInto(child, out);
        return;
    }
    out += '<';
    out += node.tag;
    for (const auto& attr : node.attributes) {
        out += ' ';
        out += attr.first;
        out += "=\"";
        out += escapeAttribute(attr.second);
        out += '"';
    }
    out += '>';
    if (isVoidTag(node.tag)) return;
    for (const auto& child : node.children) serializeInto(child, out);
    out += "</";
    out += node.tag;
    out += '>';
}

const MarkupNode* findFirstIn(const MarkupNode& node, const std::string& tagName) {
    for (const auto& child : node.children) {
        if (!child.isElement()) continue;
        if (child.tag == tagName) return &child;
        if (const MarkupNode* found = findFirstIn(child, tagName)) return found;
    }
    return nullptr;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// MarkupNode
// ---------------------------------------------------------------------------

std::string MarkupNode::attribute(const std::string& name) const {
    for (const auto& attr : attributes) {
        if (attr.first == name) return attr.second;
    }
    return "";
}

bool MarkupNode::hasAttribute(const std::string& name) const {
    return std::any_of(attributes.begin(), attributes.end(),
                       [&](const auto& attr) { return attr.first == name; });
}

void MarkupNode::setAttribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes) {
        if (attr.first == name) {
            attr.second = value;
            return;
        }
    }
    attributes.emplace_back(name, value);
}

std::string MarkupNode::plainText() const {
    std::string result;
    collectText(*this, result);
    return result;
}

const MarkupNode* MarkupNode::findFirst(const std::string& tagName) const {
    return findFirstIn(*this, tagName);
}

// ---------------------------------------------------------------------------
// Entities and escaping
// ---------------------------------------------------------------------------

std::string decodeEntities(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '&') {
            auto semi = text.find(';', i);
            if (semi != std::string::npos && semi - i < 10) {
                auto entity = text.substr(i + 1, semi - i - 1);
                if (entity == "amp") result += '&';
                else if (entity == "lt") result += '<';
                else if (entity == "gt") result += '>';
                else if (entity == "quot") result += '"';
                else if (entity == "apos") result += '\'';
                else if (entity == "nbsp") result += ' ';
                else if (entity == "mdash") result += "\xe2\x80\x94";
                else if (entity == "ndash") result += "\xe2\x80\x93";
                else if (entity == "hellip") result += "\xe2\x80\xa6";
                else if (entity == "lsquo") result += "\xe2\x80\x98";
                else if (entity == "rsquo") result += "\xe2\x80\x99";
                else if (entity == "ldquo") result += "\xe2\x80\x9c";
                else if (entity == "rdquo") result += "\xe2\x80\x9d";
                else if (entity.size() > 1 && entity[0] == '#') {
                    bool hex = (entity[1] == 'x' || entity[1] == 'X');
                    std::string digits = entity.substr(hex ? 2 : 1);
                    char* endPtr = nullptr;
                    unsigned long cp = std::strtoul(digits.c_str(), &endPtr, hex ? 16 : 10);
                    if (!digits.empty() && endPtr && *endPtr == '\0' && cp > 0 && cp <= 0x10FFFF) {
                        appendUtf8(result, static_cast<uint32_t>(cp));
                    } else {
                        result += text.substr(i, semi - i + 1);
                    }
                }
                else {
                    result += text.substr(i, semi - i + 1);
                }
                i = semi;
                continue;
            }
        }
        result += text[i];
    }
    return result;
}

std::string escapeText(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            default:  result += c; break;
        }
    }
    return result;
}

std::string escapeAttribute(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '"': result += "&quot;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            default:  result += c; break;
        }
    }
    return result;
}

bool isHeadingTag(const std::string& tag) {
    return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

bool isBlockLevelTag(const std::string& name) {
    return name == "p" || name == "div" || isHeadingTag(name) ||
           name == "blockquote" || name == "pre" || name == "li" ||
           name == "ul" || name == "ol" || name == "table" ||
           name == "section" || name == "article" || name == "main" ||
           name == "header" || name == "footer" || name == "nav" ||
           name == "figure" || name == "figcaption" || name == "hr";
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

MarkupNode parseMarkup(const std::string& html) {
    TreeBuilder builder;
    size_t pos = 0;
    int elementCount = 0;

    while (pos < html.size()) {
        if (html[pos] != '<') {
            auto nextTag = html.find('<', pos);
            if (nextTag == std::string::npos) nextTag = html.size();
            builder.appendText(decodeEntities(html.substr(pos, nextTag - pos)));
            pos = nextTag;
            continue;
        }

        // Comments, doctype, processing instructions
        if (html.compare(pos, 4, "<!--") == 0) {
            auto end = html.find("-->", pos + 4);
            pos = (end == std::string::npos) ? html.size() : end + 3;
            continue;
        }
        if (pos + 1 < html.size() && (html[pos + 1] == '!' || html[pos + 1] == '?')) {
            auto end = html.find('>', pos);
            pos = (end == std::string::npos) ? html.size() : end + 1;
            continue;
        }

        Tag tag;
        size_t nextPos = parseTag(html, pos, tag);
        if (nextPos == pos || tag.name.empty()) {
            // Not a tag: keep the '<' as text
            builder.appendText("<");
            ++pos;
            continue;
        }

        if (tag.isClosing) {
            if (!builder.close(tag.name)) {
                PF_LOGD("parseMarkup: stray closing tag </%s>", tag.name.c_str());
            }
            pos = nextPos;
            continue;
        }

        ++elementCount;
        MarkupNode node = MarkupNode::element(tag.name);
        node.attributes = std::move(tag.attributes);

        // An opening block tag implicitly closes an open paragraph
        if (isBlockLevelTag(tag.name) && builder.currentTag() == "p") {
            builder.close("p");
        }

        if (isRawTextTag(tag.name) && !tag.isSelfClosing) {
            auto closePos = findClosingTag(html, tag.name, nextPos);
            if (closePos == std::string::npos) closePos = html.size();
            std::string raw = html.substr(nextPos, closePos - nextPos);
            if (!raw.empty()) node.children.push_back(MarkupNode::textNode(raw));
            builder.append(std::move(node));
            auto closeEnd = (closePos < html.size()) ? html.find('>', closePos) : std::string::npos;
            pos = (closeEnd == std::string::npos) ? html.size() : closeEnd + 1;
            continue;
        }

        if (isVoidTag(tag.name) || tag.isSelfClosing) {
            builder.append(std::move(node));
        } else {
            builder.open(std::move(node));
        }
        pos = nextPos;
    }

    MarkupNode root = builder.finish();
    PF_LOGD("parseMarkup: html=%zu elements=%d", html.size(), elementCount);
    return root;
}

const MarkupNode& documentBody(const MarkupNode& root) {
    if (const MarkupNode* body = root.findFirst("body")) {
        return *body;
    }
    return root;
}

std::string serialize(const MarkupNode& node) {
    std::string out;
    serializeInto(node, out);
    return out;
}

std::string innerMarkup(const MarkupNode& node) {
    std::string out;
    for (const auto& child : node.children) {
        serializeInto(child, out);
    }
    return out;
}

std::string stripTags(const std::string& markup) {
    return parseMarkup(markup).plainText();
}

} // namespace pageflow
