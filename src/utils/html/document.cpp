#include "document.hpp"
#include <algorithm>
#include "../text/string_utils.hpp"

namespace Harvest {
namespace Utils {
namespace Html {

namespace {

void collect(const GumboNode*               node,
             const std::vector<GumboTag>&   tags,
             std::vector<const GumboNode*>& out) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    if (std::find(tags.begin(), tags.end(), node->v.element.tag) != tags.end())
        out.push_back(node);

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect(static_cast<const GumboNode*>(children->data[i]), tags, out);
    }
}

bool is_inline(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_A:
        case GUMBO_TAG_B:
        case GUMBO_TAG_I:
        case GUMBO_TAG_EM:
        case GUMBO_TAG_STRONG:
        case GUMBO_TAG_SPAN:
        case GUMBO_TAG_SMALL:
        case GUMBO_TAG_CODE:
        case GUMBO_TAG_MARK: return true;
        default: return false;
    }
}

void append_text(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA
        || node->type == GUMBO_NODE_WHITESPACE) {
        out += node->v.text.text;
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT)
        return;
    if (node->v.element.tag == GUMBO_TAG_SCRIPT || node->v.element.tag == GUMBO_TAG_STYLE)
        return;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        append_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
    if (!is_inline(node->v.element.tag))
        out += ' ';
}

}  // namespace

Document::Document(const std::string& html) : output_(gumbo_parse(html.c_str())) {
}

Document::~Document() {
    if (output_)
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

const GumboNode* Document::root() const {
    return output_ ? output_->root : nullptr;
}

std::vector<const GumboNode*> Document::find_all(const std::vector<GumboTag>& tags) const {
    return find_all(root(), tags);
}

std::vector<const GumboNode*> Document::find_all(const GumboNode*             node,
                                                 const std::vector<GumboTag>& tags) {
    std::vector<const GumboNode*> out;
    if (node)
        collect(node, tags, out);
    return out;
}

const GumboNode* Document::find_first(const GumboNode* node, const std::vector<GumboTag>& tags) {
    auto all = find_all(node, tags);
    return all.empty() ? nullptr : all.front();
}

const GumboNode* Document::closest(const GumboNode* node, GumboTag tag) {
    for (const GumboNode* n = node; n; n = n->parent) {
        if (n->type == GUMBO_NODE_ELEMENT && n->v.element.tag == tag)
            return n;
    }
    return nullptr;
}

std::string Document::text(const GumboNode* node) {
    std::string out;
    if (node)
        append_text(node, out);
    return Text::squash_whitespace(out);
}

std::string Document::attribute(const GumboNode* node, const char* name) {
    if (!node || node->type != GUMBO_NODE_ELEMENT)
        return "";
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : "";
}

}  // namespace Html
}  // namespace Utils
}  // namespace Harvest
