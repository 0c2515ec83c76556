#pragma once
#include <gumbo.h>
#include <string>
#include <vector>

namespace Harvest {
namespace Utils {
namespace Html {

// Owns a gumbo parse tree. Node pointers handed out stay valid for the
// lifetime of the Document.
class Document {
public:
    explicit Document(const std::string& html);
    ~Document();
    Document(const Document&)            = delete;
    Document& operator=(const Document&) = delete;

    const GumboNode* root() const;

    // Elements matching any of `tags`, in document order.
    std::vector<const GumboNode*> find_all(const std::vector<GumboTag>& tags) const;

    static std::vector<const GumboNode*> find_all(const GumboNode*             node,
                                                  const std::vector<GumboTag>& tags);
    static const GumboNode* find_first(const GumboNode* node, const std::vector<GumboTag>& tags);
    static const GumboNode* closest(const GumboNode* node, GumboTag tag);
    static std::string      text(const GumboNode* node);
    static std::string      attribute(const GumboNode* node, const char* name);

private:
    GumboOutput* output_;
};

}  // namespace Html
}  // namespace Utils
}  // namespace Harvest
