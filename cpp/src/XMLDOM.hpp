/**
 * Document tree used by the extractor
 *
 * Nodes and attributes are cheap handles, passed by value; the tree owns
 * the storage. Removing a node from its parent frees it, and handles to it
 * must not be used afterwards.
 *
 * XMLDocument is held through DOM::XMLDocumentPtr. The whole tree goes
 * away with the last reference.
 *
 * The base templates below only describe the interface; each backend
 * (currently only pugixml, see XMLDOM_Pugi.hpp) provides the definitions.
 */
#ifndef __HAVE_XMLDOM__
#define __HAVE_XMLDOM__

#include "IntrusivePtrBase.hpp"
#include "LibIncludes.hpp"

namespace xmlextract {


// Tree node types
enum class XMLNodeType
{
    Null,           // handle that points nowhere
    Document,       // root of a tree, parent of the document element
    Element,        // <name/>
    Pcdata,         // text, entities decoded
    Cdata,          // <![CDATA[...]]>
    Comment,        // <!-- ... -->
    Pi,             // <?target data?>
    Declaration,    // <?xml version="1.0"?>
    Doctype         // <!DOCTYPE ...>
};

/**
 * Which constructs the backend keeps as nodes while loading. Everything not
 * listed (character data, attributes) is always kept; predefined entities and
 * character references are always decoded.
 */
struct XMLParseOptions
{
    XMLParseOptions()
        : cdata(true)
        , comments(false)
        , pi(false)
        , doctype(false)
        , whitespaceText(false)
    {}

    bool cdata;             // '<![CDATA[...]]>' sections
    bool comments;          // '<!-- ... -->'
    bool pi;                // processing instructions
    bool doctype;           // '<!DOCTYPE ...>', with its internal subset as value
    bool whitespaceText;    // text nodes consisting only of whitespace
};


// Namespace declaration attribute: 'name' is "xmlns" or "xmlns:prefix"
struct XMLNamespaceDecl
{
    string name;
    string uri;
};

typedef vector<XMLNamespaceDecl> XMLNamespaceDecls;


// Pair of iterators for range-based for
template <typename It> class XMLObjectRange
{
    public:
        typedef It const_iterator;

        XMLObjectRange(It b, It e): _begin(b), _end(e)
    {
    }

        It begin() const { return _begin; }
        It end() const { return _end; }

    private:
        It _begin, _end;
};



// A light-weight handle for reading attributes in DOM tree
class XMLAttributeBase
{
    protected:
        // interface only
        XMLAttributeBase() = default;
        ~XMLAttributeBase() = default;

    public:
        // False for a null handle
        explicit operator bool() const;
        bool empty() const;

        // "" for a null handle
        const string name() const;
        const string value() const;

        // Get next attribute in the attribute list of the parent node
        XMLAttributeBase nextAttribute() const;
};

template <class XMLDOM_T>
class XMLNodeBase
{
    protected:
        // interface only; a default node is a null handle
        XMLNodeBase() = default;
        ~XMLNodeBase() = default;

    public:
        typedef typename XMLDOM_T::XMLDocument document_type;
        typedef typename XMLDOM_T::XMLNode node_type;
        typedef typename XMLDOM_T::XMLAttribute attribute_type;
        typedef typename XMLDOM_T::XMLNodeIterator iterator;
        typedef typename XMLDOM_T::XMLTreeWalker walker_type;

        // False for a null handle
        explicit operator bool() const;

        // Handles are equal when they point at the same node
        bool operator==(const node_type& r) const;
        bool operator!=(const node_type& r) const;

        bool empty() const;

        // Node kind; XMLNodeType::Null for an empty handle
        XMLNodeType type() const;

        // Qualified name of an element, content of text/CDATA/comment
        // nodes; "" where not applicable
        const string name() const;
        const string value() const;

        // Get first attribute, attribute with the specified name
        attribute_type firstAttribute() const;
        attribute_type attribute(const string& name) const;

        // Navigation
        node_type firstChild() const;
        node_type nextSibling() const;
        node_type parent() const;

        // Set node value (throws std::runtime_error if the node can not
        // carry a value)
        node_type setValue(const string& rhs);

        // Detach and free a direct child
        bool removeChild(const node_type& n);

        iterator begin() const;
        iterator end() const;
        XMLObjectRange<iterator> children() const;

        // First element named 'name' below this node, in document order
        node_type findFirstElement(const string& name) const;

        // Merge adjacent text nodes and drop empty ones, in the whole
        // subtree
        void normalize();

        // Depth-first visit of all descendants
        bool traverse(walker_type& walker) const;

        // Number of element levels in this subtree, counting the node itself
        // if it is an element
        unsigned int subtreeDepth() const;

        // Declarations made on ancestors that the names in this subtree
        // rely on and that the node does not make itself. The nearest
        // declaration of a prefix wins.
        XMLNamespaceDecls inheritedNamespaces() const;

        // Append the markup of this subtree to 'out', as UTF-8, without an
        // XML declaration. With 'indent' off no whitespace is added.
        void print(string& out, bool indent = false) const;

        // Same, with 'extra' written as leading attributes of this element
        void print(string& out, bool indent, const XMLNamespaceDecls& extra) const;
};

// Root of a parsed tree
template <class XMLDOM_T>
class XMLDocumentBase
    : public XMLDOM_T::XMLNode
    // held by XMLDocumentPtr
    , public IntrusivePtrBase<typename XMLDOM_T::XMLDocument>
{
    public:
        typedef typename XMLDOM_T::XMLDocument document_type;
        typedef typename XMLDOM_T::XMLNode node_type;
        typedef typename XMLDOM_T::XMLAttribute attribute_type;

        // Replace the contents with the file at 'path'. Throws
        // std::runtime_error describing the failure and its position.
        void load(const string& path, const XMLParseOptions& options);

        // Same, from an in-memory buffer
        void loadString(const string& content, const XMLParseOptions& options);

        // Outermost element, null before a successful load
        node_type documentElement() const;

    protected:
        XMLDocumentBase() {}

        // All node and attribute handles into the tree dangle afterwards
        ~XMLDocumentBase() {}

    private:
        // Non-copyable semantics
        XMLDocumentBase(const XMLDocumentBase&) = delete;
        XMLDocumentBase& operator=(const XMLDocumentBase&) = delete;

};


/**
 * Type wrapper class
 */
template <class XMLDocumentT, class XMLNodeT, class XMLAttributeT,
          class XMLNodeIteratorT, class XMLTreeWalkerT>
class XMLDOM
{
    public:
        typedef XMLDocumentT XMLDocument;
        typedef XMLNodeT XMLNode;
        typedef XMLAttributeT XMLAttribute;
        typedef XMLNodeIteratorT XMLNodeIterator;
        typedef XMLTreeWalkerT XMLTreeWalker;

        typedef intrusive_ptr<XMLDocument> XMLDocumentPtr;
};


} // namespace xmlextract

#endif // __HAVE_XMLDOM__
