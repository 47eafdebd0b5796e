#ifndef __HAVE_XMLDOM_PUGI__
#define __HAVE_XMLDOM_PUGI__

#include "XMLDOM.hpp"
#include <iterator>
#include <stdexcept>

#include <pugixml.hpp>

namespace xmlextract
{

using pugi::xml_node;
using pugi::xml_document;
using pugi::xml_attribute;

class XMLDocument_Pugi;
class XMLNode_Pugi;
class XMLNodeIterator_Pugi;
class XMLTreeWalker_Pugi;


class XMLAttribute_Pugi: public XMLAttributeBase
{
    friend class XMLNode_Pugi;
    public:
        XMLAttribute_Pugi()
            : pugiAttrib() {}
        XMLAttribute_Pugi(const XMLAttribute_Pugi&) = default;
        XMLAttribute_Pugi& operator=(const XMLAttribute_Pugi&) = default;
        ~XMLAttribute_Pugi() = default;

        explicit operator bool() const {
            return !!pugiAttrib;
        }

        // identity, not value
        bool operator==(const XMLAttribute_Pugi& r) const {
            return pugiAttrib == r.pugiAttrib;
        }
        bool operator!=(const XMLAttribute_Pugi& r) const {
            return pugiAttrib != r.pugiAttrib;
        }

        bool empty() const {
            return pugiAttrib.empty();
        }

        const string name() const {
            return string( pugiAttrib.name() );
        }
        const string value() const {
            return string( pugiAttrib.value() );
        }

        // Get next attribute in the attribute list of the parent node
        XMLAttribute_Pugi nextAttribute() const {
            return XMLAttribute_Pugi( pugiAttrib.next_attribute() );
        }

    private:
        xml_attribute pugiAttrib;
        explicit XMLAttribute_Pugi(xml_attribute attr)
            : pugiAttrib( attr ) {};

};

typedef XMLDOM<XMLDocument_Pugi, XMLNode_Pugi, XMLAttribute_Pugi,
               XMLNodeIterator_Pugi, XMLTreeWalker_Pugi> DOM;

class XMLNode_Pugi: public XMLNodeBase<DOM>
{
    friend class XMLDocument_Pugi;
    public:
        // Empty (null) node handle
        XMLNode_Pugi()
            : pugiNode() {};
        // Wrap a raw pugixml handle
        explicit XMLNode_Pugi( xml_node pugiNode )
            : pugiNode( pugiNode ) {}
        XMLNode_Pugi(const XMLNode_Pugi&) = default;
        XMLNode_Pugi& operator=(const XMLNode_Pugi&) = default;
        ~XMLNode_Pugi() = default;

        explicit operator bool() const {
            return !!pugiNode;
        }

        // identity, not value
        bool operator==(const XMLNode_Pugi& r) const {
            return pugiNode == r.pugiNode;
        }
        bool operator!=(const XMLNode_Pugi& r) const {
            return pugiNode != r.pugiNode;
        }
        bool empty() const {
            return pugiNode.empty();
        }

        // pugi::xml_node_type enumerates the kinds in the same order
        XMLNodeType type() const {
            return static_cast<XMLNodeType>( pugiNode.type() );
        }

        const string name() const {
            return string(pugiNode.name());
        }
        const string value() const {
            return string(pugiNode.value());
        }

        // Get first attribute, or attribute with the specified name
        XMLAttribute_Pugi firstAttribute() const {
            return XMLAttribute_Pugi( pugiNode.first_attribute() );
        }
        XMLAttribute_Pugi attribute(const string& name) const {
            return XMLAttribute_Pugi( pugiNode.attribute( name.c_str() ) );
        }

        XMLNode_Pugi firstChild() const {
            return XMLNode_Pugi( pugiNode.first_child() );
        }
        XMLNode_Pugi nextSibling() const {
            return XMLNode_Pugi( pugiNode.next_sibling() );
        }
        XMLNode_Pugi parent() const {
            return XMLNode_Pugi( pugiNode.parent() );
        }

        // Set node value (throws a std::runtime_error if node is
        // empty, there is not enough memory, or node can not have a value)
        XMLNode_Pugi setValue(const string& rhs);

        bool removeChild(const XMLNode_Pugi& n) {
            return pugiNode.remove_child( n.pugiNode );
        }

        typedef XMLNodeIterator_Pugi iterator;

        iterator begin() const;
        iterator end() const;
        XMLObjectRange<XMLNodeIterator_Pugi> children() const;

        XMLNode_Pugi findFirstElement(const string& name) const;

        void normalize();

        bool traverse(XMLTreeWalker_Pugi& walker) const;

        unsigned int subtreeDepth() const;

        XMLNamespaceDecls inheritedNamespaces() const;

        void print(string& out, bool indent = false) const;
        void print(string& out, bool indent, const XMLNamespaceDecls& extra) const;

    private:
        xml_node pugiNode;

};

// Forward iterator over the children of a node
class XMLNodeIterator_Pugi
{
    public:
        typedef std::ptrdiff_t difference_type;
        typedef XMLNode_Pugi value_type;
        typedef XMLNode_Pugi* pointer;
        typedef XMLNode_Pugi reference;
        typedef std::forward_iterator_tag iterator_category;

        XMLNodeIterator_Pugi() {}
        explicit XMLNodeIterator_Pugi(pugi::xml_node_iterator it)
            : it( it ) {}

        XMLNode_Pugi operator*() const {
            return XMLNode_Pugi( *it );
        }
        XMLNodeIterator_Pugi& operator++() {
            ++it;
            return *this;
        }
        XMLNodeIterator_Pugi operator++(int) {
            XMLNodeIterator_Pugi old( *this );
            ++it;
            return old;
        }
        bool operator==(const XMLNodeIterator_Pugi& r) const {
            return it == r.it;
        }
        bool operator!=(const XMLNodeIterator_Pugi& r) const {
            return it != r.it;
        }

    private:
        pugi::xml_node_iterator it;
};

/**
 * Depth-first visitor for XMLNode_Pugi::traverse()
 *
 * forEach() is called for every descendant of the traversed node, in
 * document order. 'depth' is 0 for its direct children. Returning false
 * from any callback stops the traversal.
 */
class XMLTreeWalker_Pugi
{
    public:
        virtual ~XMLTreeWalker_Pugi() {}

        virtual bool begin(XMLNode_Pugi& node) { return true; }
        virtual bool forEach(XMLNode_Pugi& node, int depth) = 0;
        virtual bool end(XMLNode_Pugi& node) { return true; }
};

class XMLDocument_Pugi: public XMLDocumentBase<DOM>
{
    public:
        XMLDocument_Pugi();
        ~XMLDocument_Pugi() = default;

        void load(const string& path, const XMLParseOptions& options);
        void loadString(const string& content, const XMLParseOptions& options);

        XMLNode_Pugi documentElement() const {
            return XMLNode_Pugi( pugiDoc.document_element() );
        }

    private:
        void checkResult(const pugi::xml_parse_result& result,
                         const string& source) const;

        xml_document pugiDoc;
};

}

#endif // __HAVE_XMLDOM_PUGI__
