#include "XMLDOM_Pugi.hpp"

#include <algorithm>
#include <cstring>
#include <set>
#include <sstream>

namespace xmlextract
{
using pugi::xml_node;
using pugi::xml_document;

namespace {

unsigned int
pugiParseOptions(const XMLParseOptions& options)
{
    // parse_escapes only decodes the predefined entities and character
    // references; any other reference stays in the text as written.
    unsigned int flags = pugi::parse_escapes
                       | pugi::parse_eol
                       | pugi::parse_wconv_attribute;
    if (options.cdata)
        flags |= pugi::parse_cdata;
    if (options.comments)
        flags |= pugi::parse_comments;
    if (options.pi)
        flags |= pugi::parse_pi;
    if (options.doctype)
        flags |= pugi::parse_doctype;
    if (options.whitespaceText)
        flags |= pugi::parse_ws_pcdata;
    return flags;
}

struct ElementNamed
{
    explicit ElementNamed(const string& name)
        : name(name) {}

    bool operator()(xml_node node) const {
        return node.type() == pugi::node_element
            && std::strcmp(node.name(), name.c_str()) == 0;
    }

    const string& name;
};

// Bridges pugixml's walker callbacks to XMLTreeWalker_Pugi
class WalkerAdapter: public pugi::xml_tree_walker
{
    public:
        explicit WalkerAdapter(XMLTreeWalker_Pugi& walker)
            : walker( walker ) {}

        virtual bool begin(xml_node& node) {
            XMLNode_Pugi wrapped( node );
            return walker.begin( wrapped );
        }
        virtual bool for_each(xml_node& node) {
            XMLNode_Pugi wrapped( node );
            return walker.forEach( wrapped, depth() );
        }
        virtual bool end(xml_node& node) {
            XMLNode_Pugi wrapped( node );
            return walker.end( wrapped );
        }

    private:
        XMLTreeWalker_Pugi& walker;
};

class DepthWalker: public XMLTreeWalker_Pugi
{
    public:
        DepthWalker()
            : deepest( 0 ) {}

        virtual bool forEach(XMLNode_Pugi& node, int depth) {
            if (node.type() == XMLNodeType::Element)
                deepest = std::max( deepest, static_cast<unsigned int>(depth) + 1 );
            return true;
        }

        unsigned int deepest;
};

// Prefix part of a qualified name, "" if there is none
string
namePrefix(const char* qname)
{
    const char* colon = std::strchr( qname, ':' );
    return colon ? string( qname, colon ) : string();
}

bool
isNamespaceDecl(const char* name)
{
    return std::strcmp( name, "xmlns" ) == 0
        || std::strncmp( name, "xmlns:", 6 ) == 0;
}

string
declarationName(const string& prefix)
{
    return prefix.empty() ? string( "xmlns" ) : "xmlns:" + prefix;
}

// Prefixes used by the element and attribute names of a subtree; "" is
// the default namespace of an unprefixed element
class PrefixCollector: public pugi::xml_tree_walker
{
    public:
        virtual bool for_each(xml_node& node) {
            add( node );
            return true;
        }

        void add(const xml_node& node) {
            if (node.type() != pugi::node_element)
                return;
            prefixes.insert( namePrefix( node.name() ) );
            for (pugi::xml_attribute attr = node.first_attribute(); attr;
                 attr = attr.next_attribute()) {
                if (isNamespaceDecl( attr.name() ))
                    continue;
                // unprefixed attributes are in no namespace
                string prefix = namePrefix( attr.name() );
                if (!prefix.empty())
                    prefixes.insert( prefix );
            }
        }

        std::set<string> prefixes;
};

struct StringWriter: pugi::xml_writer
{
    explicit StringWriter(string& out)
        : out( out ) {}

    virtual void write(const void* data, size_t size) {
        out.append( static_cast<const char*>(data), size );
    }

    string& out;
};

} // namespace

/**
 * XMLDocument_Pugi implementation
 */

XMLDocument_Pugi::XMLDocument_Pugi() {
    XMLNode_Pugi::pugiNode = pugiDoc;
}

void
XMLDocument_Pugi::load(const string& path, const XMLParseOptions& options) {
    pugi::xml_parse_result result =
        pugiDoc.load_file( path.c_str(), pugiParseOptions( options ) );
    XMLNode_Pugi::pugiNode = pugiDoc;
    checkResult( result, path );
}

void
XMLDocument_Pugi::loadString(const string& content
        , const XMLParseOptions& options)
{
    pugi::xml_parse_result result =
        pugiDoc.load_buffer( content.data(), content.size()
                           , pugiParseOptions( options ) );
    XMLNode_Pugi::pugiNode = pugiDoc;
    checkResult( result, "<buffer>" );
}

void
XMLDocument_Pugi::checkResult(const pugi::xml_parse_result& result
        , const string& source) const
{
    if ( result ) {
        return;
    }
    std::ostringstream oss;
    oss << source << ": " << result.description();
    if ( result.status != pugi::status_file_not_found
         && result.status != pugi::status_io_error
         && result.status != pugi::status_out_of_memory ) {
        oss << " at offset " << result.offset;
    }
    throw std::runtime_error( oss.str() );
}

/**
 * XMLNode_Pugi implementation
 */

XMLNode_Pugi
XMLNode_Pugi::setValue(const string& rhs) {
    if ( pugiNode.set_value( rhs.c_str() ) ) {
        return *this;
    } else {
        throw std::runtime_error( "setValue failed" );
    }
}

XMLNodeIterator_Pugi
XMLNode_Pugi::begin() const
{
    return XMLNodeIterator_Pugi( pugiNode.begin() );
}

XMLNodeIterator_Pugi
XMLNode_Pugi::end() const
{
    return XMLNodeIterator_Pugi( pugiNode.end() );
}

XMLObjectRange<XMLNodeIterator_Pugi>
XMLNode_Pugi::children() const
{
    return XMLObjectRange<XMLNodeIterator_Pugi>(begin(), end());
}

XMLNode_Pugi
XMLNode_Pugi::findFirstElement(const string& name) const
{
    // find_node walks the subtree depth-first, i.e. in document order
    return XMLNode_Pugi( pugiNode.find_node( ElementNamed( name ) ) );
}

void
XMLNode_Pugi::normalize()
{
    vector<XMLNode_Pugi> pending( 1, *this );
    while ( !pending.empty() ) {
        XMLNode_Pugi parent = pending.back();
        pending.pop_back();

        XMLNode_Pugi child = parent.firstChild();
        while ( child ) {
            XMLNode_Pugi next = child.nextSibling();
            if ( child.type() == XMLNodeType::Pcdata ) {
                while ( next.type() == XMLNodeType::Pcdata ) {
                    child.setValue( child.value() + next.value() );
                    XMLNode_Pugi after = next.nextSibling();
                    parent.removeChild( next );
                    next = after;
                }
                if ( child.value().empty() ) {
                    parent.removeChild( child );
                }
            } else if ( child.type() == XMLNodeType::Element ) {
                pending.push_back( child );
            }
            child = next;
        }
    }
}

bool
XMLNode_Pugi::traverse(XMLTreeWalker_Pugi& walker) const
{
    WalkerAdapter adapter( walker );
    // pugixml's traverse() is non-const; the handle copy is not
    xml_node node = pugiNode;
    return node.traverse( adapter );
}

unsigned int
XMLNode_Pugi::subtreeDepth() const
{
    DepthWalker walker;
    traverse( walker );
    return walker.deepest + ( type() == XMLNodeType::Element ? 1 : 0 );
}

XMLNamespaceDecls
XMLNode_Pugi::inheritedNamespaces() const
{
    XMLNamespaceDecls decls;
    if ( type() != XMLNodeType::Element ) {
        return decls;
    }

    PrefixCollector collector;
    collector.add( pugiNode );
    xml_node node = pugiNode;
    node.traverse( collector );
    // bound by definition
    collector.prefixes.erase( "xml" );

    for ( const string& prefix : collector.prefixes ) {
        const string name = declarationName( prefix );
        if ( pugiNode.attribute( name.c_str() ) ) {
            continue;
        }
        for ( xml_node scope = pugiNode.parent(); scope.type() == pugi::node_element;
              scope = scope.parent() ) {
            pugi::xml_attribute attr = scope.attribute( name.c_str() );
            if ( attr ) {
                // xmlns="" undeclares the default namespace
                if ( *attr.value() ) {
                    XMLNamespaceDecl decl = { name, attr.value() };
                    decls.push_back( decl );
                }
                break;
            }
        }
    }
    return decls;
}

void
XMLNode_Pugi::print(string& out, bool indent, const XMLNamespaceDecls& extra) const
{
    if ( extra.empty() || type() != XMLNodeType::Element ) {
        print( out, indent );
        return;
    }

    // the declarations go on a copy, the tree stays as parsed
    xml_document scratch;
    xml_node copy = scratch.append_copy( pugiNode );
    if ( !copy ) {
        throw std::runtime_error( "print failed: can not copy element '" + name() + "'" );
    }
    for ( XMLNamespaceDecls::const_reverse_iterator decl = extra.rbegin();
          decl != extra.rend(); ++decl ) {
        pugi::xml_attribute attr = copy.prepend_attribute( decl->name.c_str() );
        if ( !attr || !attr.set_value( decl->uri.c_str() ) ) {
            throw std::runtime_error( "print failed: can not add " + decl->name );
        }
    }
    XMLNode_Pugi( copy ).print( out, indent );
}

void
XMLNode_Pugi::print(string& out, bool indent) const
{
    if ( !pugiNode ) {
        throw std::runtime_error( "print failed: empty node" );
    }
    StringWriter writer( out );
    unsigned int flags = indent ? pugi::format_indent : pugi::format_raw;
    pugiNode.print( writer, indent ? "  " : "", flags | pugi::format_no_declaration,
                    pugi::encoding_utf8 );
}

} // namespace xmlextract
