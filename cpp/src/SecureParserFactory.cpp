#include "SecureParserFactory.hpp"
#include "AtomicCache.hpp"
#include "Logging.hpp"

#include <sys/stat.h>
#include <sstream>

namespace xmlextract
{

namespace {

AtomicCache<SecureParserFactory> parserFactoryCache;

// Prefix of a qualified name, "" if there is none
string
prefixOf(const string& qname)
{
    string::size_type colon = qname.find( ':' );
    if ( colon == string::npos ) {
        return string();
    }
    if ( colon == 0 || colon + 1 == qname.size()
         || qname.find( ':', colon + 1 ) != string::npos ) {
        throw std::runtime_error( "malformed qualified name '" + qname + "'" );
    }
    return qname.substr( 0, colon );
}

// Is 'prefix' declared on 'element' or one of its ancestors?
bool
isBound(DOM::XMLNode element, const string& prefix)
{
    if ( prefix == "xml" ) {
        return true;
    }
    const string declaration = "xmlns:" + prefix;
    for ( ; element.type() == XMLNodeType::Element; element = element.parent() ) {
        DOM::XMLAttribute attr = element.attribute( declaration );
        if ( attr ) {
            return !attr.value().empty();
        }
    }
    return false;
}

void
checkBindings(const DOM::XMLNode& element)
{
    const string elementPrefix = prefixOf( element.name() );
    if ( !elementPrefix.empty() && !isBound( element, elementPrefix ) ) {
        throw std::runtime_error( "the prefix '" + elementPrefix + "' of element '"
                                  + element.name() + "' is not bound" );
    }

    for ( DOM::XMLAttribute attr = element.firstAttribute(); attr;
          attr = attr.nextAttribute() ) {
        const string name = attr.name();
        if ( name == "xmlns" ) {
            continue;
        }
        const string prefix = prefixOf( name );
        if ( prefix.empty() || prefix == "xmlns" ) {
            continue;
        }
        if ( !isBound( element, prefix ) ) {
            throw std::runtime_error( "the prefix '" + prefix + "' of attribute '"
                                      + name + "' on element '" + element.name()
                                      + "' is not bound" );
        }
    }
}

// Post-parse enforcement of the settings pugixml has no switch for
class DocumentCheck: public DOM::XMLTreeWalker
{
    public:
        explicit DocumentCheck(const ParserSettings& settings)
            : settings( settings ) {}

        virtual bool forEach(DOM::XMLNode& node, int depth) {
            switch ( node.type() ) {
            case XMLNodeType::Doctype:
                if ( settings.disallowDoctype ) {
                    throw std::runtime_error( "DOCTYPE is disallowed when the feature "
                        + string( featureName( ParserFeature::DisallowDoctype ) )
                        + " is set" );
                }
                break;
            case XMLNodeType::Element:
                if ( settings.secureProcessing
                     && static_cast<unsigned int>(depth) + 1 > settings.limits.maxElementDepth ) {
                    std::ostringstream oss;
                    oss << "element nesting exceeds the limit of "
                        << settings.limits.maxElementDepth;
                    throw std::runtime_error( oss.str() );
                }
                if ( settings.namespaceAware ) {
                    checkBindings( node );
                }
                break;
            default:
                break;
            }
            return true;
        }

    private:
        const ParserSettings& settings;
};

void
rejectEnable(ParserFeature feature, bool value)
{
    if ( value ) {
        throw UnsupportedFeature( string( featureName( feature ) )
                                  + " can not be enabled with this XML engine" );
    }
}

} // namespace

const char*
featureName(ParserFeature feature)
{
    switch ( feature ) {
    case ParserFeature::SecureProcessing:
        return "secure-processing";
    case ParserFeature::NamespaceAware:
        return "http://xml.org/sax/features/namespaces";
    case ParserFeature::ExpandEntityReferences:
        return "expand-entity-references";
    case ParserFeature::XIncludeAware:
        return "http://apache.org/xml/features/xinclude";
    case ParserFeature::Validating:
        return "http://xml.org/sax/features/validation";
    case ParserFeature::DisallowDoctype:
        return "http://apache.org/xml/features/disallow-doctype-decl";
    case ParserFeature::ExternalGeneralEntities:
        return "http://xml.org/sax/features/external-general-entities";
    case ParserFeature::ExternalParameterEntities:
        return "http://xml.org/sax/features/external-parameter-entities";
    }
    return "unknown";
}

const char*
attributeName(ParserAttribute attribute)
{
    switch ( attribute ) {
    case ParserAttribute::AccessExternalDTD:
        return "access-external-dtd";
    case ParserAttribute::AccessExternalSchema:
        return "access-external-schema";
    }
    return "unknown";
}

/**
 * SecureParserFactory implementation
 */

void
SecureParserFactory::setFeature(ParserFeature feature, bool value)
{
    switch ( feature ) {
    case ParserFeature::SecureProcessing:
        settings.secureProcessing = value;
        break;
    case ParserFeature::NamespaceAware:
        settings.namespaceAware = value;
        break;
    case ParserFeature::DisallowDoctype:
        settings.disallowDoctype = value;
        break;
    case ParserFeature::ExpandEntityReferences:
    case ParserFeature::XIncludeAware:
    case ParserFeature::Validating:
    case ParserFeature::ExternalGeneralEntities:
    case ParserFeature::ExternalParameterEntities:
        rejectEnable( feature, value );
        break;
    }
}

bool
SecureParserFactory::getFeature(ParserFeature feature) const
{
    switch ( feature ) {
    case ParserFeature::SecureProcessing:
        return settings.secureProcessing;
    case ParserFeature::NamespaceAware:
        return settings.namespaceAware;
    case ParserFeature::DisallowDoctype:
        return settings.disallowDoctype;
    default:
        return false;
    }
}

void
SecureParserFactory::setAttribute(ParserAttribute attribute, const string& value)
{
    if ( !value.empty() ) {
        throw UnsupportedFeature( string( attributeName( attribute ) )
                                  + " only accepts \"\": this XML engine never"
                                    " accesses external resources" );
    }
}

void
SecureParserFactory::harden(SecureParserFactory& factory)
{
    try {
        factory.setFeature( ParserFeature::SecureProcessing, true );
        factory.setFeature( ParserFeature::NamespaceAware, true );
        factory.setFeature( ParserFeature::ExpandEntityReferences, false );
        factory.setFeature( ParserFeature::XIncludeAware, false );

        trySetFeature( factory, ParserFeature::DisallowDoctype, true );
        trySetFeature( factory, ParserFeature::ExternalGeneralEntities, false );
        trySetFeature( factory, ParserFeature::ExternalParameterEntities, false );

        factory.setAttribute( ParserAttribute::AccessExternalDTD, "" );
        factory.setAttribute( ParserAttribute::AccessExternalSchema, "" );
        factory.setFeature( ParserFeature::Validating, false );
    } catch (const std::exception&) {
        std::throw_with_nested( XMLProcessingError(
            XMLProcessingError::Kind::Configuration,
            "unable to configure a secure XML parser" ) );
    }
}

std::unique_ptr<SecureParserFactory>
SecureParserFactory::createSecure()
{
    std::unique_ptr<SecureParserFactory> factory( new SecureParserFactory );
    harden( *factory );
    return factory;
}

const SecureParserFactory&
SecureParserFactory::instance()
{
    return parserFactoryCache.get( &SecureParserFactory::createSecure );
}

bool
trySetFeature(SecureParserFactory& factory, ParserFeature feature, bool value)
{
    try {
        factory.setFeature( feature, value );
        return true;
    } catch (const UnsupportedFeature& e) {
        BOOST_LOG_TRIVIAL(warning) << "XML parser does not support feature "
                                   << featureName( feature )
                                   << ", this may weaken security: " << e.what();
        return false;
    }
}

/**
 * DocumentParser implementation
 */

XMLParseOptions
DocumentParser::parseOptions() const
{
    XMLParseOptions options;
    options.cdata = true;
    options.comments = true;
    options.pi = true;
    // kept as a node so that check() can see it
    options.doctype = true;
    options.whitespaceText = true;
    return options;
}

DOM::XMLDocumentPtr
DocumentParser::parse(const string& path) const
{
    if ( parserSettings.secureProcessing ) {
        struct stat st;
        // an unreadable file is reported by the loader below
        if ( ::stat( path.c_str(), &st ) == 0
             && static_cast<unsigned long long>(st.st_size)
                > parserSettings.limits.maxInputBytes ) {
            std::ostringstream oss;
            oss << path << ": " << st.st_size << " bytes exceed the input limit of "
                << parserSettings.limits.maxInputBytes;
            throw std::runtime_error( oss.str() );
        }
    }

    DOM::XMLDocumentPtr document( new DOM::XMLDocument );
    document->load( path, parseOptions() );
    check( *document );
    return document;
}

DOM::XMLDocumentPtr
DocumentParser::parseString(const string& content) const
{
    if ( parserSettings.secureProcessing
         && content.size() > parserSettings.limits.maxInputBytes ) {
        std::ostringstream oss;
        oss << content.size() << " bytes exceed the input limit of "
            << parserSettings.limits.maxInputBytes;
        throw std::runtime_error( oss.str() );
    }

    DOM::XMLDocumentPtr document( new DOM::XMLDocument );
    document->loadString( content, parseOptions() );
    check( *document );
    return document;
}

void
DocumentParser::check(const DOM::XMLDocument& document) const
{
    DocumentCheck walker( parserSettings );
    document.traverse( walker );
}

} // namespace xmlextract
