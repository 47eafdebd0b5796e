#include "ElementExtractor.hpp"
#include "SecureParserFactory.hpp"
#include "Logging.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace xmlextract
{

namespace {

// Lower bound for the reserved output buffer
const size_t defaultBufferSize = 4096;

// How innerMarkup() treats a child
enum class ChildKind
{
    Text,
    CData,
    Element,
    Other
};

ChildKind
classify(XMLNodeType type)
{
    switch ( type ) {
    case XMLNodeType::Pcdata:
        return ChildKind::Text;
    case XMLNodeType::Cdata:
        return ChildKind::CData;
    case XMLNodeType::Element:
        return ChildKind::Element;
    default:
        return ChildKind::Other;
    }
}

// Same set as the whitespace trimmed from text children: all control
// characters and the space
bool
isTrimmed(char c)
{
    return static_cast<unsigned char>(c) <= ' ';
}

void
checkReadableFile(const string& path)
{
    struct stat st;
    if ( ::stat( path.c_str(), &st ) != 0 ) {
        const int error = errno;
        throw XMLProcessingError( XMLProcessingError::Kind::FileAccess,
                                  "unable to access XML file: " + path
                                  + " (" + std::strerror( error ) + ")" );
    }
    if ( !S_ISREG( st.st_mode ) ) {
        throw XMLProcessingError( XMLProcessingError::Kind::FileAccess,
                                  "not a regular file: " + path );
    }
    if ( ::access( path.c_str(), R_OK ) != 0 ) {
        throw XMLProcessingError( XMLProcessingError::Kind::FileAccess,
                                  "XML file is not readable: " + path );
    }
}

class LengthEstimate: public DOM::XMLTreeWalker
{
    public:
        LengthEstimate()
            : total( 0 ) {}

        virtual bool forEach(DOM::XMLNode& node, int depth) {
            switch ( classify( node.type() ) ) {
            case ChildKind::Text:
            case ChildKind::CData:
                total += node.value().size();
                break;
            case ChildKind::Element:
                // opening and closing tag
                total += node.name().size() * 2 + 5;
                break;
            case ChildKind::Other:
                break;
            }
            return true;
        }

        size_t total;
};

} // namespace

size_t
estimateContentLength(const DOM::XMLNode& element)
{
    LengthEstimate walker;
    element.traverse( walker );
    return walker.total;
}

string
innerMarkup(const DOM::XMLNode& element, const Serializer& serializer)
{
    string result;
    if ( !element ) {
        return result;
    }
    result.reserve( std::max( estimateContentLength( element ), defaultBufferSize ) );

    for ( DOM::XMLNode child : element.children() ) {
        try {
            switch ( classify( child.type() ) ) {
            case ChildKind::Text:
                result += boost::algorithm::trim_copy_if( child.value(), &isTrimmed );
                break;
            case ChildKind::CData:
                result += child.value();
                break;
            case ChildKind::Element:
                serializer.serialize( child, result );
                break;
            case ChildKind::Other:
                break;
            }
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "skipping child '" << child.name()
                                       << "' of element '" << element.name()
                                       << "': " << e.what();
        }
    }
    return result;
}

optional<string>
extractInnerMarkup(const string& filePath, const string& tagName)
{
    if ( filePath.empty() || tagName.empty() ) {
        throw XMLProcessingError( XMLProcessingError::Kind::InvalidArgument,
                                  "file path and tag name must not be empty" );
    }

    checkReadableFile( filePath );

    try {
        DOM::XMLDocumentPtr document =
            SecureParserFactory::instance().newDocumentParser().parse( filePath );
        document->normalize();

        DOM::XMLNode element = document->findFirstElement( tagName );
        if ( !element ) {
            BOOST_LOG_TRIVIAL(debug) << "tag '" << tagName << "' not found in '"
                                     << filePath << "'";
            return boost::none;
        }
        return innerMarkup( element, SerializerFactory::sharedSerializer() );
    } catch (const XMLProcessingError&) {
        throw;
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "failed to parse XML file " << filePath
                                 << " for tag '" << tagName << "': "
                                 << fullMessage( e );
        std::throw_with_nested( XMLProcessingError(
            XMLProcessingError::Kind::Parse,
            "failed to parse XML file: " + filePath + " tag: " + tagName ) );
    }
}

} // namespace xmlextract
