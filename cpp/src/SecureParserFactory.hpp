#ifndef __HAVE_SECUREPARSERFACTORY__
#define __HAVE_SECUREPARSERFACTORY__

#include "XMLDOM_Pugi.hpp"
#include "XMLProcessingError.hpp"

namespace xmlextract
{

// Parser switches, named after the equivalent SAX/Xerces features
enum class ParserFeature
{
    SecureProcessing,           // enforce ProcessingLimits
    NamespaceAware,             // require bound prefixes, names pass through
    ExpandEntityReferences,     // replace entity references by their content
    XIncludeAware,              // process xi:include
    Validating,                 // validate against the DTD
    DisallowDoctype,            // reject any DOCTYPE declaration
    ExternalGeneralEntities,    // resolve external general entities
    ExternalParameterEntities   // resolve external parameter entities
};

// Protocols the parser may use to reach external resources; only "" (none)
// is supported
enum class ParserAttribute
{
    AccessExternalDTD,
    AccessExternalSchema
};

const char* featureName(ParserFeature feature);
const char* attributeName(ParserAttribute attribute);

// Applied when SecureProcessing is on
struct ProcessingLimits
{
    ProcessingLimits()
        : maxInputBytes( 64 * 1024 * 1024 )
        , maxElementDepth( 10000 )
    {}

    size_t maxInputBytes;
    unsigned int maxElementDepth;
};

struct ParserSettings
{
    ParserSettings()
        : secureProcessing( false )
        , namespaceAware( false )
        , disallowDoctype( false )
    {}

    bool secureProcessing;
    bool namespaceAware;
    bool disallowDoctype;
    ProcessingLimits limits;
};

/**
 * Single-use parser created by SecureParserFactory. It holds a copy of the
 * factory's settings, so it stays valid if the factory changes later.
 */
class DocumentParser
{
    friend class SecureParserFactory;
    public:
        // Parse the file at 'path'. Throws std::runtime_error if the file
        // can not be read, is not well-formed, or violates the settings.
        DOM::XMLDocumentPtr parse(const string& path) const;

        // Same, for an in-memory document
        DOM::XMLDocumentPtr parseString(const string& content) const;

        const ParserSettings& settings() const {
            return parserSettings;
        }

    private:
        explicit DocumentParser(const ParserSettings& settings)
            : parserSettings( settings ) {}

        XMLParseOptions parseOptions() const;
        void check(const DOM::XMLDocument& document) const;

        ParserSettings parserSettings;
};

/**
 * Configures and creates DocumentParsers.
 *
 * A default-constructed factory has every optional check off. The setters
 * throw UnsupportedFeature for values the pugixml engine can not honour:
 * it never expands or fetches entities, never processes XInclude and never
 * validates, so only the "off" value of those switches is accepted.
 *
 * instance() is the hardened, process-wide factory used by the extractor.
 * It must not be modified; create a separate factory for other settings.
 */
class SecureParserFactory
{
    public:
        SecureParserFactory() {}
        virtual ~SecureParserFactory() {}

        virtual void setFeature(ParserFeature feature, bool value);
        bool getFeature(ParserFeature feature) const;

        void setAttribute(ParserAttribute attribute, const string& value);

        void setLimits(const ProcessingLimits& limits) {
            settings.limits = limits;
        }
        const ProcessingLimits& limits() const {
            return settings.limits;
        }

        DocumentParser newDocumentParser() const {
            return DocumentParser( settings );
        }

        // Lazily created on first use; throws XMLProcessingError
        // (Kind::Configuration) if the hardening can not be applied
        static const SecureParserFactory& instance();

        // A new factory with the hardened settings used by instance()
        static std::unique_ptr<SecureParserFactory> createSecure();

        // Apply those settings to 'factory': the mandatory ones, then the
        // best-effort ones through trySetFeature(). Throws XMLProcessingError
        // (Kind::Configuration) with the cause nested if a mandatory one
        // is refused.
        static void harden(SecureParserFactory& factory);

    private:
        ParserSettings settings;
};

// Best-effort variant of setFeature(): logs a warning and returns false if
// the engine does not support the value
bool trySetFeature(SecureParserFactory& factory, ParserFeature feature, bool value);

} // namespace xmlextract

#endif // __HAVE_SECUREPARSERFACTORY__
