#ifndef __HAVE_SERIALIZER__
#define __HAVE_SERIALIZER__

#include "XMLDOM_Pugi.hpp"
#include "XMLProcessingError.hpp"

namespace xmlextract
{

enum class SerializerFeature
{
    SecureProcessing            // refuse subtrees nested deeper than the limit
};

// Protocols a transform may use for external DTDs and stylesheets; only
// "" (none) is supported
enum class SerializerAttribute
{
    AccessExternalDTD,
    AccessExternalStylesheet
};

// Output properties, fixed when the Serializer is created
struct SerializerProperties
{
    SerializerProperties()
        : omitXmlDeclaration( true )
        , indent( false )
        , encoding( "UTF-8" )
    {}

    bool omitXmlDeclaration;
    bool indent;
    string encoding;
};

/**
 * Turns a node and its subtree back into markup. A serialized element
 * carries the namespace declarations of its ancestors that its names use.
 *
 * A Serializer is immutable once created and may be used from several
 * threads at once.
 */
class Serializer
{
    friend class SerializerFactory;
    public:
        // Throws std::runtime_error if the node can not be serialized
        string serialize(const DOM::XMLNode& node) const;

        // Appends to 'out' instead; 'out' is unchanged on failure
        void serialize(const DOM::XMLNode& node, string& out) const;

        const SerializerProperties& properties() const {
            return outputProperties;
        }

        // 0 when the depth is not limited
        unsigned int maxElementDepth() const {
            return depthLimit;
        }

    private:
        Serializer(const SerializerProperties& properties, unsigned int depthLimit)
            : outputProperties( properties )
            , depthLimit( depthLimit ) {}

        const SerializerProperties outputProperties;
        const unsigned int depthLimit;
};

class SerializerFactory
{
    public:
        static const unsigned int defaultMaxElementDepth = 1024;

        SerializerFactory()
            : secureProcessing( false )
            , depthLimit( defaultMaxElementDepth ) {}

        // Throw UnsupportedFeature for values the engine can not honour
        void setFeature(SerializerFeature feature, bool value);
        bool getFeature(SerializerFeature feature) const;
        void setAttribute(SerializerAttribute attribute, const string& value);

        // Nesting limit applied under SecureProcessing
        void setMaxElementDepth(unsigned int depth) {
            depthLimit = depth;
        }

        // Throws UnsupportedFeature for an encoding other than UTF-8
        std::unique_ptr<Serializer> newSerializer(
            const SerializerProperties& properties = SerializerProperties() ) const;

        // Hardened process-wide factory; throws XMLProcessingError
        // (Kind::Configuration) if it can not be set up
        static const SerializerFactory& instance();

        // Process-wide serializer from instance(): no XML declaration, no
        // indentation, UTF-8
        static const Serializer& sharedSerializer();

    private:
        bool secureProcessing;
        unsigned int depthLimit;
};

} // namespace xmlextract

#endif // __HAVE_SERIALIZER__
