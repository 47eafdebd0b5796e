#include "Serializer.hpp"
#include "AtomicCache.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <sstream>

namespace xmlextract
{

const unsigned int SerializerFactory::defaultMaxElementDepth;

namespace {

AtomicCache<SerializerFactory> serializerFactoryCache;
AtomicCache<Serializer> serializerCache;

const char*
attributeName(SerializerAttribute attribute)
{
    switch ( attribute ) {
    case SerializerAttribute::AccessExternalDTD:
        return "access-external-dtd";
    case SerializerAttribute::AccessExternalStylesheet:
        return "access-external-stylesheet";
    }
    return "unknown";
}

std::unique_ptr<SerializerFactory>
createSecureFactory()
{
    std::unique_ptr<SerializerFactory> factory( new SerializerFactory );
    try {
        factory->setFeature( SerializerFeature::SecureProcessing, true );
        factory->setAttribute( SerializerAttribute::AccessExternalDTD, "" );
        factory->setAttribute( SerializerAttribute::AccessExternalStylesheet, "" );
    } catch (const std::exception&) {
        std::throw_with_nested( XMLProcessingError(
            XMLProcessingError::Kind::Configuration,
            "unable to configure a secure serializer factory" ) );
    }
    return factory;
}

std::unique_ptr<Serializer>
createSharedSerializer()
{
    const SerializerFactory& factory = SerializerFactory::instance();

    SerializerProperties properties;
    properties.omitXmlDeclaration = true;
    properties.indent = false;
    properties.encoding = "UTF-8";
    try {
        return factory.newSerializer( properties );
    } catch (const std::exception&) {
        std::throw_with_nested( XMLProcessingError(
            XMLProcessingError::Kind::Configuration,
            "unable to create the shared serializer" ) );
    }
}

} // namespace

/**
 * Serializer implementation
 */

string
Serializer::serialize(const DOM::XMLNode& node) const
{
    string out;
    serialize( node, out );
    return out;
}

void
Serializer::serialize(const DOM::XMLNode& node, string& out) const
{
    if ( !node ) {
        throw std::runtime_error( "can not serialize an empty node" );
    }
    if ( depthLimit != 0 ) {
        unsigned int depth = node.subtreeDepth();
        if ( depth > depthLimit ) {
            std::ostringstream oss;
            oss << "element '" << node.name() << "' nests " << depth
                << " levels deep, the limit is " << depthLimit;
            throw std::runtime_error( oss.str() );
        }
    }

    string markup;
    if ( !outputProperties.omitXmlDeclaration ) {
        markup = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>";
        if ( outputProperties.indent ) {
            markup += '\n';
        }
    }
    // a detached element keeps the bindings its names rely on
    node.print( markup, outputProperties.indent, node.inheritedNamespaces() );
    out += markup;
}

/**
 * SerializerFactory implementation
 */

void
SerializerFactory::setFeature(SerializerFeature feature, bool value)
{
    switch ( feature ) {
    case SerializerFeature::SecureProcessing:
        secureProcessing = value;
        break;
    }
}

bool
SerializerFactory::getFeature(SerializerFeature feature) const
{
    switch ( feature ) {
    case SerializerFeature::SecureProcessing:
        return secureProcessing;
    }
    return false;
}

void
SerializerFactory::setAttribute(SerializerAttribute attribute, const string& value)
{
    if ( !value.empty() ) {
        throw UnsupportedFeature( string( attributeName( attribute ) )
                                  + " only accepts \"\": the serializer never"
                                    " loads external resources" );
    }
}

std::unique_ptr<Serializer>
SerializerFactory::newSerializer(const SerializerProperties& properties) const
{
    if ( !boost::algorithm::iequals( properties.encoding, "UTF-8" )
         && !boost::algorithm::iequals( properties.encoding, "UTF8" ) ) {
        throw UnsupportedFeature( "output encoding '" + properties.encoding
                                  + "' is not supported, only UTF-8" );
    }
    return std::unique_ptr<Serializer>(
        new Serializer( properties, secureProcessing ? depthLimit : 0 ) );
}

const SerializerFactory&
SerializerFactory::instance()
{
    return serializerFactoryCache.get( &createSecureFactory );
}

const Serializer&
SerializerFactory::sharedSerializer()
{
    return serializerCache.get( &createSharedSerializer );
}

} // namespace xmlextract
