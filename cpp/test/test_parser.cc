/**
 * Parser hardening and the process-wide instance cache
 */

#include "xmlextract.hpp"
#include "AtomicCache.hpp"
#include "LogCapture.hpp"
#include "TempDir.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace xmlextract;

namespace {

const string xxeDocument =
    "<?xml version=\"1.0\"?>\n"
    "<!DOCTYPE root [<!ENTITY xxe SYSTEM \"file:///etc/passwd\">]>\n"
    "<root><tag>&xxe;</tag></root>\n";

string
Nested(unsigned int levels)
{
    string xml;
    for ( unsigned int i = 0; i < levels; ++i ) {
        xml += "<n>";
    }
    for ( unsigned int i = 0; i < levels; ++i ) {
        xml += "</n>";
    }
    return xml;
}

} // namespace

TEST(SecureParserFactory, DefaultIsPermissive)
{
    SecureParserFactory factory;

    EXPECT_FALSE( factory.getFeature( ParserFeature::SecureProcessing ) );
    EXPECT_FALSE( factory.getFeature( ParserFeature::NamespaceAware ) );
    EXPECT_FALSE( factory.getFeature( ParserFeature::DisallowDoctype ) );
    EXPECT_FALSE( factory.getFeature( ParserFeature::ExpandEntityReferences ) );

    DOM::XMLDocumentPtr document =
        factory.newDocumentParser().parseString( "<a><p:b/></a>" );
    EXPECT_EQ( "p:b", document->findFirstElement( "p:b" ).name() );
}

TEST(SecureParserFactory, UnsupportedValuesThrow)
{
    SecureParserFactory factory;

    EXPECT_THROW( factory.setFeature( ParserFeature::ExpandEntityReferences, true ),
                  UnsupportedFeature );
    EXPECT_THROW( factory.setFeature( ParserFeature::XIncludeAware, true ),
                  UnsupportedFeature );
    EXPECT_THROW( factory.setFeature( ParserFeature::Validating, true ),
                  UnsupportedFeature );
    EXPECT_THROW( factory.setFeature( ParserFeature::ExternalGeneralEntities, true ),
                  UnsupportedFeature );
    EXPECT_THROW( factory.setAttribute( ParserAttribute::AccessExternalDTD, "file" ),
                  UnsupportedFeature );

    EXPECT_NO_THROW( factory.setFeature( ParserFeature::ExternalParameterEntities, false ) );
    EXPECT_NO_THROW( factory.setAttribute( ParserAttribute::AccessExternalSchema, "" ) );
}

TEST(SecureParserFactory, TrySetFeatureWarns)
{
    LogCapture log;
    SecureParserFactory factory;

    EXPECT_FALSE( trySetFeature( factory, ParserFeature::XIncludeAware, true ) );
    EXPECT_TRUE( log.Contains( "warning" ) );
    EXPECT_TRUE( log.Contains( featureName( ParserFeature::XIncludeAware ) ) );

    EXPECT_TRUE( trySetFeature( factory, ParserFeature::DisallowDoctype, true ) );
    EXPECT_TRUE( factory.getFeature( ParserFeature::DisallowDoctype ) );
}

TEST(SecureParserFactory, CreateSecure)
{
    std::unique_ptr<SecureParserFactory> factory = SecureParserFactory::createSecure();

    EXPECT_TRUE( factory->getFeature( ParserFeature::SecureProcessing ) );
    EXPECT_TRUE( factory->getFeature( ParserFeature::NamespaceAware ) );
    EXPECT_TRUE( factory->getFeature( ParserFeature::DisallowDoctype ) );
    EXPECT_FALSE( factory->getFeature( ParserFeature::ExpandEntityReferences ) );
    EXPECT_FALSE( factory->getFeature( ParserFeature::XIncludeAware ) );
    EXPECT_FALSE( factory->getFeature( ParserFeature::Validating ) );

    const ParserSettings& settings = factory->newDocumentParser().settings();
    EXPECT_EQ( 64u * 1024 * 1024, settings.limits.maxInputBytes );
    EXPECT_EQ( 10000u, settings.limits.maxElementDepth );
}

namespace {

// Refuses one switch, the way an engine without that switch does
class RefusingFactory: public SecureParserFactory
{
    public:
        explicit RefusingFactory(ParserFeature refused)
            : refused( refused ) {}

        virtual void setFeature(ParserFeature feature, bool value) {
            if ( feature == refused ) {
                throw UnsupportedFeature( string( featureName( feature ) )
                                          + " is not available" );
            }
            SecureParserFactory::setFeature( feature, value );
        }

    private:
        ParserFeature refused;
};

} // namespace

TEST(SecureParserFactory, MandatoryRefusalIsConfigurationError)
{
    RefusingFactory factory( ParserFeature::NamespaceAware );

    try {
        SecureParserFactory::harden( factory );
        FAIL() << "expected XMLProcessingError";
    } catch (const XMLProcessingError& e) {
        EXPECT_EQ( XMLProcessingError::Kind::Configuration, e.kind() );
        EXPECT_THROW( std::rethrow_if_nested( e ), UnsupportedFeature );
        EXPECT_NE( string::npos,
                   fullMessage( e ).find( featureName( ParserFeature::NamespaceAware ) ) );
    }
}

TEST(SecureParserFactory, BestEffortRefusalIsLogged)
{
    LogCapture log;
    RefusingFactory factory( ParserFeature::DisallowDoctype );

    EXPECT_NO_THROW( SecureParserFactory::harden( factory ) );
    EXPECT_TRUE( factory.getFeature( ParserFeature::SecureProcessing ) );
    EXPECT_TRUE( factory.getFeature( ParserFeature::NamespaceAware ) );
    EXPECT_FALSE( factory.getFeature( ParserFeature::DisallowDoctype ) );
    EXPECT_TRUE( log.Contains( string( "warning XML parser does not support feature " )
                               + featureName( ParserFeature::DisallowDoctype ) ) );
}

TEST(SecureParserFactory, InstanceIsShared)
{
    const SecureParserFactory& first = SecureParserFactory::instance();
    const SecureParserFactory& second = SecureParserFactory::instance();

    EXPECT_EQ( &first, &second );
    EXPECT_TRUE( first.getFeature( ParserFeature::DisallowDoctype ) );
}

TEST(DocumentParser, RejectsDoctype)
{
    DocumentParser parser = SecureParserFactory::instance().newDocumentParser();

    try {
        parser.parseString( xxeDocument );
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE( string::npos, string( e.what() ).find( "DOCTYPE is disallowed" ) );
    }
}

TEST(DocumentParser, NeverExpandsEntities)
{
    // everything the engine allows, but no DOCTYPE ban
    std::unique_ptr<SecureParserFactory> factory = SecureParserFactory::createSecure();
    factory->setFeature( ParserFeature::DisallowDoctype, false );

    DOM::XMLDocumentPtr document =
        factory->newDocumentParser().parseString( xxeDocument );
    DOM::XMLNode tag = document->findFirstElement( "tag" );
    EXPECT_EQ( "&xxe;", tag.firstChild().value() );
}

TEST(DocumentParser, NamespaceBindings)
{
    DocumentParser parser = SecureParserFactory::createSecure()->newDocumentParser();

    EXPECT_NO_THROW( parser.parseString(
        "<root xmlns:p=\"urn:p\"><p:tag p:a=\"1\" xml:lang=\"en\"/></root>" ) );
    EXPECT_NO_THROW( parser.parseString( "<root xmlns=\"urn:d\"><tag/></root>" ) );

    EXPECT_THROW( parser.parseString( "<root><p:tag/></root>" ), std::runtime_error );
    EXPECT_THROW( parser.parseString( "<root><tag q:a=\"1\"/></root>" ),
                  std::runtime_error );
    EXPECT_THROW( parser.parseString( "<root xmlns:p=\"urn:p\"><p:/></root>" ),
                  std::runtime_error );
    // bindings are scoped to the declaring element
    EXPECT_THROW( parser.parseString(
        "<root><a xmlns:p=\"urn:p\"/><p:b/></root>" ), std::runtime_error );
}

TEST(DocumentParser, DepthLimit)
{
    SecureParserFactory factory;
    factory.setFeature( ParserFeature::SecureProcessing, true );
    ProcessingLimits limits;
    limits.maxElementDepth = 5;
    factory.setLimits( limits );

    DocumentParser parser = factory.newDocumentParser();
    EXPECT_NO_THROW( parser.parseString( Nested( 5 ) ) );
    EXPECT_THROW( parser.parseString( Nested( 6 ) ), std::runtime_error );

    // no limits without secure processing
    factory.setFeature( ParserFeature::SecureProcessing, false );
    EXPECT_NO_THROW( factory.newDocumentParser().parseString( Nested( 6 ) ) );
}

TEST(DocumentParser, InputSizeLimit)
{
    TempDir dir;
    const string content = "<root>0123456789</root>";
    const string path = dir.Write( "big.xml", content );

    SecureParserFactory factory;
    factory.setFeature( ParserFeature::SecureProcessing, true );
    ProcessingLimits limits;
    limits.maxInputBytes = content.size() - 1;
    factory.setLimits( limits );

    DocumentParser parser = factory.newDocumentParser();
    EXPECT_THROW( parser.parse( path ), std::runtime_error );
    EXPECT_THROW( parser.parseString( content ), std::runtime_error );

    limits.maxInputBytes = content.size();
    factory.setLimits( limits );
    EXPECT_EQ( "root", factory.newDocumentParser().parse( path )->documentElement().name() );
}

TEST(DocumentParser, KeepsItsSettings)
{
    SecureParserFactory factory;
    DocumentParser parser = factory.newDocumentParser();
    factory.setFeature( ParserFeature::DisallowDoctype, true );

    EXPECT_FALSE( parser.settings().disallowDoctype );
    EXPECT_NO_THROW( parser.parseString( "<!DOCTYPE root><root/>" ) );
}

TEST(DocumentParser, Errors)
{
    TempDir dir;
    DocumentParser parser = SecureParserFactory::instance().newDocumentParser();

    EXPECT_THROW( parser.parseString( "<root><a></root>" ), std::runtime_error );
    EXPECT_THROW( parser.parseString( "" ), std::runtime_error );
    EXPECT_THROW( parser.parse( dir.Path() + "/missing.xml" ), std::runtime_error );
}

namespace {

struct Counted
{
    static std::atomic<int> created;
    static std::atomic<int> destroyed;

    Counted() {
        ++created;
    }
    ~Counted() {
        ++destroyed;
    }
};

std::atomic<int> Counted::created( 0 );
std::atomic<int> Counted::destroyed( 0 );

} // namespace

TEST(AtomicCache, RacingThreadsShareOneInstance)
{
    const int threadCount = 8;
    Counted::created = 0;
    Counted::destroyed = 0;

    {
        AtomicCache<Counted> cache;
        std::atomic<bool> go( false );
        std::vector<Counted*> seen( threadCount, nullptr );
        std::vector<std::thread> threads;

        for ( int i = 0; i < threadCount; ++i ) {
            threads.emplace_back( [&cache, &go, &seen, i]() {
                while ( !go ) {
                    std::this_thread::yield();
                }
                seen[i] = &cache.get( []() {
                    std::this_thread::sleep_for( std::chrono::milliseconds( 5 ) );
                    return std::unique_ptr<Counted>( new Counted );
                } );
            } );
        }
        go = true;
        for ( std::thread& t : threads ) {
            t.join();
        }

        for ( Counted* p : seen ) {
            EXPECT_EQ( cache.peek(), p );
        }
        // every losing candidate is already gone
        EXPECT_EQ( 1, Counted::created - Counted::destroyed );
    }

    EXPECT_EQ( Counted::created.load(), Counted::destroyed.load() );
}

TEST(AtomicCache, FailedCreationIsRetried)
{
    AtomicCache<int> cache;

    EXPECT_THROW( cache.get( []() -> std::unique_ptr<int> {
                      throw std::runtime_error( "no" );
                  } ),
                  std::runtime_error );
    EXPECT_EQ( nullptr, cache.peek() );

    EXPECT_EQ( 42, cache.get( []() { return std::unique_ptr<int>( new int( 42 ) ); } ) );
    EXPECT_EQ( 42, cache.get( []() { return std::unique_ptr<int>( new int( 7 ) ); } ) );
}
