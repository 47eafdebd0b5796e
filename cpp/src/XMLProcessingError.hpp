#ifndef __HAVE_XMLPROCESSINGERROR__
#define __HAVE_XMLPROCESSINGERROR__

#include "LibIncludes.hpp"
#include <exception>
#include <stdexcept>

namespace xmlextract
{

/**
 * The single error type surfaced by the extractor.
 *
 * Where a lower-level failure caused it, that failure is attached with
 * std::throw_with_nested() and can be recovered with
 * std::rethrow_if_nested(), or flattened with fullMessage().
 */
class XMLProcessingError: public std::runtime_error
{
    public:
        enum class Kind
        {
            InvalidArgument,    // missing file path or tag name
            FileAccess,         // path missing, not a regular file, not readable
            Parse,              // malformed XML, I/O failure, hardening rejection
            Configuration       // secure parser/serializer could not be set up
        };

        XMLProcessingError(Kind kind, const string& message)
            : std::runtime_error( message )
            , errorKind( kind ) {}

        Kind kind() const {
            return errorKind;
        }

    private:
        Kind errorKind;
};

const char* kindName(XMLProcessingError::Kind kind);

/**
 * Thrown by the factory setters when the XML engine cannot honour a
 * feature or attribute value.
 */
class UnsupportedFeature: public std::runtime_error
{
    public:
        explicit UnsupportedFeature(const string& message)
            : std::runtime_error( message ) {}
};

// what() of 'e' followed by the messages of all nested causes, separated
// by ": "
string fullMessage(const std::exception& e);

} // namespace xmlextract

#endif // __HAVE_XMLPROCESSINGERROR__
