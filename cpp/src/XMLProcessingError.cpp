#include "XMLProcessingError.hpp"

namespace xmlextract
{

const char*
kindName(XMLProcessingError::Kind kind)
{
    switch ( kind ) {
    case XMLProcessingError::Kind::InvalidArgument:
        return "invalid argument";
    case XMLProcessingError::Kind::FileAccess:
        return "file access error";
    case XMLProcessingError::Kind::Parse:
        return "parse error";
    case XMLProcessingError::Kind::Configuration:
        return "configuration error";
    }
    return "unknown error";
}

string
fullMessage(const std::exception& e)
{
    try {
        std::rethrow_if_nested( e );
    } catch (const std::exception& nested) {
        return string( e.what() ) + ": " + fullMessage( nested );
    } catch (...) {
        return string( e.what() ) + ": unrecognized exception";
    }
    return e.what();
}

} // namespace xmlextract
