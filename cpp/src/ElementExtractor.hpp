#ifndef __HAVE_ELEMENTEXTRACTOR__
#define __HAVE_ELEMENTEXTRACTOR__

#include "Serializer.hpp"
#include "XMLProcessingError.hpp"

namespace xmlextract
{

/**
 * Read the inner markup of the first element named 'tagName' in the XML
 * file at 'filePath'.
 *
 * The file is parsed with the hardened SecureParserFactory::instance(). The
 * result is the concatenation of the element's children: text trimmed of
 * surrounding whitespace, CDATA content verbatim, child elements as markup
 * (no XML declaration, no indentation, UTF-8). Comments and processing
 * instructions are left out.
 *
 * Returns boost::none if no element has that name. Throws
 * XMLProcessingError for empty arguments, an inaccessible file, or a
 * document that can not be parsed.
 *
 * Safe to call from several threads at once.
 */
optional<string> extractInnerMarkup(const string& filePath, const string& tagName);

/**
 * Serialize the children of 'element' as described above. A child that
 * fails to serialize is logged and skipped.
 */
string innerMarkup(const DOM::XMLNode& element, const Serializer& serializer);

// Rough size of innerMarkup(element), used to reserve the output buffer
size_t estimateContentLength(const DOM::XMLNode& element);

} // namespace xmlextract

#endif // __HAVE_ELEMENTEXTRACTOR__
