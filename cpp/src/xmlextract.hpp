// General index header
//
#ifndef __HAVE_XMLEXTRACT__
#define __HAVE_XMLEXTRACT__

#include "LibIncludes.hpp"
#include "Logging.hpp"
#include "XMLProcessingError.hpp"
#include "XMLDOM_Pugi.hpp"
#include "SecureParserFactory.hpp"
#include "Serializer.hpp"
#include "ElementExtractor.hpp"

#endif // __HAVE_XMLEXTRACT__
