// General index header
//
#ifndef __HAVE_LIBINCLUDES__
#define __HAVE_LIBINCLUDES__

/**
 * Set up the general-purpose library environment, mainly STL and boost
 * libraries.
 */

#include <boost/intrusive_ptr.hpp>
#include <boost/optional.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

typedef std::string string;
using std::vector;
using boost::intrusive_ptr;
using boost::optional;

#endif // __HAVE_LIBINCLUDES__
