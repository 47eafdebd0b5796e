/*
 * Collects Boost.Log records in memory while in scope
 */

#ifndef __HAVE_LOGCAPTURE__
#define __HAVE_LOGCAPTURE__

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/trivial.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <sstream>
#include <string>

class LogCapture
{
    typedef boost::log::sinks::synchronous_sink<
        boost::log::sinks::text_ostream_backend> sink_type;

public:
    LogCapture()
        : stream( boost::make_shared<std::ostringstream>() )
        , sink( boost::make_shared<sink_type>() )
    {
        namespace expr = boost::log::expressions;

        sink->locked_backend()->add_stream( stream );
        sink->set_formatter( expr::stream << boost::log::trivial::severity
                                          << " " << expr::smessage );
        boost::log::core::get()->add_sink( sink );
    }

    ~LogCapture()
    {
        boost::log::core::get()->remove_sink( sink );
    }

    LogCapture(const LogCapture &) = delete;
    LogCapture &operator=(const LogCapture &) = delete;

    /* one line per record, "severity message" */
    std::string Text()
    {
        sink->flush();
        return stream->str();
    }

    bool Contains(const std::string &text)
    {
        return Text().find( text ) != std::string::npos;
    }

private:
    boost::shared_ptr<std::ostringstream> stream;
    boost::shared_ptr<sink_type> sink;
};

#endif
