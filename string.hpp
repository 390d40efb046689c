#ifndef SB_QUEUED_LISTENER_STRING_HPP
#define SB_QUEUED_LISTENER_STRING_HPP

#include <sstream>
#include <string>
#include <utility>

namespace sbql {

namespace detail {

inline void str( std::ostream& ) {}

template< typename Arg0, typename ...Args >
void str( std::ostream& os, Arg0&& arg0, Args&&... args )
{
    os << std::forward< Arg0 >( arg0 );
    str( os, std::forward< Args >( args )... );
}

} // namespace detail

template< typename ...Args >
std::string str( Args&&... args )
{
    std::ostringstream os;
    detail::str( os, std::forward< Args >( args )... );
    return os.str();
}

/**
 * Percent-encodes everything but the RFC 3986 unreserved characters.
 */
std::string urlEncode( std::string const& value );

} // namespace sbql

#endif // SB_QUEUED_LISTENER_STRING_HPP
