#include <algorithm>
#include <cctype>
#include <ostream>
#include <sstream>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "connection_string.hpp"
#include "logging.hpp"

using namespace std;
using namespace std::experimental;

namespace algo = boost::algorithm;

namespace sbql {

static Logger logger( "conn_string" );

// keeps hours * 3600 within chrono::seconds
static constexpr size_t maxTimeoutDigits = 9;

static bool isDigits( string const& value )
{
    return !value.empty() && all_of( value.begin(), value.end(), []( unsigned char c ) { return isdigit( c ); } );
}

static optional< unsigned > parsePort( string const& value )
{
    if ( !isDigits( value ) || value.length() > 5 ) {
        return nullopt;
    }
    auto port = stoul( value );
    return port <= 65535 ? optional< unsigned > { static_cast< unsigned >( port ) } : nullopt;
}

// TimeSpan notation: hh:mm:ss
static optional< chrono::seconds > parseTimeout( string const& value )
{
    vector< string > parts;
    algo::split( parts, value, algo::is_any_of( ":" ));
    if ( parts.size() != 3 || !all_of( parts.begin(), parts.end(), []( string const& part ) {
                return isDigits( part ) && part.length() <= maxTimeoutDigits;
            } )) {
        return nullopt;
    }
    auto const hours = chrono::hours( stol( parts[ 0 ] ));
    auto const minutes = chrono::minutes( stol( parts[ 1 ] ));
    auto const seconds = chrono::seconds( stol( parts[ 2 ] ));
    if ( minutes.count() >= 60 || seconds.count() >= 60 ) {
        return nullopt;
    }
    return chrono::duration_cast< chrono::seconds >( hours + minutes + seconds );
}


/**
 * class EndpointUri
 */

Result< EndpointUri > EndpointUri::parse( string const& text )
{
    auto const value = algo::trim_copy( text );

    auto schemeEnd = value.find( "://" );
    if ( schemeEnd == string::npos || schemeEnd == 0 ) {
        return make_error_code( sbql_errc::malformed_connection_string );
    }

    EndpointUri result;
    result.scheme_ = value.substr( 0, schemeEnd );
    if ( !isalpha( static_cast< unsigned char >( result.scheme_.front())) ||
            !all_of( result.scheme_.begin(), result.scheme_.end(), []( unsigned char c ) {
                return isalnum( c ) || c == '+' || c == '-' || c == '.';
            } )) {
        return make_error_code( sbql_errc::malformed_connection_string );
    }

    auto authorityStart = schemeEnd + 3;
    auto authorityEnd = value.find_first_of( "/?#", authorityStart );
    auto authority = value.substr( authorityStart, authorityEnd - authorityStart );
    result.path_ = authorityEnd != string::npos ? value.substr( authorityEnd ) : "/";

    auto portStart = authority.rfind( ':' );
    if ( portStart != string::npos ) {
        result.port_ = parsePort( authority.substr( portStart + 1 ));
        if ( !result.port_ ) {
            return make_error_code( sbql_errc::malformed_connection_string );
        }
        authority.erase( portStart );
    }

    if ( authority.empty() || authority.find_first_of( " @[]" ) != string::npos ) {
        return make_error_code( sbql_errc::malformed_connection_string );
    }
    result.host_ = move( authority );
    return result;
}

string EndpointUri::namespaceName() const
{
    return host_.substr( 0, host_.find( '.' ));
}

string EndpointUri::str() const
{
    ostringstream os;
    os << *this;
    return os.str();
}

ostream& operator<<( ostream& os, EndpointUri const& val )
{
    os << val.scheme_ << "://" << val.host_;
    if ( val.port_ ) {
        os << ":" << *val.port_;
    }
    return os << val.path_;
}


/**
 * class ConnectionDescriptor
 */

Result< ConnectionDescriptor > ConnectionDescriptor::parse( string const& text )
{
    vector< string > entries;
    algo::split( entries, text, algo::is_any_of( ";" ));

    ConnectionDescriptor result;
    for ( auto const& entry : entries ) {
        if ( algo::all( entry, algo::is_space())) {
            continue;
        }

        auto separator = entry.find( '=' );
        if ( separator == string::npos ) {
            logger.warning( "connection string entry without '=' at position ", &entry - &entries.front() );
            return make_error_code( sbql_errc::malformed_connection_string );
        }

        auto key = algo::trim_copy( entry.substr( 0, separator ));
        auto value = algo::trim_copy( entry.substr( separator + 1 ));

        if ( algo::iequals( key, "Endpoint" )) {
            vector< string > uris;
            algo::split( uris, value, algo::is_any_of( "," ));
            for ( auto const& uri : uris ) {
                if ( algo::all( uri, algo::is_space())) {
                    continue;
                }
                auto endpoint = EndpointUri::parse( uri );
                if ( !endpoint ) {
                    logger.warning( "invalid endpoint \"", uri, "\" in connection string" );
                    return endpoint.error();
                }
                result.endpoints_.push_back( move( endpoint.value()));
            }
        } else if ( algo::iequals( key, "StsEndpoint" )) {
            result.stsEndpoint_ = move( value );
        } else if ( algo::iequals( key, "RuntimePort" ) || algo::iequals( key, "ManagementPort" )) {
            auto port = parsePort( value );
            if ( !port ) {
                logger.warning( "invalid ", key, " \"", value, "\" in connection string" );
                return make_error_code( sbql_errc::malformed_connection_string );
            }
            ( algo::iequals( key, "RuntimePort" ) ? result.runtimePort_ : result.managementPort_ ) = port;
        } else if ( algo::iequals( key, "SharedAccessKeyName" )) {
            result.sharedAccessKeyName_ = move( value );
        } else if ( algo::iequals( key, "SharedAccessKey" )) {
            result.sharedAccessKey_ = move( value );
        } else if ( algo::iequals( key, "SharedAccessSignature" )) {
            result.sharedAccessSignature_ = move( value );
        } else if ( algo::iequals( key, "EntityPath" )) {
            result.entityPath_ = move( value );
        } else if ( algo::iequals( key, "TransportType" )) {
            result.transportType_ = move( value );
        } else if ( algo::iequals( key, "OperationTimeout" )) {
            result.operationTimeout_ = parseTimeout( value );
            if ( !result.operationTimeout_ ) {
                logger.warning( "invalid OperationTimeout \"", value, "\" in connection string" );
                return make_error_code( sbql_errc::malformed_connection_string );
            }
        } else {
            logger.warning( "unknown key \"", key, "\" in connection string" );
            return make_error_code( sbql_errc::malformed_connection_string );
        }
    }
    return result;
}

Result< EndpointUri > ConnectionDescriptor::singleEndpoint() const
{
    EndpointUri const* found {};
    size_t count {};
    for ( auto const& endpoint : endpoints_ ) {
        found = &endpoint;
        ++count;
    }

    if ( count == 0 ) {
        return make_error_code( sbql_errc::no_endpoint );
    }
    if ( count > 1 ) {
        return make_error_code( sbql_errc::ambiguous_endpoint );
    }
    return *found;
}

ostream& operator<<( ostream& os, ConnectionDescriptor const& val )
{
    os << "Endpoint=";
    for ( auto it = val.endpoints_.begin(); it != val.endpoints_.end(); ++it ) {
        os << ( it != val.endpoints_.begin() ? "," : "" ) << *it;
    }
    if ( !val.sharedAccessKeyName_.empty()) {
        os << ";SharedAccessKeyName=" << val.sharedAccessKeyName_;
    }
    if ( !val.sharedAccessKey_.empty()) {
        os << ";SharedAccessKey=***";
    }
    if ( !val.sharedAccessSignature_.empty()) {
        os << ";SharedAccessSignature=***";
    }
    if ( !val.entityPath_.empty()) {
        os << ";EntityPath=" << val.entityPath_;
    }
    return os;
}

} // namespace sbql
