#include <ostream>
#include <sstream>
#include <tuple>
#include <utility>

#include "connection_string.hpp"
#include "logging.hpp"
#include "queue_address.hpp"
#include "string.hpp"

using namespace std;

namespace sbql {

static Logger logger( "queue_address" );

constexpr char const* AddressConvention::defaultScheme;
constexpr char const* AddressConvention::defaultHostSuffix;


/**
 * class QueueAddress
 */

Result< QueueAddress > QueueAddress::create(
        string namespaceName, string queueName, AddressConvention const& convention )
{
    if ( namespaceName.empty()) {
        return make_error_code( sbql_errc::malformed_connection_string );
    }
    if ( queueName.empty()) {
        return make_error_code( sbql_errc::empty_queue_name );
    }

    QueueAddress result;
    result.scheme_ = convention.scheme;
    result.namespaceName_ = move( namespaceName );
    result.hostSuffix_ = convention.hostSuffix;
    result.queueName_ = move( queueName );
    return result;
}

string QueueAddress::host() const
{
    return hostSuffix_.empty() ? namespaceName_ : namespaceName_ + "." + hostSuffix_;
}

string QueueAddress::str() const
{
    ostringstream os;
    os << *this;
    return os.str();
}

ostream& operator<<( ostream& os, QueueAddress const& val )
{
    return os << val.scheme_ << "://" << val.host() << "/" << urlEncode( val.queueName_ ) << "/";
}

bool operator==( QueueAddress const& lhs, QueueAddress const& rhs )
{
    return tie( lhs.scheme(), lhs.namespaceName(), lhs.hostSuffix(), lhs.queueName())
            == tie( rhs.scheme(), rhs.namespaceName(), rhs.hostSuffix(), rhs.queueName());
}

bool operator!=( QueueAddress const& lhs, QueueAddress const& rhs )
{
    return !( lhs == rhs );
}


/**
 * function deriveQueueAddress
 */

Result< QueueAddress > deriveQueueAddress(
        ConnectionDescriptor const& descriptor, string const& queueName, AddressConvention const& convention )
{
    auto endpoint = descriptor.singleEndpoint();
    if ( !endpoint ) {
        logger.warning( "couldn't select endpoint: ", endpoint.error().message());
        return endpoint.error();
    }

    logger.debug( "deriving address for queue ", queueName, " from endpoint ", endpoint.value());

    return QueueAddress::create( endpoint.value().namespaceName(), queueName, convention );
}

} // namespace sbql
