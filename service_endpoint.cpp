#include <ostream>
#include <utility>

#include "logging.hpp"
#include "service_endpoint.hpp"
#include "token_provider.hpp"

using namespace std;

namespace sbql {

static Logger logger( "endpoint" );


/**
 * class EndpointBehavior
 */

EndpointBehavior::~EndpointBehavior() = default;


/**
 * class TransportClientBehavior
 */

TransportClientBehavior::TransportClientBehavior( shared_ptr< TokenProvider const > tokenProvider )
        : tokenProvider_ { move( tokenProvider ) } {}

Result< void > TransportClientBehavior::apply( ServiceEndpoint const& endpoint )
{
    audience_ = endpoint.address().str();
    logger.debug( "authenticating ", endpoint.contractName(), " for ", audience_ );
    return boost::outcome_v2::success();
}

string TransportClientBehavior::token() const
{
    return tokenProvider_->token( audience_ );
}


/**
 * class ServiceEndpoint
 */

ServiceEndpoint::ServiceEndpoint( string contractName, QueueAddress address, shared_ptr< BindingPolicy const > binding )
        : contractName_ { move( contractName ) }
        , address_ { move( address ) }
        , binding_ { move( binding ) } {}

void ServiceEndpoint::addBehavior( shared_ptr< EndpointBehavior > behavior )
{
    logger.debug( "adding ", behavior->name(), " to ", contractName_, " at ", address_ );
    behaviors_.push_back( move( behavior ));
}

ostream& operator<<( ostream& os, ServiceEndpoint const& val )
{
    return os << "[" << val.contractName_ << "@" << val.address_ << "] ";
}

} // namespace sbql
