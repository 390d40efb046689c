#include <utility>

#include "connection_string.hpp"
#include "listener_binder.hpp"
#include "logging.hpp"
#include "service_endpoint.hpp"
#include "token_provider.hpp"

using namespace std;

namespace sbql {

static Logger logger( "binder" );

static Result< shared_ptr< TokenProvider const > > createTokenProvider(
        ConnectionDescriptor const& descriptor, chrono::seconds tokenLifetime )
{
    if ( !descriptor.sharedAccessSignature().empty()) {
        auto provider = SharedAccessSignatureTokenProvider::fromSignature( descriptor.sharedAccessSignature());
        if ( !provider ) {
            return provider.error();
        }
        return shared_ptr< TokenProvider const > { move( provider.value()) };
    }

    auto provider = SharedAccessSignatureTokenProvider::create(
            descriptor.sharedAccessKeyName(), descriptor.sharedAccessKey(), tokenLifetime );
    if ( !provider ) {
        return provider.error();
    }
    return shared_ptr< TokenProvider const > { move( provider.value()) };
}

Result< shared_ptr< QueuedListener > > bindListener(
        BindRequest const& request, QueueAddress const& address, ConnectionDescriptor const& descriptor )
{
    if ( !request.service ) {
        return make_error_code( sbql_errc::null_service_object );
    }
    if ( !request.binding ) {
        return make_error_code( sbql_errc::null_binding_policy );
    }
    if ( !request.context ) {
        return make_error_code( sbql_errc::null_activation_context );
    }
    if ( !request.behaviors ) {
        return make_error_code( sbql_errc::null_behavior_list );
    }
    for ( auto const& behavior : *request.behaviors ) {
        if ( !behavior ) {
            return make_error_code( sbql_errc::null_behavior );
        }
    }

    auto tokenProvider = createTokenProvider( descriptor, request.tokenLifetime );
    if ( !tokenProvider ) {
        return tokenProvider.error();
    }

    logger.debug( "binding ", request.contractName, " to ", address, " with ", *request.binding );

    auto listener = make_shared< QueuedListener >(
            request.service, request.context, ServiceEndpoint { request.contractName, address, request.binding } );

    auto& endpoint = listener->endpoint();
    endpoint.addBehavior( make_shared< TransportClientBehavior >( move( tokenProvider.value())));
    for ( auto const& behavior : *request.behaviors ) {
        endpoint.addBehavior( behavior );
    }
    return listener;
}

} // namespace sbql
