#include <ostream>
#include <utility>

#include "activation_context.hpp"
#include "connection_string.hpp"
#include "deferred_listener.hpp"
#include "listener_binder.hpp"
#include "logging.hpp"

using namespace std;

namespace sbql {

static Logger logger( "deferred" );

ostream& operator<<( ostream& os, ListenerState val )
{
    switch ( val ) {
        case ListenerState::registered: return os << "registered";
        case ListenerState::resolving: return os << "resolving";
        case ListenerState::bound: return os << "bound";
        case ListenerState::failed: return os << "failed";
    }
    return os << "unknown";
}


/**
 * class DeferredListener
 */

class DeferredListener::Impl
{
public:
    Impl( shared_ptr< void >&& service, string&& contractName, shared_ptr< BindingPolicy const >&& binding,
            CredentialSource&& credential, ListenerOptions&& options )
            : credential_( std::move( credential ))
            , options_( move( options ))
    {
        request_.service = move( service );
        request_.contractName = move( contractName );
        request_.binding = move( binding );
        request_.behaviors = options_.behaviors;
        request_.tokenLifetime = options_.tokenLifetime;
    }

    string const& contractName() const { return request_.contractName; }
    ListenerState state() const { return state_; }

    Result< shared_ptr< QueuedListener > > activate( ActivationContext const* context )
    {
        switch ( state_ ) {
            case ListenerState::bound:
                return listener_;
            case ListenerState::failed:
                return error_;
            case ListenerState::resolving:
            case ListenerState::registered:
                break;
        }

        state_ = ListenerState::resolving;
        logger.debug( "activating listener for ", request_.contractName );

        auto listener = resolve( context );
        if ( !listener ) {
            state_ = ListenerState::failed;
            error_ = listener.error();
            logger.warning( "activating listener for ", request_.contractName, " failed: ", error_.message());
            return error_;
        }

        state_ = ListenerState::bound;
        listener_ = move( listener.value());
        logger.info( "listener for ", request_.contractName, " bound to ", listener_->endpoint().address());
        return listener_;
    }

private:
    Result< shared_ptr< QueuedListener > > resolve( ActivationContext const* context )
    {
        auto connectionString = resolveCredential( credential_, context );
        if ( !connectionString ) {
            return connectionString.error();
        }

        auto descriptor = ConnectionDescriptor::parse( connectionString.value());
        if ( !descriptor ) {
            return descriptor.error();
        }

        logger.debug( "resolved connection string ", descriptor.value());

        auto queueName = options_.queueNameProvider ? options_.queueNameProvider() : request_.contractName;
        auto address = deriveQueueAddress( descriptor.value(), queueName, options_.address );
        if ( !address ) {
            return address.error();
        }

        auto request = request_;
        request.context = context;
        return bindListener( request, address.value(), descriptor.value());
    }

    CredentialSource credential_;
    ListenerOptions options_;
    BindRequest request_;
    ListenerState state_ { ListenerState::registered };
    shared_ptr< QueuedListener > listener_;
    error_code error_;
};

DeferredListener::DeferredListener( shared_ptr< void > service, string contractName,
        shared_ptr< BindingPolicy const > binding, CredentialSource credential, ListenerOptions options )
        : impl_ { std::make_unique< Impl >(
                move( service ), move( contractName ), move( binding ), std::move( credential ), move( options )) } {}

DeferredListener::DeferredListener( DeferredListener&& other ) noexcept = default;

DeferredListener::~DeferredListener() = default;

DeferredListener& DeferredListener::operator=( DeferredListener&& other ) noexcept = default;

string const& DeferredListener::contractName() const
{
    return impl_->contractName();
}

ListenerState DeferredListener::state() const
{
    return impl_->state();
}

Result< shared_ptr< QueuedListener > > DeferredListener::activate( ActivationContext const* context )
{
    return impl_->activate( context );
}


/**
 * function createQueuedListener
 */

namespace detail {

Result< DeferredListener > createQueuedListener(
        shared_ptr< void > service, string contractName, shared_ptr< BindingPolicy const > binding,
        CredentialSource credential, ListenerOptions options )
{
    if ( !service ) {
        return make_error_code( sbql_errc::null_service_object );
    }
    if ( !binding ) {
        return make_error_code( sbql_errc::null_binding_policy );
    }
    if ( !options.behaviors ) {
        return make_error_code( sbql_errc::null_behavior_list );
    }

    auto credentialValid = validateCredential( credential );
    if ( !credentialValid ) {
        return credentialValid.error();
    }

    logger.debug( "registering queued listener for ", contractName );

    return DeferredListener {
            move( service ), move( contractName ), move( binding ), std::move( credential ), move( options ) };
}

} // namespace detail

} // namespace sbql
