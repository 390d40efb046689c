#ifndef SB_QUEUED_LISTENER_DEFERRED_LISTENER_HPP
#define SB_QUEUED_LISTENER_DEFERRED_LISTENER_HPP

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

#include "binding_policy.hpp"
#include "credential_source.hpp"
#include "endpoint_behavior.hpp"
#include "error.hpp"
#include "queue_address.hpp"
#include "queued_listener.hpp"
#include "token_provider.hpp"

namespace sbql {

class ActivationContext;

/**
 * struct ListenerOptions
 */

struct ListenerOptions
{
    // queue to listen on; the contract name if not set
    std::function< std::string () > queueNameProvider;

    // attached after the authentication behavior, in this order; must not be null
    std::shared_ptr< EndpointBehaviors const > behaviors = std::make_shared< EndpointBehaviors >();

    AddressConvention address;

    std::chrono::seconds tokenLifetime = SharedAccessSignatureTokenProvider::defaultTokenLifetime;
};


/**
 * enum class ListenerState
 */

enum class ListenerState
{
    registered,
    resolving,
    bound,
    failed
};

std::ostream& operator<<( std::ostream& os, ListenerState val );


/**
 * class DeferredListener
 *
 * Captures everything needed to build a queued listener, but resolves the credential, derives the queue address
 * and binds the listener only when the host activates it. The pipeline runs at most once: later activations
 * return the listener or the error of the first one.
 */

class DeferredListener
{
    class Impl;

public:
    DeferredListener( std::shared_ptr< void > service, std::string contractName,
            std::shared_ptr< BindingPolicy const > binding, CredentialSource credential, ListenerOptions options );
    DeferredListener( DeferredListener&& other ) noexcept;
    ~DeferredListener();

    DeferredListener& operator=( DeferredListener&& other ) noexcept;

    std::string const& contractName() const;
    ListenerState state() const;

    Result< std::shared_ptr< QueuedListener > > activate( ActivationContext const* context );

private:
    std::unique_ptr< Impl > impl_;
};

namespace detail {

Result< DeferredListener > createQueuedListener(
        std::shared_ptr< void > service, std::string contractName, std::shared_ptr< BindingPolicy const > binding,
        CredentialSource credential, ListenerOptions options );

} // namespace detail

} // namespace sbql

#endif // SB_QUEUED_LISTENER_DEFERRED_LISTENER_HPP
