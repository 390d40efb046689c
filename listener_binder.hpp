#ifndef SB_QUEUED_LISTENER_LISTENER_BINDER_HPP
#define SB_QUEUED_LISTENER_LISTENER_BINDER_HPP

#include <chrono>
#include <memory>
#include <string>

#include "binding_policy.hpp"
#include "endpoint_behavior.hpp"
#include "error.hpp"
#include "queue_address.hpp"
#include "queued_listener.hpp"
#include "token_provider.hpp"

namespace sbql {

class ActivationContext;
class ConnectionDescriptor;

/**
 * struct BindRequest
 */

struct BindRequest
{
    std::shared_ptr< void > service;
    std::string contractName;
    ActivationContext const* context {};
    std::shared_ptr< BindingPolicy const > binding;
    std::shared_ptr< EndpointBehaviors const > behaviors;
    std::chrono::seconds tokenLifetime = SharedAccessSignatureTokenProvider::defaultTokenLifetime;
};

/**
 * Constructs the transport listener for the queue address and attaches the authentication behavior derived from
 * the connection string, followed by the caller's behaviors in their original order. The activation context is
 * required whatever the credential source.
 */
Result< std::shared_ptr< QueuedListener > > bindListener(
        BindRequest const& request, QueueAddress const& address, ConnectionDescriptor const& descriptor );

} // namespace sbql

#endif // SB_QUEUED_LISTENER_LISTENER_BINDER_HPP
