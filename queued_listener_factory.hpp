#ifndef SB_QUEUED_LISTENER_QUEUED_LISTENER_FACTORY_HPP
#define SB_QUEUED_LISTENER_QUEUED_LISTENER_FACTORY_HPP

#include <memory>
#include <utility>

#include "binding_policy.hpp"
#include "contract.hpp"
#include "credential_source.hpp"
#include "deferred_listener.hpp"
#include "error.hpp"

namespace sbql {

/**
 * Creates a listener that receives the requests for `service` from a queue instead of a socket.
 *
 * Only the arguments are checked here: a null service object or binding policy, a null behavior list and an
 * empty literal connection string are reported right away. Reading the credential, deriving the queue address
 * and binding the listener happen in DeferredListener::activate(), so configuration errors surface only when
 * the host opens the listener.
 *
 * The queue is named after the contract, see ContractTraits, unless options.queueNameProvider is set. Without
 * an explicit credential the connection string is read from "Config" / "ServiceBus" / "ListenConnectionString".
 */

template< typename Contract >
Result< DeferredListener > createQueuedListener(
        std::shared_ptr< Contract > service,
        std::shared_ptr< BindingPolicy const > binding,
        CredentialSource credential = ConfiguredCredential {},
        ListenerOptions options = {} )
{
    return detail::createQueuedListener(
            std::move( service ), contractName< Contract >(), std::move( binding ), std::move( credential ),
            std::move( options ));
}

} // namespace sbql

#endif // SB_QUEUED_LISTENER_QUEUED_LISTENER_FACTORY_HPP
