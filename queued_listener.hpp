#ifndef SB_QUEUED_LISTENER_QUEUED_LISTENER_HPP
#define SB_QUEUED_LISTENER_QUEUED_LISTENER_HPP

#include <memory>
#include <string>

#include "contract.hpp"
#include "error.hpp"
#include "service_endpoint.hpp"

namespace sbql {

class ActivationContext;

/**
 * class CommunicationListener
 *
 * What the hosting runtime opens and closes over the lifetime of a service instance.
 */

class CommunicationListener
{
public:
    virtual ~CommunicationListener();

    // returns the address the listener is published under
    virtual Result< std::string > open() = 0;
    virtual Result< void > close() = 0;
    virtual void abort() = 0;
};


/**
 * class QueuedListener
 *
 * Transport listener receiving the requests for a service object from a queue. Owns the service endpoint.
 */

class QueuedListener
        : public CommunicationListener
{
public:
    QueuedListener( std::shared_ptr< void > service, ActivationContext const* context, ServiceEndpoint endpoint );

    ServiceEndpoint& endpoint() { return endpoint_; }
    ServiceEndpoint const& endpoint() const { return endpoint_; }

    ActivationContext const* context() const { return context_; }

    bool isOpen() const { return open_; }

    template< typename Contract >
    std::shared_ptr< Contract > service() const
    {
        if ( contractName< Contract >() != endpoint_.contractName()) {
            return nullptr;
        }
        return std::static_pointer_cast< Contract >( service_ );
    }

    /**
     * Applies the endpoint behaviors in order and starts listening. Fails with sbql_errc::already_open when
     * called twice without close(), or with the error of the first behavior that couldn't be applied.
     */
    Result< std::string > open() override;
    Result< void > close() override;
    void abort() override;

private:
    std::shared_ptr< void > service_;
    ActivationContext const* context_;
    ServiceEndpoint endpoint_;
    bool open_ {};
};

} // namespace sbql

#endif // SB_QUEUED_LISTENER_QUEUED_LISTENER_HPP
