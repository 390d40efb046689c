#ifndef SB_QUEUED_LISTENER_SERVICE_ENDPOINT_HPP
#define SB_QUEUED_LISTENER_SERVICE_ENDPOINT_HPP

#include <iosfwd>
#include <memory>
#include <string>

#include "binding_policy.hpp"
#include "endpoint_behavior.hpp"
#include "queue_address.hpp"

namespace sbql {

/**
 * class ServiceEndpoint
 */

class ServiceEndpoint
{
    friend std::ostream& operator<<( std::ostream& os, ServiceEndpoint const& val );

public:
    ServiceEndpoint( std::string contractName, QueueAddress address, std::shared_ptr< BindingPolicy const > binding );

    std::string const& contractName() const { return contractName_; }
    QueueAddress const& address() const { return address_; }
    BindingPolicy const& binding() const { return *binding_; }
    EndpointBehaviors const& behaviors() const { return behaviors_; }

    void addBehavior( std::shared_ptr< EndpointBehavior > behavior );

    template< typename Behavior >
    Behavior* findBehavior() const
    {
        for ( auto const& behavior : behaviors_ ) {
            if ( auto result = dynamic_cast< Behavior* >( behavior.get())) {
                return result;
            }
        }
        return nullptr;
    }

private:
    std::string contractName_;
    QueueAddress address_;
    std::shared_ptr< BindingPolicy const > binding_;
    EndpointBehaviors behaviors_;
};

} // namespace sbql

#endif // SB_QUEUED_LISTENER_SERVICE_ENDPOINT_HPP
