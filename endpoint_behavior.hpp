#ifndef SB_QUEUED_LISTENER_ENDPOINT_BEHAVIOR_HPP
#define SB_QUEUED_LISTENER_ENDPOINT_BEHAVIOR_HPP

#include <memory>
#include <string>
#include <vector>

#include "error.hpp"

namespace sbql {

class ServiceEndpoint;
class TokenProvider;

/**
 * class EndpointBehavior
 *
 * Cross-cutting component attached to a service endpoint, e.g. retry, logging or message inspection. Applied in
 * attachment order when the listener opens.
 */

class EndpointBehavior
{
public:
    virtual ~EndpointBehavior();

    virtual std::string name() const = 0;

    virtual Result< void > apply( ServiceEndpoint const& endpoint ) = 0;
};

using EndpointBehaviors = std::vector< std::shared_ptr< EndpointBehavior > >;


/**
 * class TransportClientBehavior
 */

class TransportClientBehavior
        : public EndpointBehavior
{
public:
    explicit TransportClientBehavior( std::shared_ptr< TokenProvider const > tokenProvider );

    std::string name() const override { return "TransportClientBehavior"; }

    Result< void > apply( ServiceEndpoint const& endpoint ) override;

    std::shared_ptr< TokenProvider const > const& tokenProvider() const { return tokenProvider_; }

    // audience of the endpoint this behavior was applied to, empty before
    std::string const& audience() const { return audience_; }

    // only meaningful once apply() succeeded
    std::string token() const;

private:
    std::shared_ptr< TokenProvider const > tokenProvider_;
    std::string audience_;
};

} // namespace sbql

#endif // SB_QUEUED_LISTENER_ENDPOINT_BEHAVIOR_HPP
