#ifndef SB_QUEUED_LISTENER_CONNECTION_STRING_HPP
#define SB_QUEUED_LISTENER_CONNECTION_STRING_HPP

#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>
#include <experimental/optional>

#include "error.hpp"

namespace sbql {

/**
 * class EndpointUri
 */

class EndpointUri
{
    friend std::ostream& operator<<( std::ostream& os, EndpointUri const& val );

public:
    static Result< EndpointUri > parse( std::string const& text );

    std::string const& scheme() const { return scheme_; }
    std::string const& host() const { return host_; }
    std::experimental::optional< unsigned > port() const { return port_; }
    std::string const& path() const { return path_; }

    // leftmost label of the host, i.e. the messaging namespace
    std::string namespaceName() const;

    std::string str() const;

private:
    std::string scheme_;
    std::string host_;
    std::experimental::optional< unsigned > port_;
    std::string path_;
};


/**
 * class ConnectionDescriptor
 */

class ConnectionDescriptor
{
    friend std::ostream& operator<<( std::ostream& os, ConnectionDescriptor const& val );

public:
    static Result< ConnectionDescriptor > parse( std::string const& text );

    std::vector< EndpointUri > const& endpoints() const { return endpoints_; }

    // no_endpoint or ambiguous_endpoint unless there is exactly one
    Result< EndpointUri > singleEndpoint() const;

    std::string const& stsEndpoint() const { return stsEndpoint_; }
    std::experimental::optional< unsigned > runtimePort() const { return runtimePort_; }
    std::experimental::optional< unsigned > managementPort() const { return managementPort_; }
    std::string const& sharedAccessKeyName() const { return sharedAccessKeyName_; }
    std::string const& sharedAccessKey() const { return sharedAccessKey_; }
    std::string const& sharedAccessSignature() const { return sharedAccessSignature_; }
    std::string const& entityPath() const { return entityPath_; }
    std::string const& transportType() const { return transportType_; }
    std::experimental::optional< std::chrono::seconds > operationTimeout() const { return operationTimeout_; }

private:
    std::vector< EndpointUri > endpoints_;
    std::string stsEndpoint_;
    std::experimental::optional< unsigned > runtimePort_;
    std::experimental::optional< unsigned > managementPort_;
    std::string sharedAccessKeyName_;
    std::string sharedAccessKey_;
    std::string sharedAccessSignature_;
    std::string entityPath_;
    std::string transportType_;
    std::experimental::optional< std::chrono::seconds > operationTimeout_;
};

} // namespace sbql

#endif // SB_QUEUED_LISTENER_CONNECTION_STRING_HPP
