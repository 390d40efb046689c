#ifndef SB_QUEUED_LISTENER_QUEUE_ADDRESS_HPP
#define SB_QUEUED_LISTENER_QUEUE_ADDRESS_HPP

#include <iosfwd>
#include <string>

#include "error.hpp"

namespace sbql {

class ConnectionDescriptor;

/**
 * struct AddressConvention
 */

struct AddressConvention
{
    static constexpr char const* defaultScheme = "sb";
    static constexpr char const* defaultHostSuffix = "servicebus.windows.net";

    std::string scheme = defaultScheme;
    std::string hostSuffix = defaultHostSuffix;
};


/**
 * class QueueAddress
 */

class QueueAddress
{
    friend std::ostream& operator<<( std::ostream& os, QueueAddress const& val );

public:
    // queue name is kept verbatim, str() escapes it
    static Result< QueueAddress > create(
            std::string namespaceName, std::string queueName, AddressConvention const& convention = {} );

    std::string const& scheme() const { return scheme_; }
    std::string const& namespaceName() const { return namespaceName_; }
    std::string const& hostSuffix() const { return hostSuffix_; }
    std::string const& queueName() const { return queueName_; }

    std::string host() const;
    std::string str() const;

private:
    QueueAddress() = default;

    std::string scheme_;
    std::string namespaceName_;
    std::string hostSuffix_;
    std::string queueName_;
};

bool operator==( QueueAddress const& lhs, QueueAddress const& rhs );
bool operator!=( QueueAddress const& lhs, QueueAddress const& rhs );


/**
 * function deriveQueueAddress
 */

Result< QueueAddress > deriveQueueAddress(
        ConnectionDescriptor const& descriptor, std::string const& queueName,
        AddressConvention const& convention = {} );

} // namespace sbql

#endif // SB_QUEUED_LISTENER_QUEUE_ADDRESS_HPP
