#ifndef SB_QUEUED_LISTENER_BINDING_POLICY_HPP
#define SB_QUEUED_LISTENER_BINDING_POLICY_HPP

#include <chrono>
#include <cstddef>
#include <iosfwd>

#include <nlohmann/json_fwd.hpp>

namespace sbql {

/**
 * enum class ReceiveMode
 */

enum class ReceiveMode
{
    peekLock,
    receiveAndDelete
};

std::ostream& operator<<( std::ostream& os, ReceiveMode val );


/**
 * class BindingPolicy
 */

class BindingPolicy
{
    friend void from_json( nlohmann::json const& src, BindingPolicy& dst );

    friend std::ostream& operator<<( std::ostream& os, BindingPolicy const& val );

public:
    static constexpr std::size_t defaultMaxMessageSize = 256 * 1024;

    BindingPolicy();

    std::chrono::seconds operationTimeout() const { return operationTimeout_; }
    std::size_t maxMessageSize() const { return maxMessageSize_; }
    unsigned prefetchCount() const { return prefetchCount_; }
    bool sessionful() const { return sessionful_; }
    ReceiveMode receiveMode() const { return receiveMode_; }

    BindingPolicy& operationTimeout( std::chrono::seconds value ) { operationTimeout_ = value; return *this; }
    BindingPolicy& maxMessageSize( std::size_t value ) { maxMessageSize_ = value; return *this; }
    BindingPolicy& prefetchCount( unsigned value ) { prefetchCount_ = value; return *this; }
    BindingPolicy& sessionful( bool value ) { sessionful_ = value; return *this; }
    BindingPolicy& receiveMode( ReceiveMode value ) { receiveMode_ = value; return *this; }

private:
    std::chrono::seconds operationTimeout_ { 60 };
    std::size_t maxMessageSize_ { defaultMaxMessageSize };
    unsigned prefetchCount_ {};
    bool sessionful_ {};
    ReceiveMode receiveMode_ { ReceiveMode::peekLock };
};

} // namespace sbql

#endif // SB_QUEUED_LISTENER_BINDING_POLICY_HPP
