#include <ostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "binding_policy.hpp"

using namespace std;
using namespace nlohmann;

namespace sbql {

constexpr size_t BindingPolicy::defaultMaxMessageSize;

ostream& operator<<( ostream& os, ReceiveMode val )
{
    switch ( val ) {
        case ReceiveMode::peekLock: return os << "peekLock";
        case ReceiveMode::receiveAndDelete: return os << "receiveAndDelete";
    }
    return os << "unknown";
}

BindingPolicy::BindingPolicy() = default;

void from_json( json const& src, BindingPolicy& dst )
{
    if ( src.count( "operationTimeout" ) > 0 ) {
        dst.operationTimeout_ = chrono::seconds( src.at( "operationTimeout" ).get< unsigned >());
    }
    if ( src.count( "maxMessageSize" ) > 0 ) {
        dst.maxMessageSize_ = src.at( "maxMessageSize" );
    }
    if ( src.count( "prefetchCount" ) > 0 ) {
        dst.prefetchCount_ = src.at( "prefetchCount" );
    }
    if ( src.count( "sessionful" ) > 0 ) {
        dst.sessionful_ = src.at( "sessionful" );
    }
    if ( src.count( "receiveMode" ) > 0 ) {
        auto const mode = src.at( "receiveMode" ).get< string >();
        if ( mode == "peekLock" ) {
            dst.receiveMode_ = ReceiveMode::peekLock;
        } else if ( mode == "receiveAndDelete" ) {
            dst.receiveMode_ = ReceiveMode::receiveAndDelete;
        } else {
            throw invalid_argument( "unknown receiveMode \"" + mode + "\"" );
        }
    }
}

ostream& operator<<( ostream& os, BindingPolicy const& val )
{
    return os << "[timeout=" << val.operationTimeout_.count() << "s, maxMessageSize=" << val.maxMessageSize_
              << ", prefetch=" << val.prefetchCount_ << ", sessionful=" << boolalpha << val.sessionful_
              << noboolalpha << ", mode=" << val.receiveMode_ << "]";
}

} // namespace sbql
