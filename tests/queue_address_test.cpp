#include <string>

#include <gtest/gtest.h>

#include "connection_string.hpp"
#include "error.hpp"
#include "queue_address.hpp"

using namespace std;
using namespace sbql;

namespace {

ConnectionDescriptor parse( string const& text )
{
    return ConnectionDescriptor::parse( text ).value();
}

} // namespace

TEST( QueueAddressTest, DerivesNamespaceFromLeftmostHostLabel )
{
    auto address = deriveQueueAddress(
            parse( "Endpoint=sb://foo.bar.net/;SharedAccessKeyName=K;SharedAccessKey=S" ), "IMyContract" );
    ASSERT_TRUE( address );
    EXPECT_EQ( address.value().scheme(), "sb" );
    EXPECT_EQ( address.value().namespaceName(), "foo" );
    EXPECT_EQ( address.value().queueName(), "IMyContract" );
    EXPECT_EQ( address.value().host(), "foo.servicebus.windows.net" );
    EXPECT_EQ( address.value().str(), "sb://foo.servicebus.windows.net/IMyContract/" );
}

TEST( QueueAddressTest, KeepsQueueNameVerbatim )
{
    auto address = deriveQueueAddress( parse( "Endpoint=sb://foo.bar.net/" ), "Custom-Queue" );
    ASSERT_TRUE( address );
    EXPECT_EQ( address.value().queueName(), "Custom-Queue" );
    EXPECT_EQ( address.value().str(), "sb://foo.servicebus.windows.net/Custom-Queue/" );
}

TEST( QueueAddressTest, EscapesQueueNameInUri )
{
    auto address = deriveQueueAddress( parse( "Endpoint=sb://foo.bar.net/" ), "my queue#1" );
    ASSERT_TRUE( address );
    EXPECT_EQ( address.value().queueName(), "my queue#1" );
    EXPECT_EQ( address.value().str(), "sb://foo.servicebus.windows.net/my%20queue%231/" );
}

TEST( QueueAddressTest, HostWithoutDotIsTheNamespace )
{
    auto address = deriveQueueAddress( parse( "Endpoint=sb://localhost:5671/" ), "q" );
    ASSERT_TRUE( address );
    EXPECT_EQ( address.value().namespaceName(), "localhost" );
}

TEST( QueueAddressTest, HonoursAddressConvention )
{
    AddressConvention convention;
    convention.scheme = "amqps";
    convention.hostSuffix = "servicebus.chinacloudapi.cn";

    auto address = deriveQueueAddress( parse( "Endpoint=sb://foo.bar.net/" ), "orders", convention );
    ASSERT_TRUE( address );
    EXPECT_EQ( address.value().str(), "amqps://foo.servicebus.chinacloudapi.cn/orders/" );
}

TEST( QueueAddressTest, FailsWithoutSingleEndpoint )
{
    auto none = deriveQueueAddress( parse( "SharedAccessKeyName=K;SharedAccessKey=S" ), "q" );
    ASSERT_FALSE( none );
    EXPECT_EQ( none.error(), sbql_errc::no_endpoint );
    EXPECT_EQ( none.error().message(), "no endpoint detected in connection string" );

    auto two = deriveQueueAddress( parse( "Endpoint=sb://a.bar.net/,sb://b.bar.net/" ), "q" );
    ASSERT_FALSE( two );
    EXPECT_EQ( two.error(), sbql_errc::ambiguous_endpoint );
    EXPECT_EQ( two.error().message(), "more than one endpoint detected in connection string" );
}

TEST( QueueAddressTest, RejectsEmptyNames )
{
    auto emptyQueue = deriveQueueAddress( parse( "Endpoint=sb://foo.bar.net/" ), "" );
    ASSERT_FALSE( emptyQueue );
    EXPECT_EQ( emptyQueue.error(), sbql_errc::empty_queue_name );
    EXPECT_EQ( emptyQueue.error(), sbql_condition::invalid_argument );

    auto emptyNamespace = deriveQueueAddress( parse( "Endpoint=sb://.bar.net/" ), "q" );
    ASSERT_FALSE( emptyNamespace );
    EXPECT_EQ( emptyNamespace.error(), sbql_errc::malformed_connection_string );
}

TEST( QueueAddressTest, ComparesAllComponents )
{
    auto a = QueueAddress::create( "foo", "q" ).value();
    auto b = QueueAddress::create( "foo", "q" ).value();
    auto c = QueueAddress::create( "foo", "Q" ).value();
    EXPECT_EQ( a, b );
    EXPECT_NE( a, c );
}
