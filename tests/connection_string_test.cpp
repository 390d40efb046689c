#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "connection_string.hpp"
#include "error.hpp"

using namespace std;
using namespace sbql;

TEST( ConnectionStringTest, ParsesListenConnectionString )
{
    auto descriptor = ConnectionDescriptor::parse(
            "Endpoint=sb://foo.servicebus.windows.net/;SharedAccessKeyName=listen;SharedAccessKey=abc+def/ghi==" );
    ASSERT_TRUE( descriptor );

    ASSERT_EQ( descriptor.value().endpoints().size(), 1u );
    auto const& endpoint = descriptor.value().endpoints().front();
    EXPECT_EQ( endpoint.scheme(), "sb" );
    EXPECT_EQ( endpoint.host(), "foo.servicebus.windows.net" );
    EXPECT_FALSE( endpoint.port());
    EXPECT_EQ( endpoint.path(), "/" );
    EXPECT_EQ( endpoint.namespaceName(), "foo" );
    EXPECT_EQ( descriptor.value().sharedAccessKeyName(), "listen" );
    EXPECT_EQ( descriptor.value().sharedAccessKey(), "abc+def/ghi==" );
}

TEST( ConnectionStringTest, KeysAreCaseInsensitiveAndTrimmed )
{
    auto descriptor = ConnectionDescriptor::parse(
            " endpoint = sb://ns.example.net ; SHAREDACCESSKEYNAME=K ;sharedaccesskey= S ;;" );
    ASSERT_TRUE( descriptor );
    ASSERT_EQ( descriptor.value().endpoints().size(), 1u );
    EXPECT_EQ( descriptor.value().endpoints().front().host(), "ns.example.net" );
    EXPECT_EQ( descriptor.value().sharedAccessKeyName(), "K" );
    EXPECT_EQ( descriptor.value().sharedAccessKey(), "S" );
}

TEST( ConnectionStringTest, ParsesOptionalEntries )
{
    auto descriptor = ConnectionDescriptor::parse(
            "Endpoint=sb://ns.example.net:9354/path;StsEndpoint=https://sts.example.net/;RuntimePort=9354;"
            "ManagementPort=9355;EntityPath=orders;TransportType=NetMessaging;OperationTimeout=00:01:30" );
    ASSERT_TRUE( descriptor );

    auto const& endpoint = descriptor.value().endpoints().front();
    ASSERT_TRUE( endpoint.port());
    EXPECT_EQ( *endpoint.port(), 9354u );
    EXPECT_EQ( endpoint.path(), "/path" );
    EXPECT_EQ( endpoint.str(), "sb://ns.example.net:9354/path" );

    EXPECT_EQ( descriptor.value().stsEndpoint(), "https://sts.example.net/" );
    ASSERT_TRUE( descriptor.value().runtimePort());
    EXPECT_EQ( *descriptor.value().runtimePort(), 9354u );
    ASSERT_TRUE( descriptor.value().managementPort());
    EXPECT_EQ( *descriptor.value().managementPort(), 9355u );
    EXPECT_EQ( descriptor.value().entityPath(), "orders" );
    EXPECT_EQ( descriptor.value().transportType(), "NetMessaging" );
    ASSERT_TRUE( descriptor.value().operationTimeout());
    EXPECT_EQ( descriptor.value().operationTimeout()->count(), 90 );
}

TEST( ConnectionStringTest, CollectsAllEndpoints )
{
    auto descriptor = ConnectionDescriptor::parse(
            "Endpoint=sb://a.example.net/,sb://b.example.net/;SharedAccessKeyName=K;SharedAccessKey=S" );
    ASSERT_TRUE( descriptor );
    ASSERT_EQ( descriptor.value().endpoints().size(), 2u );
    EXPECT_EQ( descriptor.value().endpoints()[ 0 ].host(), "a.example.net" );
    EXPECT_EQ( descriptor.value().endpoints()[ 1 ].host(), "b.example.net" );
}

TEST( ConnectionStringTest, SingleEndpointRequiresExactlyOne )
{
    auto none = ConnectionDescriptor::parse( "SharedAccessKeyName=K;SharedAccessKey=S" );
    ASSERT_TRUE( none );
    auto noneEndpoint = none.value().singleEndpoint();
    ASSERT_FALSE( noneEndpoint );
    EXPECT_EQ( noneEndpoint.error(), sbql_errc::no_endpoint );
    EXPECT_EQ( noneEndpoint.error(), sbql_condition::configuration_error );

    auto two = ConnectionDescriptor::parse( "Endpoint=sb://a.example.net/,sb://b.example.net/" );
    ASSERT_TRUE( two );
    auto twoEndpoint = two.value().singleEndpoint();
    ASSERT_FALSE( twoEndpoint );
    EXPECT_EQ( twoEndpoint.error(), sbql_errc::ambiguous_endpoint );
    EXPECT_EQ( twoEndpoint.error(), sbql_condition::configuration_error );

    auto one = ConnectionDescriptor::parse( "Endpoint=sb://a.example.net/" );
    ASSERT_TRUE( one );
    auto oneEndpoint = one.value().singleEndpoint();
    ASSERT_TRUE( oneEndpoint );
    EXPECT_EQ( oneEndpoint.value().host(), "a.example.net" );
}

TEST( ConnectionStringTest, RejectsMalformedInput )
{
    for ( auto const& text : {
            "Endpoint",
            "Endpoint=foo.example.net",
            "Endpoint=://foo.example.net/",
            "Endpoint=sb:///path",
            "Endpoint=sb://foo.example.net:http/",
            "Endpoint=sb://foo.example.net:70000/",
            "Endpoint=sb://foo.example.net/;Bogus=1",
            "=value",
            "Endpoint=sb://foo.example.net/;RuntimePort=abc",
            "Endpoint=sb://foo.example.net/;OperationTimeout=90",
            "Endpoint=sb://foo.example.net/;OperationTimeout=99999999999999999999:00:00",
            "Endpoint=sb://foo.example.net/;OperationTimeout=9000000000000000:00:00",
            "Endpoint=sb://foo.example.net/;OperationTimeout=00:60:00" } ) {
        auto descriptor = ConnectionDescriptor::parse( text );
        ASSERT_FALSE( descriptor ) << text;
        EXPECT_EQ( descriptor.error(), sbql_errc::malformed_connection_string ) << text;
    }
}

TEST( ConnectionStringTest, AcceptsLongestOperationTimeout )
{
    auto descriptor = ConnectionDescriptor::parse( "Endpoint=sb://foo.example.net/;OperationTimeout=999999999:59:59" );
    ASSERT_TRUE( descriptor );
    ASSERT_TRUE( descriptor.value().operationTimeout());
    EXPECT_EQ( descriptor.value().operationTimeout()->count(), 3599999999999 );
}

TEST( ConnectionStringTest, StreamingMasksSecrets )
{
    auto descriptor = ConnectionDescriptor::parse(
            "Endpoint=sb://foo.example.net/;SharedAccessKeyName=K;SharedAccessKey=topsecret" );
    ASSERT_TRUE( descriptor );

    ostringstream os;
    os << descriptor.value();
    EXPECT_EQ( os.str(), "Endpoint=sb://foo.example.net/;SharedAccessKeyName=K;SharedAccessKey=***" );
    EXPECT_EQ( os.str().find( "topsecret" ), string::npos );
}
