#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "error.hpp"
#include "token_provider.hpp"

using namespace std;
using namespace sbql;

namespace {

TokenProvider::Clock::time_point const Now { chrono::seconds( 1600000000 ) };

} // namespace

TEST( TokenProviderTest, IssuesSharedAccessSignature )
{
    auto provider = SharedAccessSignatureTokenProvider::create( "K", "S" );
    ASSERT_TRUE( provider );
    EXPECT_EQ( provider.value()->keyName(), "K" );
    EXPECT_EQ( provider.value()->sharedAccessKey(), "S" );
    EXPECT_EQ( provider.value()->tokenLifetime(), chrono::minutes( 20 ));

    auto token = provider.value()->token( "sb://foo.servicebus.windows.net/IMyContract/", Now );
    EXPECT_EQ( token,
            "SharedAccessSignature "
            "sr=sb%3A%2F%2Ffoo.servicebus.windows.net%2FIMyContract%2F"
            "&sig=nySR5VnWkJb6busOkTRqU%2FEdn1fv2kUNauBl582lh1E%3D"
            "&se=1600001200"
            "&skn=K" );
}

TEST( TokenProviderTest, ExpiryFollowsTokenLifetime )
{
    auto provider = SharedAccessSignatureTokenProvider::create( "K", "S", chrono::seconds( 60 ));
    ASSERT_TRUE( provider );

    auto token = provider.value()->token( "sb://foo.servicebus.windows.net/q/", Now );
    EXPECT_NE( token.find( "&se=1600000060&" ), string::npos ) << token;
}

TEST( TokenProviderTest, RejectsInvalidKeys )
{
    string const tooLong( SharedAccessSignatureTokenProvider::maxKeyLength + 1, 'x' );

    for ( auto const& key : {
            make_pair( string {}, string { "S" } ),
            make_pair( string { "K" }, string {} ),
            make_pair( tooLong, string { "S" } ),
            make_pair( string { "K" }, tooLong ) } ) {
        auto provider = SharedAccessSignatureTokenProvider::create( key.first, key.second );
        ASSERT_FALSE( provider );
        EXPECT_EQ( provider.error(), sbql_errc::invalid_shared_access_key );
    }

    string const longest( SharedAccessSignatureTokenProvider::maxKeyLength, 'x' );
    EXPECT_TRUE( SharedAccessSignatureTokenProvider::create( longest, longest ));
}

TEST( TokenProviderTest, PreIssuedSignatureIsReturnedAsIs )
{
    auto provider = SharedAccessSignatureTokenProvider::fromSignature( "SharedAccessSignature sr=x&sig=y&se=1&skn=z" );
    ASSERT_TRUE( provider );
    EXPECT_EQ( provider.value()->token( "sb://anything/", Now ), "SharedAccessSignature sr=x&sig=y&se=1&skn=z" );

    EXPECT_FALSE( SharedAccessSignatureTokenProvider::fromSignature( "" ));
}
