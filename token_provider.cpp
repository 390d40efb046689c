#include <stdexcept>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "logging.hpp"
#include "string.hpp"
#include "token_provider.hpp"

using namespace std;

namespace sbql {

static Logger logger( "token_provider" );

static string base64( unsigned char const* data, size_t length )
{
    vector< unsigned char > encoded( 4 * ( ( length + 2 ) / 3 ) + 1 );
    auto size = EVP_EncodeBlock( encoded.data(), data, static_cast< int >( length ));
    return { reinterpret_cast< char const* >( encoded.data()), static_cast< size_t >( size ) };
}

static string hmacSha256( string const& key, string const& data )
{
    unsigned char digest[ EVP_MAX_MD_SIZE ];
    unsigned int digestLength {};
    if ( !HMAC( EVP_sha256(), key.data(), static_cast< int >( key.length()),
            reinterpret_cast< unsigned char const* >( data.data()), data.length(), digest, &digestLength )) {
        throw runtime_error( "couldn't compute HMAC-SHA256 for shared access signature" );
    }
    return base64( digest, digestLength );
}


/**
 * class TokenProvider
 */

TokenProvider::~TokenProvider() = default;


/**
 * class SharedAccessSignatureTokenProvider
 */

constexpr size_t SharedAccessSignatureTokenProvider::maxKeyLength;
constexpr chrono::seconds SharedAccessSignatureTokenProvider::defaultTokenLifetime;

Result< shared_ptr< SharedAccessSignatureTokenProvider > > SharedAccessSignatureTokenProvider::create(
        string keyName, string sharedAccessKey, chrono::seconds tokenLifetime )
{
    if ( keyName.empty() || keyName.length() > maxKeyLength ) {
        logger.warning( "shared access key name must have 1 to ", maxKeyLength, " characters" );
        return make_error_code( sbql_errc::invalid_shared_access_key );
    }
    if ( sharedAccessKey.empty() || sharedAccessKey.length() > maxKeyLength ) {
        logger.warning( "shared access key for ", keyName, " must have 1 to ", maxKeyLength, " characters" );
        return make_error_code( sbql_errc::invalid_shared_access_key );
    }

    shared_ptr< SharedAccessSignatureTokenProvider > result { new SharedAccessSignatureTokenProvider };
    result->keyName_ = move( keyName );
    result->sharedAccessKey_ = move( sharedAccessKey );
    result->tokenLifetime_ = tokenLifetime;
    return result;
}

Result< shared_ptr< SharedAccessSignatureTokenProvider > > SharedAccessSignatureTokenProvider::fromSignature(
        string signature )
{
    if ( signature.empty()) {
        return make_error_code( sbql_errc::invalid_shared_access_key );
    }

    shared_ptr< SharedAccessSignatureTokenProvider > result { new SharedAccessSignatureTokenProvider };
    result->signature_ = move( signature );
    return result;
}

string SharedAccessSignatureTokenProvider::token( string const& audience, Clock::time_point now ) const
{
    if ( !signature_.empty()) {
        return signature_;
    }

    auto expiry = chrono::duration_cast< chrono::seconds >( ( now + tokenLifetime_ ).time_since_epoch()).count();
    auto resource = urlEncode( audience );
    auto signature = hmacSha256( sharedAccessKey_, str( resource, "\n", expiry ));

    logger.debug( "issuing token for ", audience, " with key ", keyName_, " expiring at ", expiry );

    return str( "SharedAccessSignature sr=", resource, "&sig=", urlEncode( signature ), "&se=", expiry,
            "&skn=", keyName_ );
}

} // namespace sbql
