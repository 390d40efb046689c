#ifndef SB_QUEUED_LISTENER_TOKEN_PROVIDER_HPP
#define SB_QUEUED_LISTENER_TOKEN_PROVIDER_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "error.hpp"

namespace sbql {

/**
 * class TokenProvider
 */

class TokenProvider
{
public:
    using Clock = std::chrono::system_clock;

    virtual ~TokenProvider();

    std::string token( std::string const& audience ) const { return token( audience, Clock::now()); }

    virtual std::string token( std::string const& audience, Clock::time_point now ) const = 0;
};


/**
 * class SharedAccessSignatureTokenProvider
 *
 * Issues tokens of the form
 *
 *     SharedAccessSignature sr=<audience>&sig=<signature>&se=<expiry>&skn=<keyName>
 *
 * where the signature is the base64 encoded HMAC-SHA256 of "<url encoded audience>\n<expiry>" keyed with the
 * shared access key. Alternatively hands out a fixed, pre-issued signature.
 */

class SharedAccessSignatureTokenProvider
        : public TokenProvider
{
public:
    static constexpr std::size_t maxKeyLength = 256;
    static constexpr std::chrono::seconds defaultTokenLifetime { 20 * 60 };

    /**
     * Fails with sbql_errc::invalid_shared_access_key unless both key name and key are non-empty and at most
     * maxKeyLength characters long.
     */
    static Result< std::shared_ptr< SharedAccessSignatureTokenProvider > > create(
            std::string keyName, std::string sharedAccessKey,
            std::chrono::seconds tokenLifetime = defaultTokenLifetime );

    static Result< std::shared_ptr< SharedAccessSignatureTokenProvider > > fromSignature( std::string signature );

    std::string const& keyName() const { return keyName_; }
    std::string const& sharedAccessKey() const { return sharedAccessKey_; }
    std::string const& signature() const { return signature_; }
    std::chrono::seconds tokenLifetime() const { return tokenLifetime_; }

    using TokenProvider::token;
    std::string token( std::string const& audience, Clock::time_point now ) const override;

private:
    SharedAccessSignatureTokenProvider() = default;

    std::string keyName_;
    std::string sharedAccessKey_;
    std::string signature_;
    std::chrono::seconds tokenLifetime_ { defaultTokenLifetime };
};

} // namespace sbql

#endif // SB_QUEUED_LISTENER_TOKEN_PROVIDER_HPP
