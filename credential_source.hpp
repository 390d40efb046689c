#ifndef SB_QUEUED_LISTENER_CREDENTIAL_SOURCE_HPP
#define SB_QUEUED_LISTENER_CREDENTIAL_SOURCE_HPP

#include <string>

#include <boost/variant/variant.hpp>

#include "error.hpp"

namespace sbql {

class ActivationContext;

/**
 * struct LiteralCredential
 */

struct LiteralCredential
{
    std::string connectionString;
};


/**
 * struct ConfiguredCredential
 */

struct ConfiguredCredential
{
    static constexpr char const* defaultPackageName = "Config";
    static constexpr char const* defaultSectionName = "ServiceBus";
    static constexpr char const* defaultParameterName = "ListenConnectionString";

    std::string packageName = defaultPackageName;
    std::string sectionName = defaultSectionName;
    std::string parameterName = defaultParameterName;
};


/**
 * alias CredentialSource
 */

using CredentialSource = boost::variant< ConfiguredCredential, LiteralCredential >;

/**
 * function validateCredential, resolveCredential
 */

Result< void > validateCredential( CredentialSource const& source );

// context may be null for literal credentials
Result< std::string > resolveCredential( CredentialSource const& source, ActivationContext const* context );

} // namespace sbql

#endif // SB_QUEUED_LISTENER_CREDENTIAL_SOURCE_HPP
