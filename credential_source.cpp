#include <utility>

#include <boost/variant/get.hpp>

#include "activation_context.hpp"
#include "credential_source.hpp"
#include "logging.hpp"

using namespace std;

namespace sbql {

static Logger logger( "credential" );

constexpr char const* ConfiguredCredential::defaultPackageName;
constexpr char const* ConfiguredCredential::defaultSectionName;
constexpr char const* ConfiguredCredential::defaultParameterName;

static string const& orDefault( string const& value, char const* defaultValue, string& storage )
{
    if ( !value.empty()) {
        return value;
    }
    storage = defaultValue;
    return storage;
}

static Result< string > resolveConfigured( ConfiguredCredential const& source, ActivationContext const* context )
{
    if ( !context ) {
        logger.warning( "cannot resolve configured credential without activation context" );
        return make_error_code( sbql_errc::null_activation_context );
    }

    string packageStorage, sectionStorage, parameterStorage;
    auto const& packageName = orDefault( source.packageName, ConfiguredCredential::defaultPackageName, packageStorage );
    auto const& sectionName = orDefault( source.sectionName, ConfiguredCredential::defaultSectionName, sectionStorage );
    auto const& parameterName = orDefault( source.parameterName, ConfiguredCredential::defaultParameterName, parameterStorage );

    logger.debug( "reading ", packageName, "/", sectionName, "/", parameterName, " for ", context->serviceName());

    auto property = context->configurationProperty( packageName, sectionName, parameterName );
    if ( !property ) {
        return property.error();
    }

    if ( !property.value().encrypted ) {
        return move( property.value().value );
    }

    logger.debug( "decrypting ", parameterName );

    auto plaintext = context->decrypt( property.value());
    if ( !plaintext ) {
        logger.warning( "couldn't decrypt ", parameterName, ": ", plaintext.error().message());
        return plaintext.error();
    }
    return plaintext;
}

Result< void > validateCredential( CredentialSource const& source )
{
    if ( auto literal = boost::get< LiteralCredential >( &source )) {
        if ( literal->connectionString.empty()) {
            return make_error_code( sbql_errc::empty_connection_string );
        }
    }
    return boost::outcome_v2::success();
}

Result< string > resolveCredential( CredentialSource const& source, ActivationContext const* context )
{
    if ( auto literal = boost::get< LiteralCredential >( &source )) {
        if ( literal->connectionString.empty()) {
            return make_error_code( sbql_errc::empty_connection_string );
        }
        return literal->connectionString;
    }
    return resolveConfigured( boost::get< ConfiguredCredential >( source ), context );
}

} // namespace sbql
