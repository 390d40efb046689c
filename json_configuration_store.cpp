#include <utility>

#include <nlohmann/json.hpp>

#include "json_configuration_store.hpp"
#include "logging.hpp"

using namespace std;
using namespace nlohmann;

namespace sbql {

static Logger logger( "config_store" );

JsonConfigurationStore::JsonConfigurationStore( string serviceName, json settings, Decryptor decryptor )
        : serviceName_ { move( serviceName ) }
        , settings_( move( settings ))
        , decryptor_ { std::move( decryptor ) }
{}

Result< ConfigurationProperty > JsonConfigurationStore::configurationProperty(
        string const& packageName, string const& sectionName, string const& parameterName ) const
{
    auto package = settings_.find( packageName );
    if ( package == settings_.end() || !package->is_object()) {
        logger.warning( "configuration package ", packageName, " not found for ", serviceName_ );
        return make_error_code( sbql_errc::missing_setting );
    }

    auto section = package->find( sectionName );
    if ( section == package->end() || !section->is_object()) {
        logger.warning( "section ", sectionName, " not found in configuration package ", packageName );
        return make_error_code( sbql_errc::missing_setting );
    }

    auto parameter = section->find( parameterName );
    if ( parameter == section->end()) {
        logger.warning( "parameter ", parameterName, " not found in section ", sectionName );
        return make_error_code( sbql_errc::missing_setting );
    }

    ConfigurationProperty result { parameterName };
    if ( parameter->is_string()) {
        result.value = parameter->get< string >();
    } else if ( parameter->is_object() && parameter->count( "value" ) > 0 && parameter->at( "value" ).is_string()) {
        result.value = parameter->at( "value" ).get< string >();
        result.encrypted = parameter->value( "encrypted", false );
    } else {
        logger.warning( "parameter ", parameterName, " in section ", sectionName, " has no string value" );
        return make_error_code( sbql_errc::missing_setting );
    }
    return result;
}

Result< string > JsonConfigurationStore::decrypt( ConfigurationProperty const& property ) const
{
    if ( !property.encrypted ) {
        return property.value;
    }
    if ( !decryptor_ ) {
        logger.error( "no decryptor available for encrypted parameter ", property.name );
        return make_error_code( sbql_errc::decrypt_failed );
    }
    return decryptor_( property.value );
}

} // namespace sbql
