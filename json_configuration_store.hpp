#ifndef SB_QUEUED_LISTENER_JSON_CONFIGURATION_STORE_HPP
#define SB_QUEUED_LISTENER_JSON_CONFIGURATION_STORE_HPP

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "activation_context.hpp"

namespace sbql {

/**
 * class JsonConfigurationStore
 *
 * ActivationContext over a JSON document laid out as
 *
 *     { "<package>": { "<section>": { "<parameter>": { "value": "...", "encrypted": true } } } }
 *
 * A parameter given as a plain string is taken as an unencrypted value. Encrypted values are handed to the
 * Decryptor, which stands in for the host's protection mechanism.
 */

class JsonConfigurationStore
        : public ActivationContext
{
public:
    using Decryptor = std::function< Result< std::string > ( std::string const& cipherText ) >;

    JsonConfigurationStore( std::string serviceName, nlohmann::json settings, Decryptor decryptor = nullptr );

    std::string serviceName() const override { return serviceName_; }

    Result< ConfigurationProperty > configurationProperty(
            std::string const& packageName, std::string const& sectionName,
            std::string const& parameterName ) const override;

    Result< std::string > decrypt( ConfigurationProperty const& property ) const override;

private:
    std::string serviceName_;
    nlohmann::json settings_;
    Decryptor decryptor_;
};

} // namespace sbql

#endif // SB_QUEUED_LISTENER_JSON_CONFIGURATION_STORE_HPP
