#ifndef SB_QUEUED_LISTENER_ACTIVATION_CONTEXT_HPP
#define SB_QUEUED_LISTENER_ACTIVATION_CONTEXT_HPP

#include <string>

#include "error.hpp"

namespace sbql {

/**
 * struct ConfigurationProperty
 */

struct ConfigurationProperty
{
    std::string name;
    std::string value;
    bool encrypted {};
};


/**
 * class ActivationContext
 */

class ActivationContext
{
public:
    virtual ~ActivationContext();

    virtual std::string serviceName() const = 0;

    /**
     * Looks up a parameter in a section of a configuration package. Fails with sbql_errc::missing_setting if
     * the package, the section or the parameter doesn't exist.
     */
    virtual Result< ConfigurationProperty > configurationProperty(
            std::string const& packageName, std::string const& sectionName,
            std::string const& parameterName ) const = 0;

    virtual Result< std::string > decrypt( ConfigurationProperty const& property ) const = 0;
};

} // namespace sbql

#endif // SB_QUEUED_LISTENER_ACTIVATION_CONTEXT_HPP
