#ifndef SB_QUEUED_LISTENER_ERROR_HPP
#define SB_QUEUED_LISTENER_ERROR_HPP

#include <string>
#include <system_error>
#include <type_traits>

#include <boost/outcome/std_result.hpp>

namespace sbql {

/**
 * enum class sbql_errc
 */

enum class sbql_errc : int
{
    // invalid arguments
    null_service_object = 1,
    null_binding_policy,
    null_behavior_list,
    null_behavior,
    null_activation_context,
    empty_connection_string,
    empty_queue_name,
    invalid_shared_access_key,
    already_open,

    // configuration errors
    no_endpoint,
    ambiguous_endpoint,
    malformed_connection_string,
    missing_setting,
    decrypt_failed
};


/**
 * enum class sbql_condition
 */

enum class sbql_condition : int
{
    invalid_argument = 1,
    configuration_error
};


/**
 * function sbql_category, sbql_condition_category
 */

namespace detail {

class sbql_category
        : public std::error_category
{
public:
    char const* name() const noexcept override { return "sbql::sbql_category"; }

    std::string message( int value ) const override;

    std::error_condition default_error_condition( int value ) const noexcept override;
};

class sbql_condition_category
        : public std::error_category
{
public:
    char const* name() const noexcept override { return "sbql::sbql_condition_category"; }

    std::string message( int value ) const override;
};

} // namespace detail

std::error_category const& sbql_category();
std::error_category const& sbql_condition_category();


/**
 * function make_error_code, make_error_condition
 */

std::error_code make_error_code( sbql_errc e );
std::error_condition make_error_condition( sbql_condition e );


/**
 * alias template Result
 */

template< typename T >
using Result = boost::outcome_v2::std_result< T >;

} // namespace sbql


/**
 * namespace std hooks
 */

namespace std {

template<>
struct is_error_code_enum< sbql::sbql_errc >
        : public std::true_type {};

template<>
struct is_error_condition_enum< sbql::sbql_condition >
        : public std::true_type {};

} // namespace std

#endif // SB_QUEUED_LISTENER_ERROR_HPP
