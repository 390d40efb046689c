#ifndef SB_QUEUED_LISTENER_CONTRACT_HPP
#define SB_QUEUED_LISTENER_CONTRACT_HPP

#include <string>

namespace sbql {

/**
 * struct ContractTraits
 *
 * Identifies a service contract. By default the contract type names itself through a
 * `static constexpr char const* name` member; specialize for contracts that can't carry one.
 */

template< typename Contract >
struct ContractTraits
{
    static std::string name() { return Contract::name; }
};

template< typename Contract >
std::string contractName()
{
    return ContractTraits< Contract >::name();
}

} // namespace sbql

#endif // SB_QUEUED_LISTENER_CONTRACT_HPP
