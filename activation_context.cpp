#include "activation_context.hpp"

namespace sbql {

/**
 * class ActivationContext
 */

ActivationContext::~ActivationContext() = default;

} // namespace sbql
