#include <utility>

#include "activation_context.hpp"
#include "logging.hpp"
#include "queued_listener.hpp"

using namespace std;

namespace sbql {

static Logger logger( "queued_listener" );


/**
 * class CommunicationListener
 */

CommunicationListener::~CommunicationListener() = default;


/**
 * class QueuedListener
 */

QueuedListener::QueuedListener( shared_ptr< void > service, ActivationContext const* context, ServiceEndpoint endpoint )
        : service_ { move( service ) }
        , context_ { context }
        , endpoint_ { move( endpoint ) } {}

Result< string > QueuedListener::open()
{
    if ( open_ ) {
        return make_error_code( sbql_errc::already_open );
    }

    for ( auto const& behavior : endpoint_.behaviors()) {
        auto applied = behavior->apply( endpoint_ );
        if ( !applied ) {
            logger.error( endpoint_, "couldn't apply ", behavior->name(), ": ", applied.error().message());
            return applied.error();
        }
    }

    open_ = true;
    logger.info( endpoint_, "listening on queue ", endpoint_.address().queueName());
    return endpoint_.address().str();
}

Result< void > QueuedListener::close()
{
    if ( open_ ) {
        logger.info( endpoint_, "closing" );
        open_ = false;
    }
    return boost::outcome_v2::success();
}

void QueuedListener::abort()
{
    if ( open_ ) {
        logger.warning( endpoint_, "aborting" );
        open_ = false;
    }
}

} // namespace sbql
