#ifndef REQKEEP_REQUEST_REQUEST_CONTEXT_HPP
#define REQKEEP_REQUEST_REQUEST_CONTEXT_HPP

#include <memory>

#include "clock/clock.hpp"

namespace reqkeep::jobs
{
    class PersistentJobRunner;
    class Executor;
}

namespace reqkeep::client
{
    class ClientRegistry;
}

namespace reqkeep::request
{
    class RequestEngine;

    /**
     * Collaborators shared by every request of a node
     */
    struct RequestContext
    {
        std::shared_ptr<jobs::PersistentJobRunner> job_runner;
        std::shared_ptr<jobs::Executor>            executor;
        /// registry of CRASH_PERSISTENT clients, the records that are checkpointed
        std::shared_ptr<client::ClientRegistry> persistent_root;
        std::shared_ptr<RequestEngine>          engine;
        std::shared_ptr<clock::SystemClock>     clock;
    };
}

#endif // REQKEEP_REQUEST_REQUEST_CONTEXT_HPP
