#ifndef REQKEEP_JOBS_CHECKPOINTER_HPP
#define REQKEEP_JOBS_CHECKPOINTER_HPP

#include "outcome/outcome.hpp"

namespace reqkeep::jobs
{
    /**
     * Writes the durable state, called by the job runner thread only
     */
    class Checkpointer
    {
    public:
        virtual ~Checkpointer() = default;

        /**
         * @param final - last checkpoint before shutdown
         */
        virtual outcome::result<void> checkpoint( bool final ) = 0;
    };
}

#endif // REQKEEP_JOBS_CHECKPOINTER_HPP
