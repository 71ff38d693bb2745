

#ifndef REQKEEP_OUTCOME_HPP
#define REQKEEP_OUTCOME_HPP

#include <libp2p/outcome/outcome.hpp>

namespace outcome
{
    using libp2p::outcome::failure;
    using libp2p::outcome::result;
    using libp2p::outcome::success;
}

#endif // REQKEEP_OUTCOME_HPP
