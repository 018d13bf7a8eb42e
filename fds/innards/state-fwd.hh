#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_STATE_FWD_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_STATE_FWD_HH

namespace fds::innards
{
    class State;
    struct Timestamp;
}

#endif
