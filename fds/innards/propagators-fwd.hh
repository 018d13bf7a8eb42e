#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_PROPAGATORS_FWD_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_PROPAGATORS_FWD_HH

namespace fds::innards
{
    class Propagators;
    struct Triggers;
}

#endif
