#ifndef STEADYCLOCK_HPP
#define STEADYCLOCK_HPP

#include "../interfaces/IClock.hpp"

class SteadyClock : public IClock {
public:
    time_point now() const override;
};

#endif // STEADYCLOCK_HPP
