#include "lb/common/clock.h"

lb::SteadyClock::duration lb::SteadyClock::m_time_shift = lb::SteadyClock::duration::zero();
