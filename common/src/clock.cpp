#include "shroud/common/clock.h"

std::atomic<shroud::SteadyClock::duration::rep> shroud::SteadyClock::m_time_shift{0};
