#pragma once

#include "prelude.hh"

namespace systime {
    TickType_t ticks();

    /* milliseconds since the scheduler started */
    uint32_t msecs();
}
