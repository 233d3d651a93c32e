#include "prelude.hh"
#include "systime.hh"
#include "task.hh"

TickType_t systime::ticks()
{
    if (task::is_in_isr())
        return xTaskGetTickCountFromISR();
    else
        return xTaskGetTickCount();
}

uint32_t systime::msecs()
{
    auto const ticks = systime::ticks();

    return (uint32_t) ((1000ull * (uint64_t)ticks) / (uint64_t)configTICK_RATE_HZ);
}
