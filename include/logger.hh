#pragma once

#include "prelude.hh"

namespace logger {
    ret_code_t init();

    /* the logger thread flushes deferred log entries; the idle hook resumes it */
    ret_code_t init_thread();

    TaskHandle_t thread();

    void final_flush();
}
