#pragma once

#include "prelude.hh"
#include "semphr.h"

#ifdef __cplusplus
extern "C" {
#endif

void vApplicationIdleHook(void);

#ifdef __cplusplus
}
#endif

namespace task {
    enum priority: UBaseType_t {
        PRIORITY_BACKGROUND = tskIDLE_PRIORITY + 1,
        PRIORITY_CONTROL = tskIDLE_PRIORITY + 2,
        PRIORITY_APP = tskIDLE_PRIORITY + 3,
    };

    /**
     * @brief Start the background task that compacts flash for the config store.
     */
    ret_code_t init();

    /**
     * @brief `xTaskCreate` with the failure reported as NRF_ERROR_NO_MEM.
     */
    ret_code_t spawn(
        TaskFunction_t func,
        char const *name,
        uint16_t stack_words,
        void *context,
        priority prio,
        TaskHandle_t *handle = nullptr);

    /* safe to call from an ISR, fds events arrive in one */
    void schedule_fds_gc();

    bool is_in_isr();
}
