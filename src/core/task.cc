#define NRF_LOG_MODULE_NAME task
#include "prelude.hh"
#include "task.hh"
#include "logger.hh"
#include "fds.h"
NRF_LOG_MODULE_REGISTER();

#define NOTIFY_FDS_GC (1UL << 0)

static TaskHandle_t m_background = nullptr;
static void background_task_func(void *arg);

void vApplicationIdleHook()
{
#if NRF_LOG_ENABLED
    vTaskResume(logger::thread());
#endif
}

ret_code_t task::init()
{
    return spawn(background_task_func, "BG", 128, nullptr, PRIORITY_BACKGROUND, &m_background);
}

ret_code_t task::spawn(
    TaskFunction_t func,
    char const *name,
    uint16_t stack_words,
    void *context,
    priority prio,
    TaskHandle_t *handle)
{
    if (pdPASS != xTaskCreate(func, name, stack_words, context, prio, handle)) {
        NRF_LOG_ERROR("No room for task %s", name);
        return NRF_ERROR_NO_MEM;
    }

    return NRF_SUCCESS;
}

void task::schedule_fds_gc()
{
    if (!is_in_isr()) {
        xTaskNotify(m_background, NOTIFY_FDS_GC, eSetBits);
        return;
    }

    BaseType_t woken = pdFALSE;
    xTaskNotifyFromISR(m_background, NOTIFY_FDS_GC, eSetBits, &woken);
    portYIELD_FROM_ISR(woken);
}

bool task::is_in_isr()
{
    return 0 != (SCB->ICSR & SCB_ICSR_VECTACTIVE_Msk);
}

static void background_task_func(void *arg)
{
    unused(arg);

    while (1) {
        uint32_t flags = 0;
        xTaskNotifyWait(0, UINT32_MAX, &flags, portMAX_DELAY);

        if (flags & NOTIFY_FDS_GC) {
            ret_code_t const ret = fds_gc();
            if (ret != NRF_SUCCESS) {
                NRF_LOG_WARNING("Flash compaction: 0x%x", ret);
            }
        }
    }
}
