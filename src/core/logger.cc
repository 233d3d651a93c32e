#include "prelude.hh"
#include "logger.hh"
#include "task.hh"
#include "nrf_log_ctrl.h"
#include "nrf_log_default_backends.h"

static TaskHandle_t m_thread = nullptr;

/* drains the deferred log queue, then sleeps until the idle hook wakes it */
static void logger_task_func(void *arg)
{
    unused(arg);

    for (;;) {
        NRF_LOG_FLUSH();
        vTaskSuspend(nullptr);
    }
}

ret_code_t logger::init()
{
    ret_code_t const ret = NRF_LOG_INIT(nullptr);
    VERIFY_SUCCESS(ret);

    NRF_LOG_DEFAULT_BACKENDS_INIT();

    return NRF_SUCCESS;
}

ret_code_t logger::init_thread()
{
    return task::spawn(logger_task_func, "LOG", 256, nullptr, task::PRIORITY_BACKGROUND, &m_thread);
}

TaskHandle_t logger::thread()
{
    return m_thread;
}

void logger::final_flush()
{
    NRF_LOG_FINAL_FLUSH();
}
