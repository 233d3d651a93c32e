#include <unity.h>
#include "prelude.hh"
#include <stdlib.h>

void run_codec_tests();
void run_transcode_tests();
void run_strip_tests();
void run_ctl_tests();
void run_cfg_tests();

void setUp()
{
}

void tearDown()
{
}

/* the strip needs a running scheduler for its mutex and delays */
static void runner(void *arg)
{
    unused(arg);

    UNITY_BEGIN();
    run_codec_tests();
    run_transcode_tests();
    run_strip_tests();
    run_ctl_tests();
    run_cfg_tests();

    exit(UNITY_END());
}

int main()
{
    if (pdPASS != xTaskCreate(runner, "TEST", configMINIMAL_STACK_SIZE * 4, nullptr, tskIDLE_PRIORITY + 2, nullptr)) {
        return EXIT_FAILURE;
    }

    vTaskStartScheduler();

    return EXIT_FAILURE;
}
