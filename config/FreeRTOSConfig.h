#ifndef FREERTOS_CONFIG_H
#define FREERTOS_CONFIG_H

#include "app_util_platform.h"

#define FREERTOS_USE_RTC                                    0
#define FREERTOS_USE_SYSTICK                                1

#define configTICK_SOURCE                                   FREERTOS_USE_RTC

#define configUSE_PREEMPTION                                1
#define configUSE_PORT_OPTIMISED_TASK_SELECTION             0
#define configUSE_TICKLESS_IDLE                             0
#define configUSE_TICKLESS_IDLE_SIMPLE_DEBUG                1
#define configCPU_CLOCK_HZ                                  ( SystemCoreClock )
#define configTICK_RATE_HZ                                  1024
#define configMAX_PRIORITIES                                ( 5 )
#define configMINIMAL_STACK_SIZE                            ( 60 )
#define configTOTAL_HEAP_SIZE                               ( 16384 )
#define configMAX_TASK_NAME_LEN                             ( 8 )
#define configUSE_16_BIT_TICKS                              0
#define configIDLE_SHOULD_YIELD                             1
#define configUSE_MUTEXES                                   1
#define configUSE_RECURSIVE_MUTEXES                         1
#define configUSE_COUNTING_SEMAPHORES                       1
#define configUSE_ALTERNATIVE_API                           0
#define configQUEUE_REGISTRY_SIZE                           2
#define configUSE_QUEUE_SETS                                0
#define configUSE_TIME_SLICING                              0
#define configUSE_NEWLIB_REENTRANT                          0
#define configENABLE_BACKWARD_COMPATIBILITY                 1
#define configUSE_TASK_NOTIFICATIONS                        1

/* the idle hook wakes the logger task */
#define configUSE_IDLE_HOOK                                 1
#define configUSE_TICK_HOOK                                 0
#define configCHECK_FOR_STACK_OVERFLOW                      0
#define configUSE_MALLOC_FAILED_HOOK                        0

#define configGENERATE_RUN_TIME_STATS                       0
#define configUSE_TRACE_FACILITY                            0
#define configUSE_STATS_FORMATTING_FUNCTIONS                0

#define configUSE_CO_ROUTINES                               0
#define configMAX_CO_ROUTINE_PRIORITIES                     ( 2 )

#define configUSE_TIMERS                                    1
#define configTIMER_TASK_PRIORITY                           ( 2 )
#define configTIMER_QUEUE_LENGTH                            8
#define configTIMER_TASK_STACK_DEPTH                        ( 80 )

#define configSUPPORT_STATIC_ALLOCATION                     0
#define configSUPPORT_DYNAMIC_ALLOCATION                    1

#define configKERNEL_INTERRUPT_PRIORITY                     configLIBRARY_LOWEST_INTERRUPT_PRIORITY
#define configMAX_SYSCALL_INTERRUPT_PRIORITY                configLIBRARY_MAX_SYSCALL_INTERRUPT_PRIORITY

#define configASSERT( x )                                   ASSERT(x)

#define INCLUDE_vTaskPrioritySet                            1
#define INCLUDE_uxTaskPriorityGet                           1
#define INCLUDE_vTaskDelete                                 1
#define INCLUDE_vTaskSuspend                                1
#define INCLUDE_xResumeFromISR                              1
#define INCLUDE_vTaskDelayUntil                             1
#define INCLUDE_vTaskDelay                                  1
#define INCLUDE_xTaskGetSchedulerState                      1
#define INCLUDE_xTaskGetCurrentTaskHandle                   1
#define INCLUDE_uxTaskGetStackHighWaterMark                 1
#define INCLUDE_xTaskGetIdleTaskHandle                      1
#define INCLUDE_xTimerGetTimerDaemonTaskHandle              1
#define INCLUDE_pcTaskGetTaskName                           1
#define INCLUDE_eTaskGetState                               1
#define INCLUDE_xEventGroupSetBitFromISR                    1
#define INCLUDE_xTimerPendFunctionCall                      1

#define xPortPendSVHandler                                  PendSV_Handler
#define vPortSVCHandler                                     SVC_Handler

#define configPRE_SLEEP_PROCESSING( x )
#define configPOST_SLEEP_PROCESSING( x )

#if (configTICK_SOURCE == FREERTOS_USE_SYSTICK)
#define configSYSTICK_CLOCK_HZ                              ( SystemCoreClock )
#elif (configTICK_SOURCE == FREERTOS_USE_RTC)
#define configSYSTICK_CLOCK_HZ                              ( 32768UL )
#define xPortSysTickHandler                                 RTC1_IRQHandler
#else
#error "Unsupported configTICK_SOURCE value"
#endif

#define configLIBRARY_LOWEST_INTERRUPT_PRIORITY             0xf
#define configLIBRARY_MAX_SYSCALL_INTERRUPT_PRIORITY        _PRIO_APP_HIGH

#define configUSE_DISABLE_TICK_AUTO_CORRECTION_DEBUG        0

#endif /* FREERTOS_CONFIG_H */
