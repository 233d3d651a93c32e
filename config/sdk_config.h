#ifndef SDK_CONFIG_H
#define SDK_CONFIG_H

/* Only the modules the strip firmware links are configured here. */

// clock
#define NRF_CLOCK_ENABLED 1
#define CLOCK_CONFIG_LF_SRC 1
#define CLOCK_CONFIG_LF_CAL_ENABLED 0
#define CLOCK_CONFIG_IRQ_PRIORITY 6
#define NRFX_CLOCK_ENABLED 1
#define NRFX_CLOCK_CONFIG_LF_SRC 1
#define NRFX_CLOCK_CONFIG_LF_CAL_ENABLED 0
#define NRFX_CLOCK_CONFIG_IRQ_PRIORITY 6
#define NRFX_CLOCK_CONFIG_LOG_ENABLED 0
#define NRFX_POWER_ENABLED 0

// strip bus
#define NRFX_SPIM_ENABLED 1
#define NRFX_SPIM0_ENABLED 1
#define NRFX_SPIM1_ENABLED 0
#define NRFX_SPIM2_ENABLED 0
#define NRFX_SPIM3_ENABLED 0
#define NRFX_SPIM_EXTENDED_ENABLED 0
#define NRFX_SPIM_MISO_PULL_CFG 1
#define NRFX_SPIM_DEFAULT_CONFIG_IRQ_PRIORITY 6
#define NRFX_SPIM_CONFIG_LOG_ENABLED 0
#define NRFX_SPIM_NRF52_ANOMALY_109_WORKAROUND_ENABLED 0

// control surface
#define NRFX_UARTE_ENABLED 1
#define NRFX_UARTE0_ENABLED 1
#define NRFX_UARTE1_ENABLED 0
#define NRFX_UARTE_DEFAULT_CONFIG_HWFC 0
#define NRFX_UARTE_DEFAULT_CONFIG_PARITY 0
#define NRFX_UARTE_DEFAULT_CONFIG_BAUDRATE 30801920
#define NRFX_UARTE_DEFAULT_CONFIG_IRQ_PRIORITY 6
#define NRFX_UARTE_CONFIG_LOG_ENABLED 0
#define NRFX_PRS_ENABLED 0

// flash data storage
#define FDS_ENABLED 1
#define FDS_VIRTUAL_PAGES 3
#define FDS_VIRTUAL_PAGE_SIZE 1024
#define FDS_VIRTUAL_PAGES_RESERVED 0
#define FDS_BACKEND 1
#define FDS_OP_QUEUE_SIZE 4
#define FDS_CRC_CHECK_ON_READ 0
#define FDS_CRC_CHECK_ON_WRITE 0
#define FDS_MAX_USERS 4
#define NRF_FSTORAGE_ENABLED 1
#define NRF_FSTORAGE_PARAM_CHECK_DISABLED 0

// power management
#define NRF_PWR_MGMT_ENABLED 1
#define NRF_PWR_MGMT_CONFIG_DEBUG_PIN_ENABLED 0
#define NRF_PWR_MGMT_CONFIG_CPU_USAGE_MONITOR_ENABLED 0
#define NRF_PWR_MGMT_CONFIG_STANDBY_TIMEOUT_ENABLED 0
#define NRF_PWR_MGMT_CONFIG_FPU_SUPPORT_ENABLED 1
#define NRF_PWR_MGMT_CONFIG_AUTO_SHUTDOWN_RETRY 0
#define NRF_PWR_MGMT_CONFIG_USE_SCHEDULER 0
#define NRF_PWR_MGMT_CONFIG_HANDLER_PRIORITY_COUNT 3
#define NRF_PWR_MGMT_CONFIG_LOG_ENABLED 0

// support libraries
#define NRF_SECTION_ITER_ENABLED 1
#define NRF_STRERROR_ENABLED 1
#define NRF_MEMOBJ_ENABLED 1
#define NRF_BALLOC_ENABLED 1
#define NRF_BALLOC_CONFIG_DEBUG_ENABLED 0
#define NRF_ATFIFO_ENABLED 1
#define NRF_ATFIFO_CONFIG_LOG_ENABLED 0
#define NRF_QUEUE_ENABLED 0
#define APP_TIMER_ENABLED 0

// logging: RTT only, the UART belongs to the control surface
#define NRF_LOG_ENABLED 1
#define NRF_LOG_BACKEND_RTT_ENABLED 1
#define NRF_LOG_BACKEND_RTT_TEMP_BUFFER_SIZE 64
#define NRF_LOG_BACKEND_RTT_TX_RETRY_DELAY_MS 1
#define NRF_LOG_BACKEND_RTT_TX_RETRY_CNT 3
#define NRF_LOG_BACKEND_UART_ENABLED 0
#define NRF_LOG_DEFERRED 1
#define NRF_LOG_BUFSIZE 1024
#define NRF_LOG_ALLOW_OVERFLOW 1
#define NRF_LOG_DEFAULT_LEVEL 3
#define NRF_LOG_USES_COLORS 0
#define NRF_LOG_USES_TIMESTAMP 0
#define NRF_LOG_FILTERS_ENABLED 0
#define NRF_LOG_CLI_CMDS 0
#define NRF_LOG_STR_FORMATTER_TIMESTAMP_FORMAT_ENABLED 0
#define NRF_LOG_NON_DEFFERED_CRITICAL_REGION_ENABLED 0
#define NRF_LOG_STR_PUSH_BUFFER_SIZE 128
#define NRF_LOG_MSGPOOL_ELEMENT_SIZE 20
#define NRF_LOG_MSGPOOL_ELEMENT_COUNT 8
#define NRF_LOG_ERROR_COLOR 2
#define NRF_LOG_WARNING_COLOR 4
#define NRF_LOG_STR_LEN 6
#define NRF_FPRINTF_ENABLED 1
#define NRF_FPRINTF_FLAG_AUTOMATIC_CR_ON_LF_ENABLED 1
#define NRF_FPRINTF_DOUBLE_ENABLED 0
#define SEGGER_RTT_CONFIG_BUFFER_SIZE_UP 512
#define SEGGER_RTT_CONFIG_MAX_NUM_UP_BUFFERS 2
#define SEGGER_RTT_CONFIG_BUFFER_SIZE_DOWN 16
#define SEGGER_RTT_CONFIG_MAX_NUM_DOWN_BUFFERS 2
#define SEGGER_RTT_CONFIG_DEFAULT_MODE 0

#endif /* SDK_CONFIG_H */
