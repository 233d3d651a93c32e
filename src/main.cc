#define NRF_LOG_MODULE_NAME main
#include "prelude.hh"
#include "cfg.hh"
#include "ctl.hh"
#include "led.hh"
#include "logger.hh"
#include "task.hh"
#include "periph/spi.hh"
#include "periph/uarte.hh"
#include "nrf_drv_clock.h"
#include "nrf_pwr_mgmt.h"
NRF_LOG_MODULE_REGISTER();

static uint8_t m_frame[spi::transcode_3bit::frame_len(MAX_STRIP_LEDS, MAX_PREAMBLE_LEN)] __attribute__((aligned(sizeof(uint32_t))));
static led::frame_buffer m_frame_buf(m_frame, sizeof(m_frame));

static spi::transport m_spi(STRIP_SCK_PIN);
static spi::transcode_3bit m_transcode(m_frame_buf);
static led::strip m_strip(m_spi, m_transcode);

static uarte::port m_uarte(CTL_UARTE_INSTANCE);
static ctl::handler m_handler(m_strip);
static ctl::console m_console(m_uarte, m_handler);

static cfg::flash_backend m_flash;

static void app_task_func(void *arg);
static bool shutdown_handler(nrf_pwr_mgmt_evt_t event);

NRF_PWR_MGMT_HANDLER_REGISTER(shutdown_handler, 0);

int main()
{
    ret_code_t ret;

    ret = nrf_drv_clock_init();
    APP_ERROR_CHECK(ret);
    nrf_drv_clock_lfclk_request(nullptr);

    ret = logger::init();
    APP_ERROR_CHECK(ret);

    ret = nrf_pwr_mgmt_init();
    APP_ERROR_CHECK(ret);

    ret = task::init();
    APP_ERROR_CHECK(ret);

    ret = logger::init_thread();
    APP_ERROR_CHECK(ret);

    ret = task::spawn(app_task_func, "APP", 512, nullptr, task::PRIORITY_APP);
    APP_ERROR_CHECK(ret);

    NRF_LOG_INFO("Starting scheduler");
    vTaskStartScheduler();

    unreachable();
}

/* runs once the scheduler is up, since fds waits on its own events */
static void app_task_func(void *arg)
{
    unused(arg);

    ret_code_t ret;
    auto config = cfg::strip_config_t {};

    ret = cfg::flash_backend::init();
    APP_ERROR_CHECK(ret);

    ret = cfg::load_strip_config(m_flash, config);
    APP_ERROR_CHECK(ret);

    ret = m_transcode.set_preamble_len(config.preamble_len);
    APP_ERROR_CHECK(ret);

    ret = m_spi.set_clock_rate(config.clock_hz);
    if (ret == NRF_SUCCESS) {
        ret = m_spi.open(STRIP_SPIM_INSTANCE, STRIP_DATA_PIN);
    }
    if (ret != NRF_SUCCESS) {
        NRF_LOG_ERROR("Cannot open strip bus SPIM%u: 0x%x", STRIP_SPIM_INSTANCE, ret);
        APP_ERROR_CHECK(ret);
    }

    ret = m_strip.init(config.n_leds);
    APP_ERROR_CHECK(ret);

    NRF_LOG_INFO("%u LEDs at %u Hz, preamble %u", config.n_leds, config.clock_hz, config.preamble_len);

    ret = m_strip.run_startup_sweep(config.brightness, config.sweep_msec);
    if (ret != NRF_SUCCESS) {
        NRF_LOG_WARNING("Startup sweep: 0x%x", ret);
    }

    ret = m_strip.set_all(config.brightness, config.brightness, config.brightness);
    if (ret != NRF_SUCCESS) {
        NRF_LOG_WARNING("Default color: 0x%x", ret);
    }

    auto const uart_config = uarte::config {
        CTL_UART_BAUD,
        CTL_UART_RX_PIN,
        CTL_UART_TX_PIN,
    };

    ret = m_uarte.init(uart_config);
    APP_ERROR_CHECK(ret);

    ret = m_console.init("CTL");
    APP_ERROR_CHECK(ret);

    vTaskDelete(nullptr);
}

static bool shutdown_handler(nrf_pwr_mgmt_evt_t event)
{
    unused(event);

    NRF_LOG_INFO("Shutdown, releasing strip bus");
    spi::release_all();

    return true;
}

/* replaces the SDK's weak handler so the bus is released before reset */
extern "C" void app_error_fault_handler(uint32_t id, uint32_t pc, uint32_t info)
{
    __disable_irq();

    if (id == NRF_FAULT_ID_SDK_ERROR) {
        auto const err = (error_info_t const*)info;
        NRF_LOG_ERROR("Fatal error 0x%x, line %u", err->err_code, err->line_num);
    } else {
        NRF_LOG_ERROR("Fatal fault 0x%x at 0x%08x", id, pc);
    }

    spi::release_all();
    logger::final_flush();

#ifdef DEBUG
    app_error_save_and_stop(id, pc, info);
#else
    NVIC_SystemReset();
#endif
}
