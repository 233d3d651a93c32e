#define NRF_LOG_MODULE_NAME uarte
#include "prelude.hh"
#include "periph/uarte.hh"
#include "nrfx_uarte.h"
#include "semphr.h"
#include <iterator>
NRF_LOG_MODULE_REGISTER();

using namespace uarte;

#define RX_QUEUE_LEN 256
#define TX_BOUNCE_LEN 64
#define TX_TIMEOUT_MSEC 1000

namespace {
    struct port_context {
        nrfx_uarte_t const *periph;
        StreamBufferHandle_t rx_queue;
        SemaphoreHandle_t tx_done;
        SemaphoreHandle_t tx_lock;
        volatile bool receiving;
        uint8_t rx_byte;
        uint8_t tx_bounce[TX_BOUNCE_LEN] __attribute__((aligned(sizeof(uint32_t))));
    };

    struct baud_entry {
        uint32_t baud;
        nrf_uarte_baudrate_t setting;
    };
}

static nrfx_uarte_t const m_periph[] = {
#if NRFX_UARTE0_ENABLED
    NRFX_UARTE_INSTANCE(0),
#endif
#if NRFX_UARTE1_ENABLED
    NRFX_UARTE_INSTANCE(1),
#endif
};

#define N_PORTS (sizeof(m_periph) / sizeof(m_periph[0]))

static port_context m_ports[N_PORTS] = {};

static baud_entry const m_baud_table[] = {
    { 9600, NRF_UARTE_BAUDRATE_9600 },
    { 19200, NRF_UARTE_BAUDRATE_19200 },
    { 38400, NRF_UARTE_BAUDRATE_38400 },
    { 57600, NRF_UARTE_BAUDRATE_57600 },
    { 115200, NRF_UARTE_BAUDRATE_115200 },
    { 230400, NRF_UARTE_BAUDRATE_230400 },
    { 460800, NRF_UARTE_BAUDRATE_460800 },
    { 921600, NRF_UARTE_BAUDRATE_921600 },
    { 1000000, NRF_UARTE_BAUDRATE_1000000 },
};

static void port_evt_handler(nrfx_uarte_event_t const *event, void *context);
static void arm_rx(port_context &ctx);

ret_code_t port::init(config const &cfg)
{
    if (instance >= N_PORTS)
        return NRF_ERROR_INVALID_PARAM;

    auto const entry = std::find_if(std::begin(m_baud_table), std::end(m_baud_table),
        [&](baud_entry const &e) { return e.baud == cfg.baud; });
    if (entry == std::end(m_baud_table)) {
        NRF_LOG_ERROR("Unsupported baud rate %u", cfg.baud);
        return NRF_ERROR_INVALID_PARAM;
    }

    auto &ctx = m_ports[instance];
    ctx.periph = &m_periph[instance];
    ctx.receiving = false;
    ctx.rx_queue = xStreamBufferCreate(RX_QUEUE_LEN, 1);
    ctx.tx_done = xSemaphoreCreateBinary();
    ctx.tx_lock = xSemaphoreCreateMutex();
    if (!ctx.rx_queue || !ctx.tx_done || !ctx.tx_lock)
        return NRF_ERROR_NO_MEM;

    nrfx_uarte_config_t periph_config = NRFX_UARTE_DEFAULT_CONFIG;
    periph_config.pselrxd = cfg.rx_pin;
    periph_config.pseltxd = cfg.tx_pin;
    periph_config.baudrate = entry->setting;
    periph_config.hwfc = NRF_UARTE_HWFC_DISABLED;
    periph_config.parity = NRF_UARTE_PARITY_EXCLUDED;
    periph_config.p_context = &ctx;

    ret_code_t const ret = nrfx_uarte_init(ctx.periph, &periph_config, port_evt_handler);
    VERIFY_SUCCESS(ret);

    NRF_LOG_INFO("Console on UARTE%u at %u baud", instance, cfg.baud);

    return NRF_SUCCESS;
}

StreamBufferHandle_t port::received()
{
    return m_ports[instance].rx_queue;
}

ret_code_t port::send(char const *data, size_t length)
{
    if (!data)
        return NRF_ERROR_NULL;

    auto &ctx = m_ports[instance];
    ret_code_t ret = NRF_SUCCESS;

    xSemaphoreTake(ctx.tx_lock, portMAX_DELAY);

    for (size_t sent = 0; sent < length && ret == NRF_SUCCESS;) {
        size_t const n = std::min(length - sent, sizeof(ctx.tx_bounce));
        memcpy(ctx.tx_bounce, data + sent, n);

        ret = nrfx_uarte_tx(ctx.periph, ctx.tx_bounce, n);
        if (ret != NRF_SUCCESS)
            break;

        if (!xSemaphoreTake(ctx.tx_done, pdMS_TO_TICKS(TX_TIMEOUT_MSEC))) {
            nrfx_uarte_tx_abort(ctx.periph);
            ret = NRF_ERROR_TIMEOUT;
        }

        sent += n;
    }

    xSemaphoreGive(ctx.tx_lock);

    return ret;
}

ret_code_t port::start()
{
    auto &ctx = m_ports[instance];

    ctx.receiving = true;
    ret_code_t const ret = nrfx_uarte_rx(ctx.periph, &ctx.rx_byte, 1);
    if (ret != NRF_SUCCESS) {
        ctx.receiving = false;
    }

    return ret;
}

static void arm_rx(port_context &ctx)
{
    if (!ctx.receiving)
        return;

    ret_code_t const ret = nrfx_uarte_rx(ctx.periph, &ctx.rx_byte, 1);
    if (ret != NRF_SUCCESS) {
        ctx.receiving = false;
        NRF_LOG_WARNING("Console receive stopped: 0x%x", ret);
    }
}

static void port_evt_handler(nrfx_uarte_event_t const *event, void *context)
{
    auto &ctx = *(port_context*)context;
    BaseType_t woken = pdFALSE;

    switch (event->type) {
    case NRFX_UARTE_EVT_RX_DONE:
        if (event->data.rxtx.bytes > 0) {
            xStreamBufferSendFromISR(ctx.rx_queue, event->data.rxtx.p_data, event->data.rxtx.bytes, &woken);
        }
        arm_rx(ctx);
        break;

    case NRFX_UARTE_EVT_TX_DONE:
        xSemaphoreGiveFromISR(ctx.tx_done, &woken);
        break;

    case NRFX_UARTE_EVT_ERROR:
        /* framing or overrun ends the transfer, keep listening */
        arm_rx(ctx);
        break;
    }

    portYIELD_FROM_ISR(woken);
}
