#define NRF_LOG_MODULE_NAME spi
#include "prelude.hh"
#include "periph/spi.hh"
#include "nrfx_spim.h"
#include "nrf_spim.h"
NRF_LOG_MODULE_REGISTER();

using namespace spi;

/* SPIM FREQUENCY is a fractional divider of the 16MHz peripheral clock:
 * register = hz * 2^32 / 16MHz. The documented rates are the powers of two,
 * anything in between divides the same way. */
#define SPIM_BASE_CLOCK_HZ  16000000ULL
#define SPIM_MIN_CLOCK_HZ   125000UL
#define SPIM_MAX_CLOCK_HZ   8000000UL

/* EasyDMA MAXCNT limits a single transfer */
#define SPIM_MAX_XFER_LEN   ((1UL << SPIM0_EASYDMA_MAXCNT_SIZE) - 1)

static nrfx_spim_t *spim_inst(id id);
static nrf_spim_frequency_t frequency_reg(uint32_t hz);
static transport *m_open[MAX_SPIM_INST] = {};

ret_code_t transport::open(uint32_t bus_id, uint32_t device_id)
{
    if (opened) {
        return NRF_ERROR_INVALID_STATE;
    }

    if (bus_id >= MAX_SPIM_INST || device_id > UINT8_MAX) {
        return NRF_ERROR_INVALID_PARAM;
    }

    nrfx_spim_config_t config = NRFX_SPIM_DEFAULT_CONFIG;

    config.sck_pin = sck;
    config.mosi_pin = (pin)device_id;
    config.miso_pin = NRFX_SPIM_PIN_NOT_USED;
    config.ss_pin = NRFX_SPIM_PIN_NOT_USED;
    config.orc = 0x00;
    config.bit_order = NRF_SPIM_BIT_ORDER_MSB_FIRST;
    config.mode = NRF_SPIM_MODE_0;
    config.frequency = frequency_reg(clock_hz);

    inst_id = (id)bus_id;

    /* no event handler: every transfer blocks until it is done */
    ret_code_t ret = nrfx_spim_init(spim_inst(inst_id), &config, nullptr, nullptr);
    if (ret != NRFX_SUCCESS) {
        NRF_LOG_ERROR("nrfx_spim_init(%u): 0x%x", bus_id, ret);
        inst_id = MAX_SPIM_INST;
        return ERROR_TRANSPORT_OPEN;
    }

    opened = true;
    m_open[inst_id] = this;

    NRF_LOG_INFO("SPIM%u open, MOSI=%u SCK=%u %u Hz", bus_id, device_id, sck, clock_hz);

    return NRF_SUCCESS;
}

ret_code_t transport::set_clock_rate(uint32_t hz)
{
    if (hz < SPIM_MIN_CLOCK_HZ || hz > SPIM_MAX_CLOCK_HZ) {
        return ERROR_TRANSPORT_CLOCK;
    }

    clock_hz = hz;

    if (opened) {
        nrf_spim_frequency_set(spim_inst(inst_id)->p_reg, frequency_reg(hz));
    }

    return NRF_SUCCESS;
}

ret_code_t transport::transmit(uint8_t const *bytes, size_t length)
{
    if (!opened) {
        return ERROR_TRANSPORT_CLOSED;
    }

    if (length > 0 && !bytes) {
        return NRF_ERROR_NULL;
    }

    auto spim = spim_inst(inst_id);

    while (length > 0) {
        auto const n = std::min(length, (size_t)SPIM_MAX_XFER_LEN);
        nrfx_spim_xfer_desc_t xfer = NRFX_SPIM_XFER_TX(bytes, n);

        ret_code_t ret = nrfx_spim_xfer(spim, &xfer, 0);
        if (ret != NRFX_SUCCESS) {
            NRF_LOG_WARNING("nrfx_spim_xfer: 0x%x", ret);
            return ERROR_TRANSPORT_XFER;
        }

        bytes += n;
        length -= n;
    }

    return NRF_SUCCESS;
}

ret_code_t transport::close()
{
    if (!opened) {
        return ERROR_TRANSPORT_CLOSED;
    }

    nrfx_spim_uninit(spim_inst(inst_id));

    opened = false;
    m_open[inst_id] = nullptr;
    inst_id = MAX_SPIM_INST;

    return NRF_SUCCESS;
}

bool transport::is_open()
{
    return opened;
}

void spi::release_all()
{
    for (size_t i = 0; i < MAX_SPIM_INST; ++i) {
        if (!m_open[i])
            continue;

        ret_code_t const ret = m_open[i]->close();
        if (ret != NRF_SUCCESS) {
            NRF_LOG_WARNING("Releasing SPIM%u: 0x%x", i, ret);
        }
    }
}

static nrf_spim_frequency_t frequency_reg(uint32_t hz)
{
    auto const reg = ((uint64_t)hz << 32) / SPIM_BASE_CLOCK_HZ;
    return (nrf_spim_frequency_t)(reg & 0xfffff000UL);
}

static nrfx_spim_t *spim_inst(id id)
{
    static nrfx_spim_t spim_inst[] = {
    #if NRFX_CHECK(NRFX_SPIM0_ENABLED)
        NRFX_SPIM_INSTANCE(0),
    #endif
    #if NRFX_CHECK(NRFX_SPIM1_ENABLED)
        NRFX_SPIM_INSTANCE(1),
    #endif
    #if NRFX_CHECK(NRFX_SPIM2_ENABLED)
        NRFX_SPIM_INSTANCE(2),
    #endif
    #if NRFX_CHECK(NRFX_SPIM3_ENABLED)
        NRFX_SPIM_INSTANCE(3),
    #endif
    };

    assert(id < MAX_SPIM_INST);

    return &spim_inst[id];
}
