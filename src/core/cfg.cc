#define NRF_LOG_MODULE_NAME cfg
#include "prelude.hh"
#include "cfg.hh"
NRF_LOG_MODULE_REGISTER();

using namespace cfg;

bool cfg::sanitize(strip_config_t &config)
{
    auto const before = config;

    if (config.n_leds == 0) {
        config.n_leds = 1;
    } else if (config.n_leds > MAX_STRIP_LEDS) {
        config.n_leds = MAX_STRIP_LEDS;
    }

    if (config.preamble_len == 0) {
        config.preamble_len = 1;
    } else if (config.preamble_len > MAX_PREAMBLE_LEN) {
        config.preamble_len = MAX_PREAMBLE_LEN;
    }

    if (config.clock_hz == 0) {
        config.clock_hz = DEFAULT_CLOCK_HZ;
    }

    return memcmp(&before, &config, sizeof(config)) != 0;
}

ret_code_t cfg::load_strip_config(backend &store, strip_config_t &config)
{
    ret_code_t const ret = strip::config.load(store, config, strip_defaults());
    if (ret != NRF_SUCCESS) {
        NRF_LOG_ERROR("Loading %s config: 0x%x", id_name(strip::config.key), ret);
        return ret;
    }

    if (sanitize(config)) {
        NRF_LOG_WARNING("Strip config out of range, using %u LEDs, preamble %u", config.n_leds, config.preamble_len);
    }

    return NRF_SUCCESS;
}
