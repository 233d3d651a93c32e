#pragma once

#include "prelude.hh"

namespace cfg {
    /* fds stores whole words, so records are padded to a multiple of 4 bytes */
    template<typename T>
    packed_struct param_value {
        param_value(T const &value, uint16_t version):
            version(version),
            value(value),
            _padding_ {}
        {}

        constexpr param_value():
            version(0),
            value(),
            _padding_ {}
        {}

        uint16_t version;
        T value;
    private:
        uint8_t _padding_[(sizeof(uint32_t) - ((sizeof(uint16_t) + sizeof(T)) % sizeof(uint32_t))) % sizeof(uint32_t)];
    };

    packed_struct strip_config_t {
        uint16_t n_leds;
        uint32_t clock_hz;
        uint8_t preamble_len;
        uint8_t brightness;
        uint16_t sweep_msec;
    };

    constexpr strip_config_t strip_defaults()
    {
        return strip_config_t {
            DEFAULT_STRIP_LEDS,
            DEFAULT_CLOCK_HZ,
            DEFAULT_PREAMBLE_LEN,
            DEFAULT_BRIGHTNESS,
            DEFAULT_SWEEP_MSEC,
        };
    }

    /**
     * @brief Pull a loaded record back into the supported range.
     *
     * @return `true` if anything had to change.
     */
    bool sanitize(strip_config_t &config);
}
