#pragma once

#include "prelude.hh"
#include "led/transport.hh"
#include "led/transcode.hh"
#include "led/codec.hh"
#include "sdk_config.h"

namespace spi {
    using pin = uint8_t;

    enum id: uintptr_t {
#if NRFX_SPIM0_ENABLED
        SPI0,
#endif
#if NRFX_SPIM1_ENABLED
        SPI1,
#endif
#if NRFX_SPIM2_ENABLED
        SPI2,
#endif
#if NRFX_SPIM3_ENABLED
        SPI3,
#endif
        MAX_SPIM_INST
    };

    /**
     * @brief Blocking SPIM transport. Only MOSI and SCK are driven.
     *
     * `open(bus_id, device_id)` takes the SPIM instance as `bus_id` and the
     * MOSI pin wired to the strip's data line as `device_id`.
     */
    struct transport: led::transport {
        constexpr transport(pin sck):
            inst_id(MAX_SPIM_INST),
            sck(sck),
            clock_hz(DEFAULT_CLOCK_HZ),
            opened(false)
        {}

        ret_code_t open(uint32_t bus_id, uint32_t device_id) override;

        ret_code_t set_clock_rate(uint32_t hz) override;

        ret_code_t transmit(uint8_t const *bytes, size_t length) override;

        ret_code_t close() override;

        bool is_open() override;

        inline id instance_id()
        {
            return inst_id;
        }

    protected:
        id inst_id;
        pin sck;
        uint32_t clock_hz;
        bool opened;
    };

    /**
     * @brief Release every SPIM instance that is still open.
     *
     * Used on the shutdown and fatal-error paths. Safe to call more than once;
     * each instance is released exactly once.
     */
    void release_all();

    /**
     * @brief Transcode LED data for WS2812 over SPI clocked at 3x the LED bit rate.
     *
     * Colors go out green, red, blue. Each channel expands to 24 bits through
     * `led::codec` and the bits are packed MSB first with no byte alignment
     * between LEDs. A frame starts with `preamble_len` zero bytes which hold
     * the line low long enough for the strip to latch the previous frame.
     */
    struct transcode_3bit: led::transcode {
        transcode_3bit(led::frame_buffer &frame, size_t preamble_len);

        inline transcode_3bit(led::frame_buffer &frame):
            transcode_3bit(frame, DEFAULT_PREAMBLE_LEN)
        {}

        constexpr static size_t bits_per_led = 3 * led::codec::bits_per_byte;

        constexpr static size_t frame_len(size_t n_leds, size_t preamble_len)
        {
            return preamble_len + (n_leds * bits_per_led + 7) / 8;
        }

        size_t frame_len(size_t n_leds) const override;

        ret_code_t set_preamble_len(size_t n);

        inline size_t preamble_len() const
        {
            return n_preamble;
        }

        void clear() override;

        ret_code_t write_bus_reset() override;

        ret_code_t write(color::rgb const &value) override;

        ret_code_t flush() override;

    protected:
        /* append the low `n` bits of `bits`, MSB first; n <= 24 */
        ret_code_t write_bits(uint32_t bits, size_t n);

        led::codec const codec;
        size_t n_preamble;
        uint32_t acc;
        size_t n_acc;
    };
}
