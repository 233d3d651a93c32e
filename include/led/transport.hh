#pragma once

#include "prelude.hh"

namespace led {
    /**
     * @brief A serial peripheral that clocks a frame out to the strip.
     *
     * Every call is synchronous: `transmit` returns once the last byte has
     * left the peripheral. Only one caller may use a transport at a time;
     * `led::strip` serializes access.
     */
    struct transport {
        /**
         * @brief Acquire the peripheral.
         *
         * @param bus_id Peripheral instance.
         * @param device_id Which device on that bus; the meaning is up to the
         *                  implementation.
         */
        virtual ret_code_t open(uint32_t bus_id, uint32_t device_id) = 0;

        virtual ret_code_t set_clock_rate(uint32_t hz) = 0;

        /**
         * @brief Send `length` bytes without interruption.
         *
         * @return `ERROR_TRANSPORT_CLOSED` if the transport is not open,
         *         `ERROR_TRANSPORT_XFER` if the peripheral reported a failure.
         */
        virtual ret_code_t transmit(uint8_t const *bytes, size_t length) = 0;

        /**
         * @brief Release the peripheral. Calling this on a closed transport
         *        returns `ERROR_TRANSPORT_CLOSED` and does nothing else.
         */
        virtual ret_code_t close() = 0;

        virtual bool is_open() = 0;
    };
}
