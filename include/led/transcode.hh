#pragma once

#include "prelude.hh"
#include "led/frame.hh"
#include "color.hh"

namespace led {
    /**
     * @brief Turns LED colors into the byte stream a transport puts on the wire.
     *
     * A frame is written as `write_bus_reset()`, one `write()` per LED in strip
     * order, then `flush()`.
     */
    struct transcode {
        constexpr transcode(frame_buffer &frame):
            output(frame)
        {}

        virtual void clear()
        {
            output.clear();
        }

        inline frame_buffer const &frame() const
        {
            return output;
        }

        /**
         * @brief Number of bytes a complete frame for `n_leds` LEDs occupies.
         */
        virtual size_t frame_len(size_t n_leds) const = 0;

        virtual ret_code_t write_bus_reset() = 0;

        virtual ret_code_t write(color::rgb const &value) = 0;

        /**
         * @brief Emit any bits still held back from the output buffer.
         */
        virtual ret_code_t flush() = 0;

    protected:
        frame_buffer &output;
    };
}
