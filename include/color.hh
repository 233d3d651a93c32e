#pragma once

#include "prelude.hh"

namespace color {
    enum simple {
        BLACK,
        RED,
        GREEN,
        BLUE,
        WHITE,
    };

    /* clamp an untrusted channel value into [0, 255] */
    constexpr uint8_t clamp(long value)
    {
        return value < 0 ? 0
             : value > UINT8_MAX ? UINT8_MAX
             : static_cast<uint8_t>(value);
    }

    packed_struct rgb {
        rgb(uint8_t r, uint8_t g, uint8_t b);

        constexpr rgb(simple color):
            red(  color == RED || color == WHITE ? 255
                  : 0),
            green(color == GREEN || color == WHITE ? 255
                  : 0),
            blue( color == BLUE || color == WHITE ? 255
                  : 0)
        {}

        constexpr rgb(): red(0), green(0), blue(0) {}

        static rgb clamped(long r, long g, long b);

        static inline rgb gray(uint8_t level)
        {
            return rgb(level, level, level);
        }

        inline bool operator==(rgb const &other) const
        {
            return red == other.red && green == other.green && blue == other.blue;
        }

        inline bool operator!=(rgb const &other) const
        {
            return !(*this == other);
        }

        uint8_t red;
        uint8_t green;
        uint8_t blue;
    };
}
