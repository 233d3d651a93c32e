#pragma once

#include "prelude.hh"

namespace led {
    /**
     * @brief WS2812 bit codec for a serial clock running at 3x the LED bit rate.
     *
     * Every data bit becomes a 3-clock symbol, high for the first one or two
     * clocks: `1` is sent as `110`, `0` as `100`. A channel byte therefore
     * expands to 24 raw bits, most significant data bit first.
     *
     * The expansion of all 256 byte values is computed once, when the codec
     * is constructed, and only read afterwards.
     */
    struct codec {
        codec();

        constexpr static uint8_t symbol_one = 0b110;
        constexpr static uint8_t symbol_zero = 0b100;
        constexpr static size_t bits_per_symbol = 3;
        constexpr static size_t symbols_per_byte = 8;
        constexpr static size_t bits_per_byte = bits_per_symbol * symbols_per_byte;

        /**
         * @brief Expansion of `value`, right-justified in the low 24 bits.
         */
        inline uint32_t expand(uint8_t value) const
        {
            return table[value];
        }

        /**
         * @brief Expansion of `value`, computed without the table.
         */
        static uint32_t compute(uint8_t value);

    protected:
        uint32_t table[UINT8_MAX + 1];
    };
}
