#pragma once

#include "prelude.hh"
#include "color.hh"
#include "led/codec.hh"
#include "led/strip.hh"
#include <vector>

namespace test {
    /* the nine wire bytes of one LED, worked out bit by bit */
    static inline std::vector<uint8_t> led_bytes(color::rgb const &c)
    {
        std::vector<uint8_t> out;
        uint8_t const channels[] = { c.green, c.red, c.blue };

        for (auto ch : channels) {
            uint32_t bits = 0;
            for (int i = 7; i >= 0; --i) {
                bits = (bits << 3) | (((ch >> i) & 1) ? 0b110u : 0b100u);
            }
            out.push_back((uint8_t)(bits >> 16));
            out.push_back((uint8_t)(bits >> 8));
            out.push_back((uint8_t)bits);
        }

        return out;
    }

    static inline std::vector<uint8_t> frame_for(led::strip_state const &state, size_t preamble_len)
    {
        std::vector<uint8_t> out(preamble_len, 0);

        for (size_t i = 0; i < state.n_leds; ++i) {
            auto const bytes = led_bytes(state.leds[i]);
            out.insert(out.end(), bytes.begin(), bytes.end());
        }

        return out;
    }
}
