#pragma once

#include "prelude.hh"
#include "color.hh"
#include "led/transcode.hh"
#include "led/transport.hh"
#include "task/lock.hh"

namespace led {
    /**
     * @brief Colors of every LED on the strip.
     *
     * When `uniform` is set, every entry of `leds` equals `uniform_color`. Otherwise
     * `uniform_color` is stale and `leds` is authoritative.
     */
    struct strip_state {
        constexpr strip_state():
            n_leds(0),
            uniform(true),
            uniform_color(),
            updates(0),
            leds {}
        {}

        void fill(color::rgb value);

        size_t n_leds;
        bool uniform;
        color::rgb uniform_color;
        /* number of transactions committed so far */
        uint32_t updates;
        color::rgb leds[MAX_STRIP_LEDS];
    };

    struct strip_stats {
        uint32_t updates;
        size_t n_leds;
    };

    /**
     * @brief The single owner of the strip's color state and of its transport.
     *
     * Every mutation is one transaction under one mutex: mutate a working
     * copy, encode it, transmit it, and only then commit it. A failed
     * transmission leaves the committed state untouched, so `get_state`
     * always describes the last frame that reached the strip.
     *
     * Callers block until the mutex is free. Nothing here may be called from
     * an ISR.
     */
    struct strip {
        constexpr strip(transport &tp, transcode &tc):
            tp(tp),
            tc(tc),
            state(),
            pending()
        {}

        /**
         * @brief Create the mutex and fix the strip length.
         *
         * The committed state starts as all LEDs off. Nothing is transmitted.
         */
        ret_code_t init(size_t n_leds);

        inline bool is_initialized() const
        {
            return state.is_initialized();
        }

        /**
         * @brief Set every LED to one color. Channels are clamped to [0, 255].
         */
        ret_code_t set_all(long r, long g, long b);

        /**
         * @brief Set a single LED. The whole strip is retransmitted.
         *
         * @return `ERROR_LED_INDEX` if `index` is outside [0, n_leds). In that
         *         case nothing is mutated or transmitted.
         */
        ret_code_t set_one(long index, long r, long g, long b);

        /**
         * @brief Copy out the last committed state.
         */
        ret_code_t get_state(strip_state &snapshot);

        strip_stats stats();

        /**
         * @brief Walk a single gray LED of `brightness` down the strip.
         *
         * This holds the strip for the whole sweep. When it ends the committed
         * state is sent again, so the strip shows what `get_state` reports.
         */
        ret_code_t run_startup_sweep(long brightness, uint32_t step_msec);

    protected:
        /* encode and transmit; the caller holds the lock */
        ret_code_t show(strip_state const &frame);

        /* transmit `pending` and commit it to `current` on success */
        ret_code_t commit(strip_state &current);

        transport &tp;
        transcode &tc;
        task::lock<strip_state> state;
        /* working copy, only touched while `state` is held */
        strip_state pending;
    };
}
