#pragma once

#include "prelude.hh"
#include "led/strip.hh"

#define CTL_MAX_ARGS 5

namespace ctl {
    /* where replies go, one line at a time, without line terminators */
    struct reply {
        virtual void line(char const *text) = 0;
    };

    /**
     * @brief Accumulates received characters into lines.
     *
     * `\r` is dropped, `\n` ends a line. A line longer than the buffer is
     * discarded up to and including its `\n`.
     */
    struct line_buffer {
        constexpr line_buffer():
            length(0),
            overflow(false),
            buf {}
        {}

        /* returns `true` when `c` completed a non-empty line, see `line()` */
        bool push(char c);

        inline char const *line() const
        {
            return buf;
        }

        inline void reset()
        {
            length = 0;
            overflow = false;
            buf[0] = '\0';
        }

    protected:
        size_t length;
        bool overflow;
        char buf[CTL_LINE_MAX];
    };

    /**
     * @brief Executes one command line against the strip.
     *
     *     SET [r] [g] [b]          SET r=<v> g=<v> b=<v>
     *     WHITE <v>
     *     LED <index> <r> <g> <b>
     *     GET
     *     HEALTH
     *     HELP
     *
     * Channels missing from SET keep their current value. Every command
     * answers `OK`, its data lines, or `ERR <kind> 0x<code>`.
     */
    struct handler {
        constexpr handler(led::strip &strip):
            strip(strip),
            snapshot()
        {}

        ret_code_t handle_line(char const *line, reply &out);

    protected:
        ret_code_t cmd_set(char **argv, size_t argc, reply &out);
        ret_code_t cmd_white(char **argv, size_t argc, reply &out);
        ret_code_t cmd_led(char **argv, size_t argc, reply &out);
        ret_code_t cmd_get(reply &out);
        ret_code_t cmd_health(reply &out);
        ret_code_t cmd_help(reply &out);

        led::strip &strip;
        /* scratch space for GET; too large for a task stack */
        led::strip_state snapshot;
    };
}
