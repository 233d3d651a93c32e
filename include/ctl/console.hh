#pragma once

#include "prelude.hh"
#include "ctl/command.hh"
#include "ctl/transport.hh"

namespace ctl {
    /**
     * @brief Task that reads command lines from a transport and answers on it.
     *
     * Prints `READY` once receiving, then handles one line at a time, so
     * replies to a command always precede the next command's.
     */
    struct console: reply {
        constexpr console(transport &link, handler &commands):
            handle(nullptr),
            link(link),
            commands(commands),
            lines()
        {}

        ret_code_t init(char const *name);

        void line(char const *text) override;

    protected:
        static void task_func(void *context);
        void run();

        TaskHandle_t handle;
        transport &link;
        handler &commands;
        line_buffer lines;
    };
}
