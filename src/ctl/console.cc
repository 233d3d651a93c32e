#define NRF_LOG_MODULE_NAME console
#include "prelude.hh"
#include "ctl/console.hh"
#include "task.hh"
#include "stream_buffer.h"
NRF_LOG_MODULE_REGISTER();

using namespace ctl;

#define RX_CHUNK_LEN 16
#define CONSOLE_STACK_WORDS 384

ret_code_t console::init(char const *name)
{
    return task::spawn(task_func, name, CONSOLE_STACK_WORDS, this, task::PRIORITY_CONTROL, &handle);
}

void console::line(char const *text)
{
    static char const eol[] = "\r\n";

    ret_code_t ret = link.send(text, strlen(text));
    if (ret == NRF_SUCCESS) {
        ret = link.send(eol, sizeof(eol) - 1);
    }

    if (ret != NRF_SUCCESS) {
        NRF_LOG_WARNING("Reply dropped: 0x%x", ret);
    }
}

void console::task_func(void *context)
{
    static_cast<console*>(context)->run();
}

void console::run()
{
    uint8_t chunk[RX_CHUNK_LEN];

    ret_code_t const ret = link.start();
    APP_ERROR_CHECK(ret);

    line("READY");

    for (;;) {
        size_t const n = xStreamBufferReceive(link.received(), chunk, sizeof(chunk), portMAX_DELAY);

        for (size_t i = 0; i < n; ++i) {
            if (!lines.push((char)chunk[i]))
                continue;

            /* the outcome already went out as OK or ERR */
            ret_code_t const handled = commands.handle_line(lines.line(), *this);
            if (handled != NRF_SUCCESS) {
                NRF_LOG_DEBUG("Command rejected: 0x%x", handled);
            }
        }
    }
}
