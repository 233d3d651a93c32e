#pragma once

#include "prelude.hh"
#include "cfg/ids.hh"

namespace cfg {
    /**
     * @brief Persistent store for whole config records, one per `cfg::id`.
     *
     * `read` fails with NRF_ERROR_NOT_FOUND for a record that was never
     * written, whatever the medium reports for it.
     */
    struct backend {
        virtual ret_code_t read(id key, void *data, size_t length) = 0;
        virtual ret_code_t write(id key, void const *data, size_t length) = 0;
    };

    /* fds records in a single file. Calls block, so use them from a task. */
    struct flash_backend: backend {
        /* registers with fds and waits for it to mount; needs the scheduler */
        static ret_code_t init();

        ret_code_t read(id key, void *data, size_t length) override;
        ret_code_t write(id key, void const *data, size_t length) override;
    };
}
