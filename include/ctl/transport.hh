#pragma once

#include "prelude.hh"
#include "stream_buffer.h"

namespace ctl {
    /**
     * @brief Byte link the command console runs over.
     */
    struct transport {
        /* filled with received bytes, usually from an ISR */
        virtual StreamBufferHandle_t received() = 0;

        /* returns once every byte is out, or on error */
        virtual ret_code_t send(char const *data, size_t length) = 0;

        /* start receiving into `received()` */
        virtual ret_code_t start() = 0;
    };
}
