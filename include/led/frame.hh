#pragma once

#include "prelude.hh"

namespace led {
    /**
     * @brief Fixed-size byte store a frame is encoded into before transmission.
     *
     * The storage belongs to the caller. A whole frame is too big for a task
     * stack, so it is usually a static array (EasyDMA needs it in RAM anyway).
     */
    struct frame_buffer {
        constexpr frame_buffer(uint8_t *storage, size_t capacity):
            storage(storage),
            n_used(0),
            n_capacity(capacity)
        {}

        inline uint8_t const *data() const
        {
            return storage;
        }

        inline size_t size() const
        {
            return n_used;
        }

        inline size_t capacity() const
        {
            return n_capacity;
        }

        inline void clear()
        {
            n_used = 0;
        }

        /* NRF_ERROR_INVALID_LENGTH if `n` bytes don't fit; nothing is stored then */
        ret_code_t append(uint8_t const *bytes, size_t n);

        ret_code_t append_zeros(size_t n);

    protected:
        uint8_t *storage;
        size_t n_used;
        size_t n_capacity;
    };
}
