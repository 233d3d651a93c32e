#include "led/frame.hh"

using namespace led;

ret_code_t frame_buffer::append(uint8_t const *bytes, size_t n)
{
    if (n == 0)
        return NRF_SUCCESS;

    if (!bytes)
        return NRF_ERROR_NULL;

    if (n > n_capacity - n_used)
        return NRF_ERROR_INVALID_LENGTH;

    memcpy(storage + n_used, bytes, n);
    n_used += n;

    return NRF_SUCCESS;
}

ret_code_t frame_buffer::append_zeros(size_t n)
{
    if (n > n_capacity - n_used)
        return NRF_ERROR_INVALID_LENGTH;

    memset(storage + n_used, 0, n);
    n_used += n;

    return NRF_SUCCESS;
}
