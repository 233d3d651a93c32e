#include "prelude.hh"
#include "periph/spi.hh"

using namespace spi;

transcode_3bit::transcode_3bit(led::frame_buffer &frame, size_t preamble_len):
    led::transcode(frame),
    codec(),
    n_preamble(std::min(preamble_len, (size_t)MAX_PREAMBLE_LEN)),
    acc(0),
    n_acc(0)
{}

size_t transcode_3bit::frame_len(size_t n_leds) const
{
    return frame_len(n_leds, n_preamble);
}

ret_code_t transcode_3bit::set_preamble_len(size_t n)
{
    if (n > MAX_PREAMBLE_LEN) {
        return NRF_ERROR_INVALID_PARAM;
    }

    n_preamble = n;

    return NRF_SUCCESS;
}

void transcode_3bit::clear()
{
    led::transcode::clear();
    acc = 0;
    n_acc = 0;
}

ret_code_t transcode_3bit::write_bus_reset()
{
    return output.append_zeros(n_preamble);
}

ret_code_t transcode_3bit::write(color::rgb const &value)
{
    ret_code_t ret;

    /* WS2812 latches green first */
    ret = write_bits(codec.expand(value.green), led::codec::bits_per_byte);
    VERIFY_SUCCESS(ret);

    ret = write_bits(codec.expand(value.red), led::codec::bits_per_byte);
    VERIFY_SUCCESS(ret);

    return write_bits(codec.expand(value.blue), led::codec::bits_per_byte);
}

ret_code_t transcode_3bit::flush()
{
    if (n_acc == 0) {
        return NRF_SUCCESS;
    }

    /* left-justify what is left, low bits stay zero (idle low) */
    uint8_t last = (uint8_t)(acc << (8 - n_acc));

    ret_code_t ret = output.append(&last, 1);
    VERIFY_SUCCESS(ret);

    acc = 0;
    n_acc = 0;

    return NRF_SUCCESS;
}

ret_code_t transcode_3bit::write_bits(uint32_t bits, size_t n)
{
    dassert(n <= 24);

    uint8_t buf[4];
    size_t nbuf = 0;

    /* at most 7 bits are ever held over, so 31 bits fit in the accumulator */
    acc = (acc << n) | (bits & ((1UL << n) - 1));
    n_acc += n;

    while (n_acc >= 8) {
        n_acc -= 8;
        buf[nbuf++] = (uint8_t)(acc >> n_acc);
    }

    acc &= (1UL << n_acc) - 1;

    return output.append(buf, nbuf);
}
