#include "prelude.hh"
#include "led/codec.hh"

using namespace led;

codec::codec()
{
    for (size_t i = 0; i <= UINT8_MAX; ++i) {
        table[i] = compute(static_cast<uint8_t>(i));
    }
}

uint32_t codec::compute(uint8_t value)
{
    uint32_t bits = 0;

    for (int i = symbols_per_byte - 1; i >= 0; --i) {
        bits <<= bits_per_symbol;
        bits |= (value & (1 << i)) ? symbol_one : symbol_zero;
    }

    return bits;
}
