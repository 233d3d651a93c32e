#include "prelude.hh"
#include "color.hh"

using namespace color;

rgb::rgb(uint8_t r, uint8_t g, uint8_t b):
    red(r),
    green(g),
    blue(b)
{}

rgb rgb::clamped(long r, long g, long b)
{
    return rgb(clamp(r), clamp(g), clamp(b));
}
