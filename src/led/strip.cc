#define NRF_LOG_MODULE_NAME strip
#include "prelude.hh"
#include "led.hh"
#include "led/strip.hh"
NRF_LOG_MODULE_REGISTER();

using namespace led;

void strip_state::fill(color::rgb value)
{
    uniform = true;
    uniform_color = value;
    for (size_t i = 0; i < n_leds; ++i) {
        leds[i] = value;
    }
}

ret_code_t strip::init(size_t n_leds)
{
    if (n_leds == 0 || n_leds > MAX_STRIP_LEDS) {
        return NRF_ERROR_INVALID_PARAM;
    }

    if (tc.frame_len(n_leds) > tc.frame().capacity()) {
        NRF_LOG_ERROR("%u LEDs need %u frame bytes, have %u", n_leds, tc.frame_len(n_leds), tc.frame().capacity());
        return NRF_ERROR_NO_MEM;
    }

    ret_code_t ret = state.init();
    VERIFY_SUCCESS(ret);

    auto guard = state.take(portMAX_DELAY);
    if (!guard) {
        return NRF_ERROR_BUSY;
    }

    auto &current = *guard;
    current.n_leds = n_leds;
    current.updates = 0;
    current.fill(color::rgb(color::BLACK));

    return NRF_SUCCESS;
}

ret_code_t strip::set_all(long r, long g, long b)
{
    if (!is_initialized()) {
        return NRF_ERROR_INVALID_STATE;
    }

    auto const value = color::rgb::clamped(r, g, b);

    auto guard = state.take(portMAX_DELAY);
    if (!guard) {
        return NRF_ERROR_BUSY;
    }

    auto &current = *guard;
    pending = current;
    pending.fill(value);

    return commit(current);
}

ret_code_t strip::set_one(long index, long r, long g, long b)
{
    if (!is_initialized()) {
        return NRF_ERROR_INVALID_STATE;
    }

    auto const value = color::rgb::clamped(r, g, b);

    auto guard = state.take(portMAX_DELAY);
    if (!guard) {
        return NRF_ERROR_BUSY;
    }

    auto &current = *guard;

    if (index < 0 || static_cast<size_t>(index) >= current.n_leds) {
        return ERROR_LED_INDEX;
    }

    pending = current;
    pending.leds[index] = value;
    pending.uniform = false;

    return commit(current);
}

ret_code_t strip::get_state(strip_state &snapshot)
{
    if (!is_initialized()) {
        return NRF_ERROR_INVALID_STATE;
    }

    auto guard = state.take(portMAX_DELAY);
    if (!guard) {
        return NRF_ERROR_BUSY;
    }

    snapshot = *guard;

    return NRF_SUCCESS;
}

strip_stats strip::stats()
{
    auto result = strip_stats { 0, 0 };

    if (!is_initialized()) {
        return result;
    }

    if (auto guard = state.take(portMAX_DELAY)) {
        result.updates = guard->updates;
        result.n_leds = guard->n_leds;
    }

    return result;
}

ret_code_t strip::run_startup_sweep(long brightness, uint32_t step_msec)
{
    if (!is_initialized()) {
        return NRF_ERROR_INVALID_STATE;
    }

    auto const on = color::rgb::gray(color::clamp(brightness));
    auto const off = color::rgb(color::BLACK);
    ret_code_t ret = NRF_SUCCESS;

    auto guard = state.take(portMAX_DELAY);
    if (!guard) {
        return NRF_ERROR_BUSY;
    }

    auto &current = *guard;
    pending = current;
    pending.fill(off);
    pending.uniform = false;

    for (size_t i = 0; i < pending.n_leds; ++i) {
        if (i > 0) {
            pending.leds[i - 1] = off;
        }
        pending.leds[i] = on;

        ret = show(pending);
        if (ret != NRF_SUCCESS) {
            NRF_LOG_WARNING("Sweep stopped at LED %u: 0x%x", i, ret);
            break;
        }

        vTaskDelay(pdMS_TO_TICKS(step_msec));
    }

    auto const restored = show(current);
    if (restored != NRF_SUCCESS) {
        NRF_LOG_WARNING("Restoring strip after sweep: 0x%x", restored);
    }

    return ret != NRF_SUCCESS ? ret : restored;
}

ret_code_t strip::show(strip_state const &frame)
{
    ret_code_t ret;

    tc.clear();

    ret = tc.write_bus_reset();
    VERIFY_SUCCESS(ret);

    for (size_t i = 0; i < frame.n_leds; ++i) {
        ret = tc.write(frame.leds[i]);
        VERIFY_SUCCESS(ret);
    }

    ret = tc.flush();
    VERIFY_SUCCESS(ret);

    return tp.transmit(tc.frame().data(), tc.frame().size());
}

ret_code_t strip::commit(strip_state &current)
{
    ret_code_t ret = show(pending);
    if (ret != NRF_SUCCESS) {
        NRF_LOG_WARNING("Transmit failed (0x%x), keeping previous state", ret);
        return ret;
    }

    pending.updates = current.updates + 1;
    current = pending;

    return NRF_SUCCESS;
}
