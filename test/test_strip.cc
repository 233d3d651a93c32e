#include <unity.h>
#include "prelude.hh"
#include "led.hh"
#include "periph/spi.hh"
#include "semphr.h"
#include "mock_transport.hh"
#include "wire.hh"

#define N_LEDS 8
#define PREAMBLE_LEN 3

static uint8_t m_mem[spi::transcode_3bit::frame_len(MAX_STRIP_LEDS, MAX_PREAMBLE_LEN)];
static led::frame_buffer m_buf(m_mem, sizeof(m_mem));
static test::mock_transport m_tp;
static spi::transcode_3bit m_tc(m_buf, PREAMBLE_LEN);
static led::strip m_strip(m_tp, m_tc);
static led::strip_state m_state;
static led::strip_state m_other;

static void fresh_strip()
{
    m_tp.reset();
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.init(N_LEDS));
}

static void assert_last_frame_matches(led::strip_state const &state)
{
    TEST_ASSERT_TRUE(m_tp.n_transmits() > 0);

    auto const expected = test::frame_for(state, PREAMBLE_LEN);
    auto const &last = m_tp.last();

    TEST_ASSERT_EQUAL(expected.size(), last.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected.data(), last.data(), expected.size());
}

static void assert_uniform(led::strip_state const &state, color::rgb const &c)
{
    TEST_ASSERT_TRUE(state.uniform);
    TEST_ASSERT_TRUE(state.uniform_color == c);
    for (size_t i = 0; i < state.n_leds; ++i) {
        TEST_ASSERT_TRUE(state.leds[i] == c);
    }
}

static void test_starts_dark_without_transmitting()
{
    fresh_strip();

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    TEST_ASSERT_EQUAL(N_LEDS, m_state.n_leds);
    TEST_ASSERT_EQUAL(0, m_state.updates);
    assert_uniform(m_state, color::rgb(color::BLACK));
    TEST_ASSERT_EQUAL(0, m_tp.n_transmits());
}

static void test_set_all_clamps_and_transmits()
{
    fresh_strip();

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(-10, 300, 128));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));

    assert_uniform(m_state, color::rgb(0, 255, 128));
    TEST_ASSERT_EQUAL(1, m_tp.n_transmits());
    assert_last_frame_matches(m_state);
    TEST_ASSERT_EQUAL(PREAMBLE_LEN + 9 * N_LEDS, m_tp.last().size());
}

static void test_set_one_round_trip()
{
    fresh_strip();

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_one(5, 10, 20, 30));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));

    TEST_ASSERT_FALSE(m_state.uniform);
    for (size_t i = 0; i < N_LEDS; ++i) {
        auto const expected = i == 5 ? color::rgb(10, 20, 30) : color::rgb(color::BLACK);
        TEST_ASSERT_TRUE(m_state.leds[i] == expected);
    }

    auto const led = test::led_bytes(color::rgb(10, 20, 30));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(led.data(), &m_tp.last()[PREAMBLE_LEN + 9 * 5], 9);
    assert_last_frame_matches(m_state);
}

static void test_set_one_clamps()
{
    fresh_strip();

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_one(0, 1000, -1, 7));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    TEST_ASSERT_TRUE(m_state.leds[0] == color::rgb(255, 0, 7));
}

static void test_set_one_rejects_bad_index()
{
    fresh_strip();
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(1, 2, 3));
    auto const sent = m_tp.n_transmits();

    long const bad[] = { N_LEDS, N_LEDS + 1, -1, -1000 };
    for (auto index : bad) {
        auto const ret = m_strip.set_one(index, 9, 9, 9);
        TEST_ASSERT_EQUAL_HEX32(ERROR_LED_INDEX, ret);
        TEST_ASSERT_TRUE(led::is_validation_error(ret));
        TEST_ASSERT_FALSE(led::is_transport_error(ret));
    }

    TEST_ASSERT_EQUAL(sent, m_tp.n_transmits());
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    assert_uniform(m_state, color::rgb(1, 2, 3));
    TEST_ASSERT_EQUAL(1, m_state.updates);
}

static void test_transport_failure_keeps_committed_state()
{
    fresh_strip();
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(5, 5, 5));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_other));

    m_tp.fail_with = ERROR_TRANSPORT_XFER;

    auto ret = m_strip.set_all(9, 9, 9);
    TEST_ASSERT_EQUAL_HEX32(ERROR_TRANSPORT_XFER, ret);
    TEST_ASSERT_TRUE(led::is_transport_error(ret));
    TEST_ASSERT_FALSE(led::is_validation_error(ret));

    ret = m_strip.set_one(2, 9, 9, 9);
    TEST_ASSERT_EQUAL_HEX32(ERROR_TRANSPORT_XFER, ret);

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    assert_uniform(m_state, color::rgb(5, 5, 5));
    TEST_ASSERT_EQUAL(m_other.updates, m_state.updates);

    m_tp.fail_with = NRF_SUCCESS;
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(9, 9, 9));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    assert_uniform(m_state, color::rgb(9, 9, 9));
    TEST_ASSERT_EQUAL(m_other.updates + 1, m_state.updates);
}

static void test_closed_transport_is_a_transport_error()
{
    fresh_strip();
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_tp.close());

    auto const ret = m_strip.set_all(1, 1, 1);
    TEST_ASSERT_EQUAL_HEX32(ERROR_TRANSPORT_CLOSED, ret);
    TEST_ASSERT_TRUE(led::classify(ret) == led::error_kind::transport);

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    assert_uniform(m_state, color::rgb(color::BLACK));
    TEST_ASSERT_EQUAL_HEX32(ERROR_TRANSPORT_CLOSED, m_tp.close());
}

static void test_set_all_is_idempotent()
{
    fresh_strip();

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(7, 8, 9));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_other));
    auto const first = m_tp.last();

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(7, 8, 9));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));

    TEST_ASSERT_EQUAL(first.size(), m_tp.last().size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(first.data(), m_tp.last().data(), first.size());
    assert_uniform(m_state, m_other.uniform_color);
}

static void test_updates_count_commits_only()
{
    fresh_strip();

    TEST_ASSERT_EQUAL(0, m_strip.stats().updates);
    TEST_ASSERT_EQUAL(N_LEDS, m_strip.stats().n_leds);

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(1, 1, 1));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_one(0, 2, 2, 2));
    TEST_ASSERT_EQUAL_HEX32(ERROR_LED_INDEX, m_strip.set_one(N_LEDS, 2, 2, 2));
    m_tp.fail_with = ERROR_TRANSPORT_XFER;
    TEST_ASSERT_EQUAL_HEX32(ERROR_TRANSPORT_XFER, m_strip.set_all(3, 3, 3));

    TEST_ASSERT_EQUAL(2, m_strip.stats().updates);
}

static void test_set_all_after_set_one_is_uniform_again()
{
    fresh_strip();

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_one(3, 1, 2, 3));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(4, 5, 6));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    assert_uniform(m_state, color::rgb(4, 5, 6));
}

static void test_startup_sweep_walks_the_strip()
{
    fresh_strip();
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.set_all(1, 1, 1));
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_other));
    auto const before = m_tp.n_transmits();

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.run_startup_sweep(300, 0));

    /* one frame per LED, then the committed state again */
    TEST_ASSERT_EQUAL(before + N_LEDS + 1, m_tp.n_transmits());

    for (size_t step = 0; step < N_LEDS; ++step) {
        m_state.n_leds = N_LEDS;
        for (size_t i = 0; i < N_LEDS; ++i) {
            m_state.leds[i] = i == step ? color::rgb::gray(255) : color::rgb(color::BLACK);
        }

        auto const expected = test::frame_for(m_state, PREAMBLE_LEN);
        auto const &frame = m_tp.frames[before + step];
        TEST_ASSERT_EQUAL(expected.size(), frame.size());
        TEST_ASSERT_EQUAL_HEX8_ARRAY(expected.data(), frame.data(), expected.size());
    }

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    assert_uniform(m_state, color::rgb(1, 1, 1));
    TEST_ASSERT_EQUAL(m_other.updates, m_state.updates);
    assert_last_frame_matches(m_state);
}

static void test_startup_sweep_reports_transport_failure()
{
    fresh_strip();
    m_tp.fail_with = ERROR_TRANSPORT_XFER;

    TEST_ASSERT_EQUAL_HEX32(ERROR_TRANSPORT_XFER, m_strip.run_startup_sweep(64, 0));
    TEST_ASSERT_EQUAL(0, m_tp.n_transmits());
    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    assert_uniform(m_state, color::rgb(color::BLACK));
}

static void test_init_rejects_bad_lengths()
{
    static uint8_t small[spi::transcode_3bit::frame_len(2, PREAMBLE_LEN)];
    auto buf = led::frame_buffer(small, sizeof(small));
    auto tc = spi::transcode_3bit(buf, PREAMBLE_LEN);
    auto strip = led::strip(m_tp, tc);

    TEST_ASSERT_EQUAL(NRF_ERROR_INVALID_PARAM, m_strip.init(0));
    TEST_ASSERT_EQUAL(NRF_ERROR_INVALID_PARAM, m_strip.init(MAX_STRIP_LEDS + 1));

    TEST_ASSERT_EQUAL(NRF_ERROR_NO_MEM, strip.init(3));
    TEST_ASSERT_FALSE(strip.is_initialized());
    TEST_ASSERT_EQUAL(NRF_SUCCESS, strip.init(2));
}

static void test_uninitialized_strip_refuses_work()
{
    auto buf = led::frame_buffer(m_mem, sizeof(m_mem));
    auto tc = spi::transcode_3bit(buf, PREAMBLE_LEN);
    auto strip = led::strip(m_tp, tc);

    m_tp.reset();
    TEST_ASSERT_EQUAL(NRF_ERROR_INVALID_STATE, strip.set_all(1, 1, 1));
    TEST_ASSERT_EQUAL(NRF_ERROR_INVALID_STATE, strip.set_one(0, 1, 1, 1));
    TEST_ASSERT_EQUAL(NRF_ERROR_INVALID_STATE, strip.get_state(m_state));
    TEST_ASSERT_EQUAL(NRF_ERROR_INVALID_STATE, strip.run_startup_sweep(64, 0));
    TEST_ASSERT_EQUAL(0, m_tp.n_transmits());
}

struct contender {
    long index;
    long r, g, b;
    ret_code_t result;
    SemaphoreHandle_t done;
};

static void contender_task(void *arg)
{
    auto c = (contender*)arg;

    if (c->index < 0) {
        c->result = m_strip.set_all(c->r, c->g, c->b);
    } else {
        c->result = m_strip.set_one(c->index, c->r, c->g, c->b);
    }

    xSemaphoreGive(c->done);
    vTaskDelete(nullptr);
}

static void race(contender &a, contender &b)
{
    auto done = xSemaphoreCreateCounting(2, 0);
    TEST_ASSERT_NOT_NULL(done);
    a.done = done;
    b.done = done;

    m_tp.delay_ticks = 5;

    TEST_ASSERT_EQUAL(pdPASS, xTaskCreate(contender_task, "A", configMINIMAL_STACK_SIZE * 2, &a, tskIDLE_PRIORITY + 1, nullptr));
    TEST_ASSERT_EQUAL(pdPASS, xTaskCreate(contender_task, "B", configMINIMAL_STACK_SIZE * 2, &b, tskIDLE_PRIORITY + 1, nullptr));

    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(done, pdMS_TO_TICKS(2000)));
    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(done, pdMS_TO_TICKS(2000)));
    vSemaphoreDelete(done);

    m_tp.delay_ticks = 0;
}

static void test_concurrent_set_all_commits_one_color()
{
    fresh_strip();

    auto a = contender { -1, 10, 0, 0, NRF_ERROR_INTERNAL, nullptr };
    auto b = contender { -1, 0, 0, 10, NRF_ERROR_INTERNAL, nullptr };
    race(a, b);

    TEST_ASSERT_EQUAL(NRF_SUCCESS, a.result);
    TEST_ASSERT_EQUAL(NRF_SUCCESS, b.result);
    TEST_ASSERT_FALSE(m_tp.overlap);
    TEST_ASSERT_EQUAL(2, m_tp.n_transmits());

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    TEST_ASSERT_TRUE(m_state.uniform);
    TEST_ASSERT_TRUE(m_state.uniform_color == color::rgb(10, 0, 0) || m_state.uniform_color == color::rgb(0, 0, 10));
    assert_uniform(m_state, m_state.uniform_color);
    TEST_ASSERT_EQUAL(2, m_state.updates);
    assert_last_frame_matches(m_state);
}

static void test_concurrent_set_one_and_set_all_serialize()
{
    fresh_strip();

    auto a = contender { 3, 50, 60, 70, NRF_ERROR_INTERNAL, nullptr };
    auto b = contender { -1, 1, 2, 3, NRF_ERROR_INTERNAL, nullptr };
    race(a, b);

    TEST_ASSERT_EQUAL(NRF_SUCCESS, a.result);
    TEST_ASSERT_EQUAL(NRF_SUCCESS, b.result);
    TEST_ASSERT_FALSE(m_tp.overlap);

    TEST_ASSERT_EQUAL(NRF_SUCCESS, m_strip.get_state(m_state));
    for (size_t i = 0; i < N_LEDS; ++i) {
        if (i != 3) {
            TEST_ASSERT_TRUE(m_state.leds[i] == color::rgb(1, 2, 3));
        }
    }
    /* either order is fine, but LED 3 must agree with the uniform flag */
    if (m_state.uniform) {
        TEST_ASSERT_TRUE(m_state.leds[3] == color::rgb(1, 2, 3));
    } else {
        TEST_ASSERT_TRUE(m_state.leds[3] == color::rgb(50, 60, 70));
    }
    assert_last_frame_matches(m_state);
}

void run_strip_tests()
{
    RUN_TEST(test_starts_dark_without_transmitting);
    RUN_TEST(test_set_all_clamps_and_transmits);
    RUN_TEST(test_set_one_round_trip);
    RUN_TEST(test_set_one_clamps);
    RUN_TEST(test_set_one_rejects_bad_index);
    RUN_TEST(test_transport_failure_keeps_committed_state);
    RUN_TEST(test_closed_transport_is_a_transport_error);
    RUN_TEST(test_set_all_is_idempotent);
    RUN_TEST(test_updates_count_commits_only);
    RUN_TEST(test_set_all_after_set_one_is_uniform_again);
    RUN_TEST(test_startup_sweep_walks_the_strip);
    RUN_TEST(test_startup_sweep_reports_transport_failure);
    RUN_TEST(test_init_rejects_bad_lengths);
    RUN_TEST(test_uninitialized_strip_refuses_work);
    RUN_TEST(test_concurrent_set_all_commits_one_color);
    RUN_TEST(test_concurrent_set_one_and_set_all_serialize);
}
