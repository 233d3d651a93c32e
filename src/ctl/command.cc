#define NRF_LOG_MODULE_NAME ctl
#include "prelude.hh"
#include "ctl/command.hh"
#include "led.hh"
#include "systime.hh"
#include <stdio.h>
#include <stdlib.h>
#include <ctype.h>
NRF_LOG_MODULE_REGISTER();

using namespace ctl;

#define REPLY_LEN 96

static bool parse_long(char const *text, long &value);
static bool streq_nocase(char const *a, char const *b);
static ret_code_t reply_status(ret_code_t ret, reply &out);

bool line_buffer::push(char c)
{
    if (c == '\r')
        return false;

    if (c == '\n') {
        bool const complete = !overflow && length > 0;
        if (!complete) {
            reset();
        } else {
            buf[length] = '\0';
            length = 0;
        }
        overflow = false;
        return complete;
    }

    if (overflow)
        return false;

    if (length + 1 >= sizeof(buf)) {
        NRF_LOG_WARNING("Command line too long, discarding");
        overflow = true;
        length = 0;
        return false;
    }

    buf[length++] = c;
    return false;
}

ret_code_t handler::handle_line(char const *line, reply &out)
{
    if (!line)
        return NRF_ERROR_NULL;

    char tokens[CTL_LINE_MAX];
    char *argv[CTL_MAX_ARGS + 1];
    size_t argc = 0;
    char *save = nullptr;

    strncpy(tokens, line, sizeof(tokens) - 1);
    tokens[sizeof(tokens) - 1] = '\0';

    for (char *tok = strtok_r(tokens, " \t", &save); tok; tok = strtok_r(nullptr, " \t", &save)) {
        if (argc == CTL_MAX_ARGS + 1) {
            return reply_status(ERROR_BAD_ARGUMENT, out);
        }
        argv[argc++] = tok;
    }

    if (argc == 0) {
        return NRF_SUCCESS;
    }

    auto const cmd = argv[0];
    NRF_LOG_DEBUG("Command %s, %u args", NRF_LOG_PUSH(cmd), argc - 1);

    if (streq_nocase(cmd, "SET"))
        return cmd_set(argv + 1, argc - 1, out);
    if (streq_nocase(cmd, "WHITE"))
        return cmd_white(argv + 1, argc - 1, out);
    if (streq_nocase(cmd, "LED"))
        return cmd_led(argv + 1, argc - 1, out);

    bool const no_args = argc == 1;

    if (streq_nocase(cmd, "GET"))
        return no_args ? cmd_get(out) : reply_status(ERROR_BAD_ARGUMENT, out);
    if (streq_nocase(cmd, "HEALTH"))
        return no_args ? cmd_health(out) : reply_status(ERROR_BAD_ARGUMENT, out);
    if (streq_nocase(cmd, "HELP"))
        return no_args ? cmd_help(out) : reply_status(ERROR_BAD_ARGUMENT, out);

    return reply_status(ERROR_BAD_COMMAND, out);
}

ret_code_t handler::cmd_set(char **argv, size_t argc, reply &out)
{
    if (argc > 3) {
        return reply_status(ERROR_BAD_ARGUMENT, out);
    }

    ret_code_t ret = strip.get_state(snapshot);
    if (ret != NRF_SUCCESS) {
        return reply_status(ret, out);
    }

    auto const &base = snapshot.uniform || snapshot.n_leds == 0 ? snapshot.uniform_color : snapshot.leds[0];
    long channels[3] = { base.red, base.green, base.blue };

    for (size_t i = 0; i < argc; ++i) {
        auto arg = argv[i];
        size_t slot = i;

        if (arg[0] != '\0' && arg[1] == '=') {
            switch (tolower((unsigned char)arg[0])) {
            case 'r': slot = 0; break;
            case 'g': slot = 1; break;
            case 'b': slot = 2; break;
            default: return reply_status(ERROR_BAD_ARGUMENT, out);
            }
            arg += 2;
        }

        if (!parse_long(arg, channels[slot])) {
            return reply_status(ERROR_BAD_ARGUMENT, out);
        }
    }

    ret = strip.set_all(channels[0], channels[1], channels[2]);
    return reply_status(ret, out);
}

ret_code_t handler::cmd_white(char **argv, size_t argc, reply &out)
{
    long value;

    if (argc != 1 || !parse_long(argv[0], value)) {
        return reply_status(ERROR_BAD_ARGUMENT, out);
    }

    return reply_status(strip.set_all(value, value, value), out);
}

ret_code_t handler::cmd_led(char **argv, size_t argc, reply &out)
{
    long values[4];

    if (argc != 4) {
        return reply_status(ERROR_BAD_ARGUMENT, out);
    }

    for (size_t i = 0; i < 4; ++i) {
        if (!parse_long(argv[i], values[i])) {
            return reply_status(ERROR_BAD_ARGUMENT, out);
        }
    }

    return reply_status(strip.set_one(values[0], values[1], values[2], values[3]), out);
}

ret_code_t handler::cmd_get(reply &out)
{
    char text[REPLY_LEN];

    ret_code_t ret = strip.get_state(snapshot);
    if (ret != NRF_SUCCESS) {
        return reply_status(ret, out);
    }

    if (snapshot.uniform) {
        auto const &c = snapshot.uniform_color;
        snprintf(text, sizeof(text), "COLOR %u %u %u", c.red, c.green, c.blue);
        out.line(text);
        return NRF_SUCCESS;
    }

    snprintf(text, sizeof(text), "LEDS %u", (unsigned)snapshot.n_leds);
    out.line(text);

    for (size_t i = 0; i < snapshot.n_leds; ++i) {
        auto const &c = snapshot.leds[i];
        snprintf(text, sizeof(text), "LED %u %u %u %u", (unsigned)i, c.red, c.green, c.blue);
        out.line(text);
    }

    return NRF_SUCCESS;
}

ret_code_t handler::cmd_health(reply &out)
{
    char text[REPLY_LEN];
    char color_text[16];

    ret_code_t ret = strip.get_state(snapshot);
    if (ret != NRF_SUCCESS) {
        return reply_status(ret, out);
    }

    if (snapshot.uniform) {
        auto const &c = snapshot.uniform_color;
        snprintf(color_text, sizeof(color_text), "%u,%u,%u", c.red, c.green, c.blue);
    } else {
        strcpy(color_text, "mixed");
    }

    snprintf(text, sizeof(text), "HEALTH uptime_ms=%lu updates=%lu leds=%u color=%s heap=%u",
        (unsigned long)systime::msecs(),
        (unsigned long)snapshot.updates,
        (unsigned)snapshot.n_leds,
        color_text,
        (unsigned)xPortGetFreeHeapSize());
    out.line(text);

    return NRF_SUCCESS;
}

ret_code_t handler::cmd_help(reply &out)
{
    static char const *const lines[] = {
        "SET [r] [g] [b] | SET r=<v> g=<v> b=<v>",
        "WHITE <v>",
        "LED <index> <r> <g> <b>",
        "GET",
        "HEALTH",
        "HELP",
    };

    for (auto text : lines) {
        out.line(text);
    }

    return NRF_SUCCESS;
}

static ret_code_t reply_status(ret_code_t ret, reply &out)
{
    char text[REPLY_LEN];

    if (ret == NRF_SUCCESS) {
        out.line("OK");
        return ret;
    }

    auto const kind = led::classify(ret);
    if (kind == led::error_kind::other) {
        NRF_LOG_ERROR("Command failed: 0x%x", ret);
    }

    snprintf(text, sizeof(text), "ERR %s 0x%lx", led::error_kind_str(kind), (unsigned long)ret);
    out.line(text);

    return ret;
}

static bool parse_long(char const *text, long &value)
{
    char *end = nullptr;

    if (!text || *text == '\0')
        return false;

    auto const parsed = strtol(text, &end, 10);
    if (*end != '\0')
        return false;

    value = parsed;
    return true;
}

static bool streq_nocase(char const *a, char const *b)
{
    for (; *a && *b; ++a, ++b) {
        if (toupper((unsigned char)*a) != toupper((unsigned char)*b))
            return false;
    }
    return *a == *b;
}
