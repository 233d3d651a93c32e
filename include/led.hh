#pragma once

#include "prelude.hh"
#include "led/codec.hh"
#include "led/transport.hh"
#include "led/transcode.hh"
#include "led/strip.hh"

namespace led {
    enum class error_kind: uint8_t {
        none,
        validation,
        transport,
        other,
    };

    /* errors raised before any hardware access, with nothing mutated */
    bool is_validation_error(ret_code_t ret);

    /* errors reported by the bus transport */
    bool is_transport_error(ret_code_t ret);

    error_kind classify(ret_code_t ret);

    char const *error_kind_str(error_kind kind);
}
