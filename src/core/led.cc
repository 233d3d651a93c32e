#include "prelude.hh"
#include "led.hh"

bool led::is_validation_error(ret_code_t ret)
{
    return ret > ERROR_VALIDATION_BASE && ret < ERROR_VALIDATION_END;
}

bool led::is_transport_error(ret_code_t ret)
{
    return ret > ERROR_TRANSPORT_BASE && ret < ERROR_TRANSPORT_END;
}

led::error_kind led::classify(ret_code_t ret)
{
    if (ret == NRF_SUCCESS)
        return error_kind::none;
    if (is_validation_error(ret))
        return error_kind::validation;
    if (is_transport_error(ret))
        return error_kind::transport;
    return error_kind::other;
}

char const *led::error_kind_str(error_kind kind)
{
    switch (kind) {
    case error_kind::none: return "none";
    case error_kind::validation: return "validation";
    case error_kind::transport: return "transport";
    case error_kind::other: return "internal";
    }
    unreachable();
}
