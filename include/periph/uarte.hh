#pragma once

#include "ctl/transport.hh"

namespace uarte {
    struct config {
        uint32_t baud;
        uint32_t rx_pin;
        uint32_t tx_pin;
    };

    /**
     * @brief Console link on one UARTE instance, 8N1 without flow control.
     *
     * Bytes are received one DMA transfer at a time and queued from the
     * interrupt. `send` goes through a RAM bounce buffer, so text in flash is
     * fine to pass.
     */
    struct port: ctl::transport {
        constexpr port(uint8_t instance):
            instance(instance)
        {}

        /* `baud` must be one of the standard rates from 9600 to 1000000 */
        ret_code_t init(config const &cfg);

        StreamBufferHandle_t received() override;

        ret_code_t send(char const *data, size_t length) override;

        ret_code_t start() override;

    protected:
        uint8_t instance;
    };
}
