#define NRF_LOG_MODULE_NAME flash
#include "prelude.hh"
#include "cfg.hh"
#include "task.hh"
#include "fds.h"
#include "semphr.h"
NRF_LOG_MODULE_REGISTER();

using namespace cfg;

#define CFG_FILE_ID 0x5C01
#define OP_TIMEOUT_MSEC 2000
#define NO_SPACE_RETRIES 2

namespace {
    struct flash_context {
        SemaphoreHandle_t op_done;
        SemaphoreHandle_t op_lock;
        volatile ret_code_t op_result;
        volatile bool mounted;
    };
}

static flash_context m_ctx = { nullptr, nullptr, NRF_SUCCESS, false };

static void fds_evt_handler(fds_evt_t const *event);
static void signal_done(ret_code_t result);
static ret_code_t store_record(id key, void const *data, size_t length);

ret_code_t flash_backend::init()
{
    ret_code_t ret;

    if (m_ctx.mounted)
        return NRF_SUCCESS;

    m_ctx.op_done = xSemaphoreCreateBinary();
    m_ctx.op_lock = xSemaphoreCreateMutex();
    if (!m_ctx.op_done || !m_ctx.op_lock)
        return NRF_ERROR_NO_MEM;

    ret = fds_register(fds_evt_handler);
    VERIFY_SUCCESS(ret);

    ret = fds_init();
    VERIFY_SUCCESS(ret);

    if (!xSemaphoreTake(m_ctx.op_done, pdMS_TO_TICKS(OP_TIMEOUT_MSEC))) {
        NRF_LOG_ERROR("fds did not mount");
        return NRF_ERROR_TIMEOUT;
    }
    VERIFY_SUCCESS(m_ctx.op_result);

    m_ctx.mounted = true;
    NRF_LOG_DEBUG("Config store mounted");

    return NRF_SUCCESS;
}

ret_code_t flash_backend::read(id key, void *data, size_t length)
{
    if (!data)
        return NRF_ERROR_NULL;
    if (!m_ctx.mounted)
        return NRF_ERROR_INVALID_STATE;

    ret_code_t ret;
    auto desc = fds_record_desc_t {};
    auto token = fds_find_token_t {};
    auto record = fds_flash_record_t {};

    ret = fds_record_find(CFG_FILE_ID, (uint16_t)key, &desc, &token);
    if (ret == FDS_ERR_NOT_FOUND)
        return NRF_ERROR_NOT_FOUND;
    VERIFY_SUCCESS(ret);

    ret = fds_record_open(&desc, &record);
    VERIFY_SUCCESS(ret);

    /* a shorter record from an older layout reads as zero-extended */
    size_t const stored = record.p_header->length_words * sizeof(uint32_t);
    size_t const n = std::min(stored, length);
    memcpy(data, record.p_data, n);
    memset((uint8_t*)data + n, 0, length - n);

    return fds_record_close(&desc);
}

ret_code_t flash_backend::write(id key, void const *data, size_t length)
{
    if (!data)
        return NRF_ERROR_NULL;
    if (length % sizeof(uint32_t) != 0)
        return NRF_ERROR_INVALID_LENGTH;
    if (!m_ctx.mounted)
        return NRF_ERROR_INVALID_STATE;

    xSemaphoreTake(m_ctx.op_lock, portMAX_DELAY);

    ret_code_t ret = store_record(key, data, length);
    for (int retry = 0; ret == FDS_ERR_NO_SPACE_IN_FLASH && retry < NO_SPACE_RETRIES; ++retry) {
        NRF_LOG_WARNING("No room for %s record, compacting", id_name(key));
        task::schedule_fds_gc();
        vTaskDelay(pdMS_TO_TICKS(OP_TIMEOUT_MSEC));
        ret = store_record(key, data, length);
    }

    xSemaphoreGive(m_ctx.op_lock);

    return ret;
}

/* write or update the record, then wait for fds to report the result */
static ret_code_t store_record(id key, void const *data, size_t length)
{
    ret_code_t ret;
    auto desc = fds_record_desc_t {};
    auto token = fds_find_token_t {};
    auto record = fds_record_t {};

    record.file_id = CFG_FILE_ID;
    record.key = (uint16_t)key;
    record.data.p_data = data;
    record.data.length_words = length / sizeof(uint32_t);

    ret = fds_record_find(CFG_FILE_ID, (uint16_t)key, &desc, &token);
    if (ret == FDS_ERR_NOT_FOUND) {
        ret = fds_record_write(&desc, &record);
    } else if (ret == NRF_SUCCESS) {
        ret = fds_record_update(&desc, &record);
    }
    VERIFY_SUCCESS(ret);

    if (!xSemaphoreTake(m_ctx.op_done, pdMS_TO_TICKS(OP_TIMEOUT_MSEC)))
        return NRF_ERROR_TIMEOUT;

    return m_ctx.op_result;
}

static void signal_done(ret_code_t result)
{
    m_ctx.op_result = result;

    if (!task::is_in_isr()) {
        xSemaphoreGive(m_ctx.op_done);
        return;
    }

    BaseType_t woken = pdFALSE;
    xSemaphoreGiveFromISR(m_ctx.op_done, &woken);
    portYIELD_FROM_ISR(woken);
}

static void fds_evt_handler(fds_evt_t const *event)
{
    switch (event->id) {
    case FDS_EVT_INIT:
        signal_done(event->result);
        break;

    case FDS_EVT_WRITE:
    case FDS_EVT_UPDATE:
        if (event->write.file_id == CFG_FILE_ID)
            signal_done(event->result);
        break;

    default:
        break;
    }
}
