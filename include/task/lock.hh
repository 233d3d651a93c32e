#pragma once

#include "prelude.hh"
#include "semphr.h"
#include "task.hh"

namespace task {
    template<typename T>
    struct lock;

    /**
     * @brief Access to the value behind a `lock` for as long as the guard lives.
     *
     * A guard whose wait timed out is empty and converts to `false`.
     */
    template<typename T>
    struct guard {
        guard(guard const &) = delete;
        guard &operator=(guard const &) = delete;

        ~guard()
        {
            if (mutex)
                xSemaphoreGive(mutex);
        }

        explicit operator bool() const
        {
            return mutex != nullptr;
        }

        T &operator*() const
        {
            assert(mutex);
            return *value;
        }

        T *operator->() const
        {
            assert(mutex);
            return value;
        }

    private:
        constexpr guard(SemaphoreHandle_t mutex, T *value):
            mutex(mutex),
            value(value)
        {}

        SemaphoreHandle_t mutex;
        T *value;

        friend struct lock<T>;
    };

    /**
     * @brief A value that is only reachable while holding its mutex.
     */
    template<typename T>
    struct lock {
        constexpr lock():
            mutex(nullptr),
            value()
        {}

        ret_code_t init()
        {
            if (!mutex)
                mutex = xSemaphoreCreateMutex();

            return mutex ? NRF_SUCCESS : NRF_ERROR_NO_MEM;
        }

        inline bool is_initialized() const
        {
            return mutex != nullptr;
        }

        /* task context only */
        guard<T> take(TickType_t max_wait)
        {
            dassert(mutex);
            dassert(!task::is_in_isr());

            if (!xSemaphoreTake(mutex, max_wait))
                return guard<T>(nullptr, nullptr);

            return guard<T>(mutex, &value);
        }

    protected:
        SemaphoreHandle_t mutex;
        T value;
    };
}
