/* Included first by every translation unit: SDK error handling, logging,
 * the FreeRTOS kernel, and the firmware's own error codes and limits. */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <algorithm>

#include "nordic_common.h"
#include "nrf.h"
#include "app_error.h"
#include "nrf_log.h"
#include "FreeRTOS.h"
#include "task.h"

#include "def/errors.def"
#include "def/strip.def"

#define unused(X) ((void)(X))

#define stringify_(X) #X
#define stringify(X) stringify_(X)

#if !defined(__GNUC__)
#error "packed_struct needs a GCC-compatible compiler"
#endif
#define packed_struct struct __attribute__((packed))

/* failed checks go through the SDK fault handler like any fatal error */
#define fail_with(code) APP_ERROR_HANDLER(code)

#ifndef assert
#define assert(expr) do { if (!(expr)) fail_with(ERROR_ASSERT); } while (0)
#endif

#ifdef NDEBUG
#define dassert(expr) ((void)0)
#else
#define dassert(expr) assert(expr)
#endif

#define unreachable() do { fail_with(ERROR_UNREACHABLE); } while (1)
