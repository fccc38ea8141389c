/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <coro/coro.hpp>

// all asynchronous entry points are written against these macros so that the
// call sites read the same way as the transports they were modelled on
#define CORO_TASK(x) coro::task<x>
#define CO_AWAIT co_await
#define CO_RETURN co_return
