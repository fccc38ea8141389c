/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <bridge/internal/coroutine_support.h>
#include <bridge/internal/logger.h>
#include <bridge/internal/error_codes.h>
#include <bridge/internal/event.h>
#include <bridge/internal/types.h>
#include <bridge/internal/connection_status.h>
#include <bridge/internal/result.h>
#include <bridge/internal/pending_requests.h>
#include <bridge/internal/duplex_stream.h>
#include <bridge/internal/links.h>
#include <bridge/internal/request_forwarder.h>
#include <bridge/internal/action_stream.h>
