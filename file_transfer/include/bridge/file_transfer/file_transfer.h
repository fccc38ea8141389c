/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <bridge/file_transfer/crypto.h>
#include <bridge/file_transfer/media_probe.h>
#include <bridge/file_transfer/upload.h>
#include <bridge/file_transfer/file_response_decoder.h>
#include <bridge/file_transfer/socket_client.h>
#include <bridge/file_transfer/download.h>
