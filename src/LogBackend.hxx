// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_LOG_BACKEND_HXX
#define HLS_LOG_BACKEND_HXX

#include "LogLevel.hxx"

/**
 * Messages below this level are discarded.  The default is
 * LogLevel::NOTICE.
 */
void
SetLogThreshold(LogLevel _threshold) noexcept;

[[gnu::pure]]
LogLevel
GetLogThreshold() noexcept;

/**
 * Prefix each message with the local time.
 */
void
EnableLogTimestamp() noexcept;

#endif
