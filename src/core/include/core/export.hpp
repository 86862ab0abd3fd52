/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#if defined(_WIN32) && defined(RPL_SHARED_LIBS)
#ifdef RPL_CORE_EXPORTS
#define RPL_CORE_API __declspec(dllexport)
#else
#define RPL_CORE_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) && defined(RPL_SHARED_LIBS)
#define RPL_CORE_API __attribute__((visibility("default")))
#else
#define RPL_CORE_API
#endif

#define RPL_LOGGER_API RPL_CORE_API
