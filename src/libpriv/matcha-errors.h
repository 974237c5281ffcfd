/* -*- mode: C; c-file-style: "gnu"; indent-tabs-mode: nil; -*-
 *
 * Copyright (C) 2026 Matcha Linux contributors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the
 * Free Software Foundation, Inc., 59 Temple Place - Suite 330,
 * Boston, MA 02111-1307, USA.
 */

#pragma once

#include <gio/gio.h>

G_BEGIN_DECLS

#define MATCHA_ERROR (matcha_error_quark ())

typedef enum {
  MATCHA_ERROR_FAILED,
  MATCHA_ERROR_CONFIG,
  MATCHA_ERROR_NOT_FOUND,
  MATCHA_ERROR_ARCHIVE_CORRUPT,
  MATCHA_ERROR_ACTION_FAILED,
  MATCHA_ERROR_UNSUPPORTED,
  MATCHA_ERROR_INVALID,
  MATCHA_ERROR_NUM_ENTRIES,
} MatchaError;

GQuark matcha_error_quark (void);

/* Like glnx_throw(), but with a specific MATCHA_ERROR code */
gboolean matcha_throw (GError **error, MatchaError code, const char *fmt, ...) G_GNUC_PRINTF (3, 4);

G_END_DECLS
