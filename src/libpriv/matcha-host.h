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

#include "matcha-phases.h"

G_BEGIN_DECLS

#define MATCHA_BUILD_USER "matcha"
#define MATCHA_GUIX_URL "https://ftp.gnu.org/gnu/guix/guix-latest.tar.gz"
#define MATCHA_GUIX_N_BUILD_USERS 10

MatchaPlan *matcha_host_plan_new (MatchaBuildContext *ctx, const char *self_exe, GError **error);

gboolean matcha_file_has_line_prefix (const char *path, const char *prefix, gboolean *out_found,
                                      GError **error);

G_END_DECLS
