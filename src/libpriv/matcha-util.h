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

// C includes
#include <gio/gio.h>
#include <sys/types.h>

#include "libglnx.h"

// C++ code here
namespace util
{
// Sadly std::move() doesn't do anything for raw pointer types by default.
// This is our C++ equivalent of g_steal_pointer().
template <typename T>
T
move_nullify (T &v) noexcept
{
  auto p = v;
  v = nullptr;
  return p;
}
}

// Below here is C code
G_BEGIN_DECLS

#define _N(single, plural, n) ((n) == 1 ? (single) : (plural))
#define _NS(n) _N ("", "s", n)

char *matcha_maybe_shell_quote (const char *s);

char *matcha_argv_to_string (const char *const *argv);

char *matcha_timestamp_now (void);

guint matcha_get_default_jobs (void);

char *matcha_subst_vars (const char *tmpl, GHashTable *vars, GError **error);

void matcha_journal_error (GError *error);

G_END_DECLS
