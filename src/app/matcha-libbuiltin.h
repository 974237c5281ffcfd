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

#include "libglnx.h"

#include "matcha-context.h"
#include "matcha-phases.h"
#include "matcha-util.h"

G_BEGIN_DECLS

#define TERM_ESCAPE_SEQUENCE(type, seq)                                                            \
  static inline const char *get_##type (void)                                                      \
  {                                                                                                \
    if (glnx_stdout_is_tty ())                                                                     \
      return seq;                                                                                  \
    return "";                                                                                     \
  }

TERM_ESCAPE_SEQUENCE (red_start, "\x1b[31m")
TERM_ESCAPE_SEQUENCE (red_end, "\x1b[22m")
TERM_ESCAPE_SEQUENCE (bold_start, "\x1b[1m")
TERM_ESCAPE_SEQUENCE (bold_end, "\x1b[0m")

#undef TERM_ESCAPE_SEQUENCE

void matcha_print_kv_no_newline (const char *key, guint maxkeylen, const char *value);

void matcha_print_kv (const char *key, guint maxkeylen, const char *value);

void matcha_usage_error (GOptionContext *context, const char *message, GError **error);

/* Executor used by run, status and reset.  Tests install a recording one
 * with matcha_builtin_set_executor(); %NULL restores the real one.
 */
MatchaExecutor *matcha_builtin_new_executor (gboolean echo);
void matcha_builtin_set_executor (MatchaExecutor *executor);

/* Builds the plan for the environment @ctx runs in.  @only_packages is
 * only meaningful for the target plan.
 */
MatchaPlan *matcha_builtin_plan_new (MatchaBuildContext *ctx, const char *const *only_packages,
                                     GError **error);

G_END_DECLS
