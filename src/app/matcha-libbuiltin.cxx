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

#include "config.h"

#include <stdio.h>
#include <string.h>

#include "matcha-host.h"
#include "matcha-libbuiltin.h"
#include "matcha-target.h"

#include "libglnx.h"

void
matcha_print_kv_no_newline (const char *key, guint maxkeylen, const char *value)
{
  printf ("  %*s%s %s", maxkeylen, key, strlen (key) ? ":" : " ", value);
}

void
matcha_print_kv (const char *key, guint maxkeylen, const char *value)
{
  matcha_print_kv_no_newline (key, maxkeylen, value);
  putc ('\n', stdout);
}

void
matcha_usage_error (GOptionContext *context, const char *message, GError **error)
{
  g_assert (context != NULL);
  g_assert (message != NULL);

  g_autofree char *help = g_option_context_get_help (context, TRUE, NULL);
  g_printerr ("%s\n", help);

  (void)glnx_throw (error, "usage error: %s", message);
}

static MatchaExecutor *executor_override;

MatchaExecutor *
matcha_builtin_new_executor (gboolean echo)
{
  if (executor_override)
    return matcha_executor_ref (executor_override);
  return matcha_executor_new_subprocess (echo);
}

void
matcha_builtin_set_executor (MatchaExecutor *executor)
{
  g_clear_pointer (&executor_override, matcha_executor_unref);
  if (executor)
    executor_override = matcha_executor_ref (executor);
}

MatchaPlan *
matcha_builtin_plan_new (MatchaBuildContext *ctx, const char *const *only_packages, GError **error)
{
  switch (ctx->env)
    {
    case MATCHA_ENV_HOST:
      if (only_packages && *only_packages)
        return (MatchaPlan *)glnx_null_throw (error, "--only is not supported on the host");
      /* The binary copied into the target is whichever one is running now */
      return matcha_host_plan_new (ctx, "/proc/self/exe", error);
    case MATCHA_ENV_TARGET:
      return matcha_target_plan_new (ctx, only_packages, error);
    }
  g_assert_not_reached ();
}
