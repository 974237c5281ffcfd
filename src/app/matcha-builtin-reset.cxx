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

#include <string.h>

#include "matcha-builtins.h"
#include "matcha-errors.h"
#include "matcha-libbuiltin.h"
#include "matcha-output.h"

#include <libglnx.h>

static gboolean opt_all;

static GOptionEntry option_entries[] = {
  { "all", 'a', 0, G_OPTION_ARG_NONE, &opt_all, "Clear every step of the plan", NULL },
  { NULL }
};

static gboolean
plan_has_step (GPtrArray *step_ids, const char *step_id)
{
  for (guint i = 0; i < step_ids->len; i++)
    {
      if (g_str_equal (step_ids->pdata[i], step_id))
        return TRUE;
    }
  return FALSE;
}

gboolean
matcha_builtin_reset (int argc, char **argv, MatchaCommandInvocation *invocation,
                      GCancellable *cancellable, GError **error)
{
  g_autoptr (GOptionContext) context = g_option_context_new ("[STEP...]");
  g_autoptr (MatchaConfig) config = NULL;

  if (!matcha_option_context_parse (context, option_entries, &argc, &argv, invocation,
                                    cancellable, &config, error))
    return FALSE;

  if (opt_all == (argc > 1))
    {
      matcha_usage_error (context, "Specify either --all or at least one STEP", error);
      return FALSE;
    }

  /* Optional phases are included so that --all really means all */
  if (opt_all)
    {
      config->with_package_manager = TRUE;
      config->with_kernel = TRUE;
    }

  g_autoptr (MatchaExecutor) executor = matcha_builtin_new_executor (FALSE);
  g_autoptr (MatchaStateStore) store = matcha_state_store_new_for_config (config);
  g_autoptr (MatchaBuildContext) ctx = matcha_build_context_new (config, executor, store);
  g_autoptr (MatchaPlan) plan = matcha_builtin_plan_new (ctx, NULL, error);
  if (!plan)
    return FALSE;

  g_autoptr (GPtrArray) step_ids = matcha_plan_get_step_ids (plan);
  g_autoptr (GPtrArray) to_clear = g_ptr_array_new ();
  if (opt_all)
    {
      for (guint i = 0; i < step_ids->len; i++)
        g_ptr_array_add (to_clear, step_ids->pdata[i]);
    }
  else
    {
      for (int i = 1; i < argc; i++)
        {
          if (!matcha_step_id_validate (argv[i], error))
            return FALSE;
          if (!plan_has_step (step_ids, argv[i]))
            return matcha_throw (error, MATCHA_ERROR_NOT_FOUND, "No step '%s' in the %s plan",
                                 argv[i], matcha_plan_get_name (plan));
          g_ptr_array_add (to_clear, argv[i]);
        }
    }

  for (guint i = 0; i < to_clear->len; i++)
    {
      auto step_id = static_cast<const char *> (to_clear->pdata[i]);
      if (!matcha_state_store_clear (store, step_id, error))
        return FALSE;
    }

  matcha_output_message ("Cleared %u step marker%s", to_clear->len, _NS (to_clear->len));
  return TRUE;
}
