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
#include "matcha-libbuiltin.h"

#include <libglnx.h>

static gboolean opt_verbose;

static GOptionEntry option_entries[] = {
  { "verbose", 'v', 0, G_OPTION_ARG_NONE, &opt_verbose, "Print the state of every step", NULL },
  { NULL }
};

static const char *
phase_state_color (MatchaPhaseState state)
{
  if (state == MATCHA_PHASE_DONE)
    return get_bold_start ();
  return "";
}

gboolean
matcha_builtin_status (int argc, char **argv, MatchaCommandInvocation *invocation,
                       GCancellable *cancellable, GError **error)
{
  g_autoptr (GOptionContext) context = g_option_context_new ("");
  g_autoptr (MatchaConfig) config = NULL;

  if (!matcha_option_context_parse (context, option_entries, &argc, &argv, invocation,
                                    cancellable, &config, error))
    return FALSE;

  if (argc > 1)
    {
      matcha_usage_error (context, "Too many arguments", error);
      return FALSE;
    }

  /* Nothing gets executed; the executor only satisfies the context */
  g_autoptr (MatchaExecutor) executor = matcha_builtin_new_executor (FALSE);
  g_autoptr (MatchaStateStore) store = matcha_state_store_new_for_config (config);
  g_autoptr (MatchaBuildContext) ctx = matcha_build_context_new (config, executor, store);
  g_autoptr (MatchaPlan) plan = matcha_builtin_plan_new (ctx, NULL, error);
  if (!plan)
    return FALSE;

  if (!matcha_plan_refresh_state (plan, store, error))
    return FALSE;

  const guint max_key_len = strlen ("Environment");
  matcha_print_kv ("Environment", max_key_len, matcha_env_kind_to_string (config->env));
  matcha_print_kv ("Root", max_key_len, config->root);
  matcha_print_kv ("State", max_key_len, matcha_state_store_get_backend_name (store));
  g_print ("\n");

  guint n_done = 0;
  for (guint i = 0; i < matcha_plan_get_n_phases (plan); i++)
    {
      MatchaPhase *phase = matcha_plan_get_phase (plan, i);
      MatchaPhaseState state = matcha_phase_get_state (phase);
      if (state == MATCHA_PHASE_DONE)
        n_done++;
      g_print ("%s%-24s%s %s\n", phase_state_color (state), matcha_phase_get_name (phase),
               get_bold_end (), matcha_phase_state_to_string (state));

      if (!opt_verbose && state == MATCHA_PHASE_DONE)
        continue;

      for (guint j = 0; j < matcha_phase_get_n_steps (phase); j++)
        {
          const char *step_id = matcha_phase_get_step_id (phase, j);
          MatchaStepStatus status;
          if (!matcha_state_store_get_status (store, step_id, &status, error))
            return FALSE;
          g_print ("    %s %s\n", status == MATCHA_STEP_STATUS_DONE ? "●" : "○", step_id);
        }
    }

  g_print ("\n%u/%u phases done\n", n_done, matcha_plan_get_n_phases (plan));
  return TRUE;
}
