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
#include "matcha-output.h"
#include "matcha-transition.h"

#include <libglnx.h>

static int opt_jobs;
static gboolean opt_with_package_manager;
static gboolean opt_with_kernel;
static char **opt_only;

static GOptionEntry option_entries[] = {
  { "jobs", 'j', 0, G_OPTION_ARG_INT, &opt_jobs, "Number of parallel build jobs", "N" },
  { "with-package-manager", 0, 0, G_OPTION_ARG_NONE, &opt_with_package_manager,
    "Also fetch, build and set up the package manager (host only)", NULL },
  { "with-kernel", 0, 0, G_OPTION_ARG_NONE, &opt_with_kernel,
    "Also build the kernel and install the bootloader (target only)", NULL },
  { "only", 0, 0, G_OPTION_ARG_STRING_ARRAY, &opt_only,
    "Only build PACKAGE (may be repeated; target only)", "PACKAGE" },
  { NULL }
};

static void
print_next_steps (MatchaConfig *config)
{
  g_autofree char *helper = g_build_filename (config->helper_dir, MATCHA_ENTER_CHROOT_HELPER, NULL);
  g_print ("\n%sHost phase complete.%s Next steps:\n", get_bold_start (), get_bold_end ());
  g_print ("  1. Continue the build inside the new system: %s\n", helper);
  g_print ("  2. For an interactive shell once bash is built: %s --shell\n", helper);
}

gboolean
matcha_builtin_run (int argc, char **argv, MatchaCommandInvocation *invocation,
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
  if (opt_jobs < 0)
    {
      matcha_usage_error (context, "--jobs must be positive", error);
      return FALSE;
    }

  if (opt_jobs > 0)
    config->jobs = opt_jobs;
  if (opt_with_package_manager)
    config->with_package_manager = TRUE;
  if (opt_with_kernel)
    config->with_kernel = TRUE;

  if (!matcha_config_require_devices (config, error))
    return FALSE;

  g_autoptr (MatchaExecutor) executor = matcha_builtin_new_executor (TRUE);
  g_autoptr (MatchaStateStore) store = matcha_state_store_new_for_config (config);
  g_autoptr (MatchaBuildContext) ctx = matcha_build_context_new (config, executor, store);

  g_autoptr (MatchaPlan) plan
      = matcha_builtin_plan_new (ctx, (const char *const *)opt_only, error);
  if (!plan)
    return FALSE;

  g_debug ("Running plan %s with %u jobs, state in %s", matcha_plan_get_name (plan), config->jobs,
           matcha_state_store_get_backend_name (store));

  if (!matcha_plan_run (plan, ctx, cancellable, error))
    return FALSE;

  if (ctx->env == MATCHA_ENV_HOST)
    print_next_steps (config);
  else
    matcha_output_message ("Bootstrap of %s complete", config->root);

  return TRUE;
}
