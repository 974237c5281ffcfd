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

#include <sys/utsname.h>

#include "matcha-context.h"
#include "matcha-util.h"

#include <libglnx.h>

static char **
build_child_env (MatchaConfig *config)
{
  char **env = g_get_environ ();
  env = g_environ_setenv (env, "MATCHA", config->root, TRUE);
  env = g_environ_setenv (env, "MATCHA_TGT", config->target_triplet, TRUE);
  env = g_environ_setenv (env, "LC_ALL", "POSIX", TRUE);
  g_autofree char *makeflags = g_strdup_printf ("-j%u", config->jobs);
  env = g_environ_setenv (env, "MAKEFLAGS", makeflags, TRUE);

  /* On the host the temporary toolchain shadows the system one */
  if (config->env == MATCHA_ENV_HOST)
    {
      g_autofree char *tools_bin = matcha_config_root_path (config, "tools/bin");
      const char *path = g_environ_getenv (env, "PATH") ?: "/usr/bin:/bin";
      g_autofree char *new_path = g_strconcat (tools_bin, ":", path, NULL);
      env = g_environ_setenv (env, "PATH", new_path, TRUE);
      g_autofree char *config_site = matcha_config_root_path (config, "usr/share/config.site");
      env = g_environ_setenv (env, "CONFIG_SITE", config_site, TRUE);
    }
  return env;
}

MatchaBuildContext *
matcha_build_context_new (MatchaConfig *config, MatchaExecutor *executor, MatchaStateStore *store)
{
  MatchaBuildContext *ctx = g_new0 (MatchaBuildContext, 1);
  ctx->config = config;
  ctx->env = config->env;
  ctx->executor = matcha_executor_ref (executor);
  ctx->store = matcha_state_store_ref (store);
  ctx->child_env = build_child_env (config);
  return ctx;
}

void
matcha_build_context_free (MatchaBuildContext *ctx)
{
  g_clear_pointer (&ctx->executor, matcha_executor_unref);
  g_clear_pointer (&ctx->store, matcha_state_store_unref);
  g_strfreev (ctx->child_env);
  g_free (ctx);
}

char *
matcha_build_context_path (MatchaBuildContext *ctx, const char *relpath)
{
  return matcha_config_root_path (ctx->config, relpath);
}

/* Template variables shared by every recipe; callers add @SRCDIR@ and
 * @BUILDDIR@ once they are known.
 */
GHashTable *
matcha_build_context_new_vars (MatchaBuildContext *ctx)
{
  MatchaConfig *config = ctx->config;
  GHashTable *vars = g_hash_table_new_full (g_str_hash, g_str_equal, NULL, g_free);
  g_hash_table_insert (vars, (char *)"ROOT", g_strdup (config->root));
  g_hash_table_insert (vars, (char *)"JOBS", g_strdup_printf ("%u", config->jobs));
  g_hash_table_insert (vars, (char *)"TARGET", g_strdup (config->target_triplet));
  g_hash_table_insert (vars, (char *)"KVER", g_strdup (config->kernel_version));
  g_hash_table_insert (vars, (char *)"DISK", g_strdup (config->disk));

  /* What config.guess reports for the machine we run on */
  struct utsname uts;
  const char *machine = uname (&uts) == 0 ? uts.machine : "x86_64";
  g_hash_table_insert (vars, (char *)"BUILD", g_strconcat (machine, "-pc-linux-gnu", NULL));
  return vars;
}

gboolean
matcha_build_context_run (MatchaBuildContext *ctx, const char *name, const char *phase,
                          const char *const *argv, const char *cwd, GCancellable *cancellable,
                          GError **error)
{
  return matcha_action_run (ctx->executor, ctx->config->log_dir, name, phase, argv, cwd,
                            (const char *const *)ctx->child_env, cancellable, error);
}

gboolean
matcha_build_context_probe (MatchaBuildContext *ctx, const char *const *argv, const char *cwd,
                            gboolean *out_success, GCancellable *cancellable, GError **error)
{
  return matcha_action_probe (ctx->executor, argv, cwd, (const char *const *)ctx->child_env,
                              out_success, cancellable, error);
}
