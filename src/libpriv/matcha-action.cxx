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

#include <gio/gunixoutputstream.h>
#include <string.h>
#include <unistd.h>

#include "matcha-action.h"
#include "matcha-errors.h"
#include "matcha-util.h"

struct MatchaExecutor {
  guint refcount;
  MatchaExecutorRunFunc run;
  gpointer user_data;
  GDestroyNotify notify;
};

MatchaExecutor *
matcha_executor_ref (MatchaExecutor *executor)
{
  executor->refcount++;
  return executor;
}

void
matcha_executor_unref (MatchaExecutor *executor)
{
  executor->refcount--;
  if (executor->refcount > 0)
    return;

  if (executor->notify)
    executor->notify (executor->user_data);
  g_free (executor);
}

MatchaExecutor *
matcha_executor_new_custom (MatchaExecutorRunFunc func, gpointer user_data, GDestroyNotify notify)
{
  MatchaExecutor *ret = g_new0 (MatchaExecutor, 1);
  ret->refcount = 1;
  ret->run = func;
  ret->user_data = user_data;
  ret->notify = notify;
  return ret;
}

gpointer
matcha_executor_get_user_data (MatchaExecutor *executor)
{
  return executor->user_data;
}

/* Copy everything from the child's pipe into the log, and optionally to
 * our stdout as well.
 */
static gboolean
tee_child_output (GInputStream *in, GOutputStream *log_out, GOutputStream *echo_out,
                  GCancellable *cancellable, GError **error)
{
  char buf[8192];
  while (TRUE)
    {
      gssize n = g_input_stream_read (in, buf, sizeof (buf), cancellable, error);
      if (n < 0)
        return FALSE;
      if (n == 0)
        break;
      if (!g_output_stream_write_all (log_out, buf, n, NULL, cancellable, error))
        return FALSE;
      if (echo_out && !g_output_stream_write_all (echo_out, buf, n, NULL, cancellable, error))
        return FALSE;
    }
  return TRUE;
}

static gboolean
subprocess_run (MatchaExecutor *executor, const char *const *argv, const char *cwd,
                const char *const *envp, const char *log_path, GCancellable *cancellable,
                GError **error)
{
  gboolean echo = GPOINTER_TO_UINT (executor->user_data);

  GSubprocessFlags flags = log_path
                               ? (GSubprocessFlags)(G_SUBPROCESS_FLAGS_STDOUT_PIPE
                                                    | G_SUBPROCESS_FLAGS_STDERR_MERGE)
                               : (GSubprocessFlags)(G_SUBPROCESS_FLAGS_STDOUT_SILENCE
                                                    | G_SUBPROCESS_FLAGS_STDERR_SILENCE);
  g_autoptr (GSubprocessLauncher) launcher = g_subprocess_launcher_new (flags);
  if (cwd)
    g_subprocess_launcher_set_cwd (launcher, cwd);
  if (envp)
    g_subprocess_launcher_set_environ (launcher, (char **)envp);

  g_autoptr (GFileOutputStream) log_out = NULL;
  if (log_path)
    {
      g_autoptr (GFile) log_file = g_file_new_for_path (log_path);
      log_out = g_file_replace (log_file, NULL, FALSE, G_FILE_CREATE_NONE, cancellable, error);
      if (!log_out)
        return FALSE;
      g_autofree char *cmdline = matcha_argv_to_string (argv);
      g_autofree char *header = g_strdup_printf ("# cwd: %s\n$ %s\n", cwd ?: ".", cmdline);
      if (!g_output_stream_write_all (G_OUTPUT_STREAM (log_out), header, strlen (header), NULL,
                                      cancellable, error))
        return FALSE;
    }

  g_autoptr (GSubprocess) subproc = g_subprocess_launcher_spawnv (launcher, argv, error);
  if (!subproc)
    return FALSE;

  if (log_path)
    {
      g_autoptr (GOutputStream) echo_out = NULL;
      if (echo)
        echo_out = g_unix_output_stream_new (STDOUT_FILENO, FALSE);
      if (!tee_child_output (g_subprocess_get_stdout_pipe (subproc), G_OUTPUT_STREAM (log_out),
                             echo_out, cancellable, error))
        {
          g_subprocess_force_exit (subproc);
          return FALSE;
        }
      if (!g_output_stream_close (G_OUTPUT_STREAM (log_out), cancellable, error))
        return FALSE;
    }

  if (!g_subprocess_wait_check (subproc, cancellable, error))
    {
      /* Only has an effect if we were cancelled before the child exited */
      g_subprocess_force_exit (subproc);
      return FALSE;
    }
  return TRUE;
}

/* The real executor; @echo mirrors the output of each action to our stdout. */
MatchaExecutor *
matcha_executor_new_subprocess (gboolean echo)
{
  return matcha_executor_new_custom (subprocess_run, GUINT_TO_POINTER (echo), NULL);
}

gboolean
matcha_executor_run (MatchaExecutor *executor, const char *const *argv, const char *cwd,
                     const char *const *envp, const char *log_path, GCancellable *cancellable,
                     GError **error)
{
  g_assert (argv && argv[0]);
  return executor->run (executor, argv, cwd, envp, log_path, cancellable, error);
}

/* Logs are named after the step and the action phase, e.g.
 * gcc-final-make.log.
 */
char *
matcha_action_log_path (const char *log_dir, const char *name, const char *phase)
{
  g_autofree char *basename = g_strconcat (name, "-", phase, ".log", NULL);
  return g_build_filename (log_dir, basename, NULL);
}

/**
 * matcha_action_run:
 * @executor: Executor
 * @log_dir: Directory for the per-action log
 * @name: Step name
 * @phase: Action phase, e.g. "configure"
 * @argv: Command line
 * @cwd: (nullable): Working directory; passed explicitly, never inherited
 * @envp: (nullable): Child environment
 *
 * Run one opaque build action, capturing its combined output into
 * @log_dir/@name-@phase.log.  A failing command is returned as
 * %MATCHA_ERROR_ACTION_FAILED naming the log.
 */
gboolean
matcha_action_run (MatchaExecutor *executor, const char *log_dir, const char *name,
                   const char *phase, const char *const *argv, const char *cwd,
                   const char *const *envp, GCancellable *cancellable, GError **error)
{
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, log_dir, 0755, cancellable, error))
    return glnx_prefix_error (error, "Creating log directory");

  g_autofree char *log_path = matcha_action_log_path (log_dir, name, phase);
  g_autoptr (GError) local_error = NULL;
  if (!matcha_executor_run (executor, argv, cwd, envp, log_path, cancellable, &local_error))
    {
      if (g_error_matches (local_error, G_IO_ERROR, G_IO_ERROR_CANCELLED)
          || local_error->domain == MATCHA_ERROR)
        {
          g_propagate_error (error, util::move_nullify (local_error));
          return FALSE;
        }
      g_set_error (error, MATCHA_ERROR, MATCHA_ERROR_ACTION_FAILED, "%s-%s: %s (log: %s)", name,
                   phase, local_error->message, log_path);
      return FALSE;
    }
  return TRUE;
}

/**
 * matcha_action_probe:
 *
 * Run a side-effect free check such as `mountpoint -q`.  A non-zero exit
 * sets @out_success to %FALSE and is not an error; failing to spawn the
 * command at all is.
 */
gboolean
matcha_action_probe (MatchaExecutor *executor, const char *const *argv, const char *cwd,
                     const char *const *envp, gboolean *out_success, GCancellable *cancellable,
                     GError **error)
{
  g_autoptr (GError) local_error = NULL;
  if (!matcha_executor_run (executor, argv, cwd, envp, NULL, cancellable, &local_error))
    {
      if (local_error->domain == G_SPAWN_EXIT_ERROR)
        {
          *out_success = FALSE;
          return TRUE;
        }
      g_propagate_error (error, util::move_nullify (local_error));
      return glnx_prefix_error (error, "Probing with %s", argv[0]);
    }
  *out_success = TRUE;
  return TRUE;
}
