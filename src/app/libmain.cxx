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

#include <gio/gio.h>

#include <errno.h>
#include <exception>
#include <locale.h>
#include <stdlib.h>
#include <string.h>
#include <systemd/sd-journal.h>
#include <unistd.h>

#include "matcha-builtins.h"
#include "matcha-errors.h"
#include "matcha-util.h"

#include "libglnx.h"

static MatchaCommand commands[] = {
  { "run",
    static_cast<MatchaBuiltinFlags> (MATCHA_BUILTIN_FLAG_REQUIRES_ROOT
                                     | MATCHA_BUILTIN_FLAG_USES_CONFIG),
    "Run (or resume) the bootstrap plan", matcha_builtin_run },
  { "status", static_cast<MatchaBuiltinFlags> (MATCHA_BUILTIN_FLAG_USES_CONFIG),
    "Show which phases and steps are done", matcha_builtin_status },
  { "reset",
    static_cast<MatchaBuiltinFlags> (MATCHA_BUILTIN_FLAG_REQUIRES_ROOT
                                     | MATCHA_BUILTIN_FLAG_USES_CONFIG),
    "Clear step markers so the steps run again", matcha_builtin_reset },
  { "resolve", static_cast<MatchaBuiltinFlags> (MATCHA_BUILTIN_FLAG_USES_CONFIG),
    "Show which source archive would be used", matcha_builtin_resolve },
  { NULL }
};

static gboolean opt_version;
static char *opt_env;
static char *opt_config;
static char *opt_root;
static char *opt_log_dir;

static GOptionEntry global_entries[] = {
  { "version", 0, 0, G_OPTION_ARG_NONE, &opt_version, "Print version information and exit",
    NULL },
  { NULL }
};

static GOptionEntry config_entries[] = {
  { "env", 0, 0, G_OPTION_ARG_STRING, &opt_env,
    "Execution environment: host or target (default: from config, else host)", "ENV" },
  { "config", 0, 0, G_OPTION_ARG_FILENAME, &opt_config,
    "Read configuration from PATH (default: " MATCHA_DEFAULT_CONFIG_PATH ")", "PATH" },
  { "root", 0, 0, G_OPTION_ARG_FILENAME, &opt_root, "Root of the system being built", "PATH" },
  { "log-dir", 0, 0, G_OPTION_ARG_FILENAME, &opt_log_dir, "Write action logs to DIR", "DIR" },
  { NULL }
};

static GOptionContext *
option_context_new_with_commands (void)
{
  g_autoptr (GOptionContext) context = g_option_context_new ("COMMAND");
  g_autoptr (GString) summary = g_string_new ("Builtin Commands:");

  for (MatchaCommand *command = commands; command->name != NULL; command++)
    {
      g_string_append_printf (summary, "\n  %-17s", command->name);
      if (command->description != NULL)
        g_string_append_printf (summary, "%s", command->description);
    }

  g_option_context_set_summary (context, summary->str);
  return util::move_nullify (context);
}

/* Layer the configuration: compiled defaults, the keyfile, the
 * environment, then the command line.
 */
static MatchaConfig *
load_config (GError **error)
{
  MatchaEnvKind env = MATCHA_ENV_HOST;
  if (opt_env && !matcha_env_kind_from_string (opt_env, &env, error))
    return NULL;

  g_autoptr (MatchaConfig) config = matcha_config_new_defaults (env);
  const char *path = opt_config ?: MATCHA_DEFAULT_CONFIG_PATH;
  if (!matcha_config_load_file (config, path, opt_config == NULL, error))
    return NULL;

  g_auto (GStrv) envp = g_get_environ ();
  if (!matcha_config_merge_environ (config, (const char *const *)envp, error))
    return NULL;

  if (opt_env)
    config->env = env;
  if (opt_root)
    {
      g_free (config->root);
      config->root = g_strdup (opt_root);
    }
  if (opt_log_dir)
    {
      g_free (config->log_dir);
      config->log_dir = g_strdup (opt_log_dir);
    }

  if (!matcha_config_finalize (config, error))
    return NULL;
  return util::move_nullify (config);
}

gboolean
matcha_option_context_parse (GOptionContext *context, const GOptionEntry *main_entries, int *argc,
                             char ***argv, MatchaCommandInvocation *invocation,
                             GCancellable *cancellable, MatchaConfig **out_config, GError **error)
{
  const MatchaBuiltinFlags flags
      = invocation ? invocation->command->flags : MATCHA_BUILTIN_FLAG_NONE;
  gboolean uses_config = (flags & MATCHA_BUILTIN_FLAG_USES_CONFIG) > 0;

  if (invocation && invocation->command->description != NULL)
    {
      /* The extra summary explanation is only provided for commands with description */
      const char *context_summary = g_option_context_get_summary (context);

      /* check whether the summary has been set earlier */
      if (context_summary == NULL)
        g_option_context_set_summary (context, invocation->command->description);
    }

  if (main_entries != NULL)
    g_option_context_add_main_entries (context, main_entries, NULL);

  if (uses_config)
    g_option_context_add_main_entries (context, config_entries, NULL);

  g_option_context_add_main_entries (context, global_entries, NULL);

  if (!g_option_context_parse (context, argc, argv, error))
    return FALSE;

  if (opt_version)
    {
      g_print ("%s:\n", PACKAGE_NAME);
      g_print (" Version: '%s'\n", PACKAGE_VERSION);
      g_print (" Release: '%s'\n", MATCHA_RELEASE);
      exit (EXIT_SUCCESS);
    }

  if ((flags & MATCHA_BUILTIN_FLAG_REQUIRES_ROOT) > 0 && getuid () != 0
      && getenv ("MATCHA_SUPPRESS_REQUIRES_ROOT_CHECK") == NULL)
    return matcha_throw (error, MATCHA_ERROR_CONFIG, "This command requires root privileges");

  if (uses_config)
    {
      g_assert (out_config);
      *out_config = load_config (error);
      if (!*out_config)
        return FALSE;
    }

  return TRUE;
}

static MatchaCommand *
lookup_command (const char *name)
{
  MatchaCommand *command = commands;

  while (command->name)
    {
      if (g_strcmp0 (name, command->name) == 0)
        return command;
      command++;
    }
  return NULL;
}

static const char *
matcha_subcommand_parse (int *inout_argc, char **inout_argv)
{
  const int argc = *inout_argc;
  const char *command_name = NULL;
  int in, out;

  for (in = 1, out = 1; in < argc; in++, out++)
    {
      /* The non-option is the command, take it out of the arguments */
      if (inout_argv[in][0] != '-')
        {
          if (command_name == NULL)
            {
              command_name = inout_argv[in];
              out--;
              continue;
            }
        }

      else if (g_str_equal (inout_argv[in], "--"))
        {
          break;
        }

      inout_argv[out] = inout_argv[in];
    }

  *inout_argc = out;
  return command_name;
}

int
matcha_main (int argc, char **argv)
{
  MatchaCommand *command;
  MatchaCommandInvocation invocation;
  const char *command_name = NULL;
  g_autofree char *prgname = NULL;
  GError *local_error = NULL;
  gboolean funcres;
  /* We can leave this function with an error status from both a command
   * invocation, as well as an option processing failure. Keep an alias to the
   * two places that hold status codes.
   */
  int exit_status = EXIT_SUCCESS;
  int *exit_statusp = &exit_status;

  g_setenv ("GIO_USE_VFS", "local", TRUE);
  g_set_prgname (argv[0]);

  setlocale (LC_ALL, "");

  g_autoptr (GCancellable) cancellable = g_cancellable_new ();

  command_name = matcha_subcommand_parse (&argc, argv);

  command = lookup_command (command_name);

  if (!command)
    {
      g_autoptr (GOptionContext) context = option_context_new_with_commands ();
      g_autofree char *help = NULL;

      /* This will not return for some options (e.g. --version). */
      (void)matcha_option_context_parse (context, NULL, &argc, &argv, NULL, NULL, NULL, NULL);
      if (command_name == NULL)
        {
          local_error = g_error_new_literal (G_IO_ERROR, G_IO_ERROR_FAILED, "No command specified");
        }
      else
        {
          local_error
              = g_error_new (G_IO_ERROR, G_IO_ERROR_FAILED, "Unknown command '%s'", command_name);
        }

      help = g_option_context_get_help (context, FALSE, NULL);
      g_printerr ("%s", help);
      exit_status = EXIT_FAILURE;
      goto out;
    }

  prgname = g_strdup_printf ("%s %s", g_get_prgname (), command_name);
  g_set_prgname (prgname);

  invocation = { .command = command, .exit_code = -1 };
  exit_statusp = &(invocation.exit_code);
  try
    {
      funcres = command->fn (argc, argv, &invocation, cancellable, &local_error);
    }
  catch (std::exception &e)
    {
      // Translate exceptions into GError
      funcres = glnx_throw (&local_error, "%s", e.what ());
    }
  if (!funcres)
    {
      if (invocation.exit_code == -1)
        invocation.exit_code = EXIT_FAILURE;
      g_assert (local_error);
      goto out;
    }
  else
    {
      if (invocation.exit_code == -1)
        invocation.exit_code = EXIT_SUCCESS;
    }

out:
  if (local_error != NULL)
    {
      int is_tty = isatty (2);
      const char *prefix = "";
      const char *suffix = "";
      if (is_tty)
        {
          prefix = "\x1b[31m\x1b[1m"; /* red, bold */
          suffix = "\x1b[22m\x1b[0m"; /* bold off, color reset */
        }
      g_printerr ("%serror: %s%s\n", prefix, suffix, local_error->message);
      matcha_journal_error (local_error);
      g_error_free (local_error);
    }

  return *exit_statusp;
}
