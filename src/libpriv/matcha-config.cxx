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
#include <sys/utsname.h>
#include <systemd/sd-journal.h>

#include "matcha-config.h"
#include "matcha-errors.h"
#include "matcha-util.h"

#include <libglnx.h>

static char *
default_target_triplet (void)
{
  struct utsname uts;
  if (uname (&uts) < 0)
    return g_strdup ("x86_64-matcha-linux-gnu");
  return g_strconcat (uts.machine, "-matcha-linux-gnu", NULL);
}

MatchaConfig *
matcha_config_new_defaults (MatchaEnvKind env)
{
  MatchaConfig *config = g_new0 (MatchaConfig, 1);
  config->env = env;
  config->root = g_strdup (env == MATCHA_ENV_HOST ? "/mnt/matcha" : "/");
  config->disk = g_strdup ("/dev/sda");
  config->hostname = g_strdup ("matcha");
  config->kernel_version = g_strdup ("6.16.1");
  config->log_dir = g_strdup ("/var/log/matcha-build");
  config->helper_dir = g_strdup ("/root");
  config->target_triplet = default_target_triplet ();
  config->kernel_source_dir = g_strdup ("/usr/src/linux");
  config->jobs = matcha_get_default_jobs ();
  config->state_backend = MATCHA_STATE_BACKEND_MARKERS;
  return config;
}

void
matcha_config_free (MatchaConfig *config)
{
  g_free (config->root);
  g_free (config->disk);
  g_free (config->root_part);
  g_free (config->home_part);
  g_free (config->swap_part);
  g_free (config->hostname);
  g_free (config->kernel_version);
  g_free (config->log_dir);
  g_free (config->sources_dir);
  g_free (config->work_dir);
  g_free (config->helper_dir);
  g_free (config->target_triplet);
  g_free (config->kernel_source_dir);
  g_free (config);
}

const char *
matcha_env_kind_to_string (MatchaEnvKind env)
{
  switch (env)
    {
    case MATCHA_ENV_HOST:
      return "host";
    case MATCHA_ENV_TARGET:
      return "target";
    }
  g_assert_not_reached ();
}

gboolean
matcha_env_kind_from_string (const char *str, MatchaEnvKind *out_env, GError **error)
{
  if (g_str_equal (str, "host"))
    *out_env = MATCHA_ENV_HOST;
  else if (g_str_equal (str, "target") || g_str_equal (str, "chroot"))
    *out_env = MATCHA_ENV_TARGET;
  else
    return matcha_throw (error, MATCHA_ERROR_CONFIG,
                         "Invalid environment '%s' (expected 'host' or 'target')", str);
  return TRUE;
}

const char *
matcha_state_backend_to_string (MatchaStateBackend backend)
{
  switch (backend)
    {
    case MATCHA_STATE_BACKEND_MARKERS:
      return "markers";
    case MATCHA_STATE_BACKEND_KEYFILE:
      return "keyfile";
    }
  g_assert_not_reached ();
}

gboolean
matcha_state_backend_from_string (const char *str, MatchaStateBackend *out_backend,
                                  GError **error)
{
  if (g_str_equal (str, "markers"))
    *out_backend = MATCHA_STATE_BACKEND_MARKERS;
  else if (g_str_equal (str, "keyfile"))
    *out_backend = MATCHA_STATE_BACKEND_KEYFILE;
  else
    return matcha_throw (error, MATCHA_ERROR_CONFIG,
                         "Invalid state backend '%s' (expected 'markers' or 'keyfile')", str);
  return TRUE;
}

static void
replace_str (char **dest, const char *value)
{
  g_free (*dest);
  *dest = g_strdup (value);
}

static gboolean
throw_config (GError **error, const char *format, ...) G_GNUC_PRINTF (2, 3);

static gboolean
throw_config (GError **error, const char *format, ...)
{
  va_list args;
  va_start (args, format);
  g_autofree char *msg = g_strdup_vprintf (format, args);
  va_end (args);
  g_set_error_literal (error, MATCHA_ERROR, MATCHA_ERROR_CONFIG, msg);
  return FALSE;
}

static gboolean
parse_jobs (const char *str, guint *out_jobs, GError **error)
{
  guint64 v;
  g_autoptr (GError) local_error = NULL;
  if (!g_ascii_string_to_unsigned (str, 10, 1, G_MAXUINT16, &v, &local_error))
    return throw_config (error, "Invalid job count '%s': %s", str, local_error->message);
  *out_jobs = (guint)v;
  return TRUE;
}

static gboolean
keyfile_get_boolean (GKeyFile *keyfile, const char *key, gboolean *inout_value, GError **error)
{
  if (!g_key_file_has_key (keyfile, MATCHA_CONFIG_GROUP, key, NULL))
    return TRUE;
  g_autoptr (GError) local_error = NULL;
  gboolean v = g_key_file_get_boolean (keyfile, MATCHA_CONFIG_GROUP, key, &local_error);
  if (local_error)
    return throw_config (error, "Invalid boolean for '%s': %s", key, local_error->message);
  *inout_value = v;
  return TRUE;
}

/* Overlay every key present in the [Bootstrap] group of @keyfile on top of
 * @config; keys that are absent keep their current value.
 */
gboolean
matcha_config_merge_keyfile (MatchaConfig *config, GKeyFile *keyfile, GError **error)
{
  static const struct
  {
    const char *key;
    gsize offset;
  } string_keys[] = {
    { "Root", G_STRUCT_OFFSET (MatchaConfig, root) },
    { "Disk", G_STRUCT_OFFSET (MatchaConfig, disk) },
    { "RootPartition", G_STRUCT_OFFSET (MatchaConfig, root_part) },
    { "HomePartition", G_STRUCT_OFFSET (MatchaConfig, home_part) },
    { "SwapPartition", G_STRUCT_OFFSET (MatchaConfig, swap_part) },
    { "Hostname", G_STRUCT_OFFSET (MatchaConfig, hostname) },
    { "KernelVersion", G_STRUCT_OFFSET (MatchaConfig, kernel_version) },
    { "LogDir", G_STRUCT_OFFSET (MatchaConfig, log_dir) },
    { "SourcesDir", G_STRUCT_OFFSET (MatchaConfig, sources_dir) },
    { "WorkDir", G_STRUCT_OFFSET (MatchaConfig, work_dir) },
    { "HelperDir", G_STRUCT_OFFSET (MatchaConfig, helper_dir) },
    { "Target", G_STRUCT_OFFSET (MatchaConfig, target_triplet) },
    { "KernelSourceDir", G_STRUCT_OFFSET (MatchaConfig, kernel_source_dir) },
  };

  for (guint i = 0; i < G_N_ELEMENTS (string_keys); i++)
    {
      g_autofree char *v
          = g_key_file_get_string (keyfile, MATCHA_CONFIG_GROUP, string_keys[i].key, NULL);
      if (v)
        replace_str (&G_STRUCT_MEMBER (char *, config, string_keys[i].offset), v);
    }

  {
    g_autofree char *v = g_key_file_get_string (keyfile, MATCHA_CONFIG_GROUP, "Environment", NULL);
    if (v && !matcha_env_kind_from_string (v, &config->env, error))
      return FALSE;
  }
  {
    g_autofree char *v = g_key_file_get_string (keyfile, MATCHA_CONFIG_GROUP, "StateBackend", NULL);
    if (v && !matcha_state_backend_from_string (v, &config->state_backend, error))
      return FALSE;
  }
  {
    g_autofree char *v = g_key_file_get_string (keyfile, MATCHA_CONFIG_GROUP, "Jobs", NULL);
    if (v && !parse_jobs (v, &config->jobs, error))
      return FALSE;
  }

  if (!keyfile_get_boolean (keyfile, "PackageManager", &config->with_package_manager, error))
    return FALSE;
  if (!keyfile_get_boolean (keyfile, "InstallKernel", &config->with_kernel, error))
    return FALSE;

  return TRUE;
}

/* Returns TRUE if the file exists and could be loaded, or if it doesn't exist
 * and @allow_noent is set.
 */
gboolean
matcha_config_load_file (MatchaConfig *config, const char *path, gboolean allow_noent,
                         GError **error)
{
  g_autoptr (GError) local_error = NULL;
  g_autoptr (GKeyFile) keyfile = g_key_file_new ();

  if (!g_key_file_load_from_file (keyfile, path, (GKeyFileFlags)0, &local_error))
    {
      if (allow_noent && g_error_matches (local_error, G_FILE_ERROR, G_FILE_ERROR_NOENT))
        {
          g_debug ("Missing config file '%s'; using compiled defaults", path);
          return TRUE;
        }
      g_propagate_error (error, util::move_nullify (local_error));
      return glnx_prefix_error (error, "Loading %s", path);
    }

  sd_journal_print (LOG_INFO, "Reading config file '%s'", path);
  if (!matcha_config_merge_keyfile (config, keyfile, error))
    return glnx_prefix_error (error, "Parsing %s", path);
  return TRUE;
}

gboolean
matcha_config_merge_environ (MatchaConfig *config, const char *const *envp, GError **error)
{
  static const struct
  {
    const char *name;
    gsize offset;
  } string_vars[] = {
    { "MATCHA", G_STRUCT_OFFSET (MatchaConfig, root) },
    { "DISK", G_STRUCT_OFFSET (MatchaConfig, disk) },
    { "ROOT_PART", G_STRUCT_OFFSET (MatchaConfig, root_part) },
    { "HOME_PART", G_STRUCT_OFFSET (MatchaConfig, home_part) },
    { "SWAP_PART", G_STRUCT_OFFSET (MatchaConfig, swap_part) },
    { "MATCHA_HOSTNAME", G_STRUCT_OFFSET (MatchaConfig, hostname) },
    { "KVER", G_STRUCT_OFFSET (MatchaConfig, kernel_version) },
    { "BUILD_LOG_DIR", G_STRUCT_OFFSET (MatchaConfig, log_dir) },
    { "MATCHA_SOURCES", G_STRUCT_OFFSET (MatchaConfig, sources_dir) },
    { "MATCHA_WORKDIR", G_STRUCT_OFFSET (MatchaConfig, work_dir) },
    { "MATCHA_HELPER_DIR", G_STRUCT_OFFSET (MatchaConfig, helper_dir) },
    { "MATCHA_TGT", G_STRUCT_OFFSET (MatchaConfig, target_triplet) },
  };
  char **env = (char **)envp;

  for (guint i = 0; i < G_N_ELEMENTS (string_vars); i++)
    {
      const char *v = g_environ_getenv (env, string_vars[i].name);
      /* An empty ROOT_PART= is the same as an unset one */
      if (v && *v)
        replace_str (&G_STRUCT_MEMBER (char *, config, string_vars[i].offset), v);
    }

  const char *jobs = g_environ_getenv (env, "MATCHA_JOBS");
  if (jobs && *jobs && !parse_jobs (jobs, &config->jobs, error))
    return FALSE;

  const char *backend = g_environ_getenv (env, "MATCHA_STATE_BACKEND");
  if (backend && *backend
      && !matcha_state_backend_from_string (backend, &config->state_backend, error))
    return FALSE;

  return TRUE;
}

/**
 * matcha_config_finalize:
 *
 * Fill in the paths derived from the root and validate the result.  This
 * must be called once all layers have been merged, and before any phase
 * starts; a failure here is a configuration error.
 */
gboolean
matcha_config_finalize (MatchaConfig *config, GError **error)
{
  if (!config->root || !g_path_is_absolute (config->root))
    return throw_config (error, "Root '%s' must be an absolute path", config->root ?: "");
  if (!config->log_dir || !g_path_is_absolute (config->log_dir))
    return throw_config (error, "Log directory '%s' must be an absolute path",
                         config->log_dir ?: "");

  if (!config->sources_dir)
    config->sources_dir = matcha_config_root_path (config, "sources");
  if (!config->work_dir)
    config->work_dir = matcha_config_root_path (config, "build");

  if (config->jobs == 0)
    return throw_config (error, "Job count must be at least 1");

  return TRUE;
}

/**
 * matcha_config_require_devices:
 *
 * Check the block devices needed to run the plan are set.  Only commands
 * that touch the system call this; inspecting the state works without.
 */
gboolean
matcha_config_require_devices (MatchaConfig *config, GError **error)
{
  if (config->env == MATCHA_ENV_HOST)
    {
      static const struct
      {
        const char *var;
        const char *example;
        gsize offset;
      } mandatory[] = {
        { "ROOT_PART", "/dev/sda2", G_STRUCT_OFFSET (MatchaConfig, root_part) },
        { "HOME_PART", "/dev/sda3", G_STRUCT_OFFSET (MatchaConfig, home_part) },
        { "SWAP_PART", "/dev/sda1", G_STRUCT_OFFSET (MatchaConfig, swap_part) },
      };
      for (guint i = 0; i < G_N_ELEMENTS (mandatory); i++)
        {
          const char *v = G_STRUCT_MEMBER (char *, config, mandatory[i].offset);
          if (!v || !*v)
            return throw_config (error, "Set %s (e.g. %s)", mandatory[i].var,
                                 mandatory[i].example);
        }
    }
  else if (config->with_kernel && !(config->root_part && *config->root_part))
    return throw_config (error, "Set ROOT_PART (e.g. /dev/sda2); it is needed for the bootloader");

  return TRUE;
}

char *
matcha_config_root_path (MatchaConfig *config, const char *relpath)
{
  return g_build_filename (config->root, relpath, NULL);
}

/* Translate a host path under the root into the path the target
 * environment will see; paths outside the root are not visible there.
 */
static char *
path_in_target (MatchaConfig *config, const char *path)
{
  if (!path)
    return NULL;
  if (g_str_equal (config->root, "/"))
    return g_strdup (path);
  g_autofree char *prefix = g_strconcat (config->root, "/", NULL);
  if (g_str_has_prefix (path, prefix))
    return g_strconcat ("/", path + strlen (prefix), NULL);
  return NULL;
}

/**
 * matcha_config_to_target_keyfile:
 *
 * Returns: (transfer full): The configuration the target environment
 * orchestrator runs with after the chroot has been entered.
 */
GKeyFile *
matcha_config_to_target_keyfile (MatchaConfig *config)
{
  g_autoptr (GKeyFile) kf = g_key_file_new ();
  const char *g = MATCHA_CONFIG_GROUP;

  g_key_file_set_string (kf, g, "Environment", matcha_env_kind_to_string (MATCHA_ENV_TARGET));
  g_key_file_set_string (kf, g, "Root", "/");
  g_key_file_set_string (kf, g, "Disk", config->disk);
  if (config->root_part)
    g_key_file_set_string (kf, g, "RootPartition", config->root_part);
  if (config->home_part)
    g_key_file_set_string (kf, g, "HomePartition", config->home_part);
  if (config->swap_part)
    g_key_file_set_string (kf, g, "SwapPartition", config->swap_part);
  g_key_file_set_string (kf, g, "Hostname", config->hostname);
  g_key_file_set_string (kf, g, "KernelVersion", config->kernel_version);
  g_key_file_set_string (kf, g, "LogDir", config->log_dir);
  g_key_file_set_string (kf, g, "Target", config->target_triplet);
  g_key_file_set_string (kf, g, "KernelSourceDir", config->kernel_source_dir);
  g_key_file_set_string (kf, g, "StateBackend",
                         matcha_state_backend_to_string (config->state_backend));
  g_key_file_set_boolean (kf, g, "InstallKernel", config->with_kernel);

  g_autofree char *sources = path_in_target (config, config->sources_dir);
  if (sources)
    g_key_file_set_string (kf, g, "SourcesDir", sources);
  g_autofree char *work = path_in_target (config, config->work_dir);
  if (work)
    g_key_file_set_string (kf, g, "WorkDir", work);

  return util::move_nullify (kf);
}
