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

#include "libglnx.h"
#include "libtest.h"
#include "matcha-config.h"
#include "matcha-errors.h"

static void
test_defaults (void)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaConfig) host = matcha_config_new_defaults (MATCHA_ENV_HOST);
  g_assert_cmpstr (host->root, ==, "/mnt/matcha");
  g_assert_cmpstr (host->hostname, ==, "matcha");
  g_assert_cmpstr (host->log_dir, ==, "/var/log/matcha-build");
  g_assert (host->root_part == NULL);
  g_assert_cmpuint (host->jobs, >=, 1);
  g_assert (g_str_has_suffix (host->target_triplet, "-matcha-linux-gnu"));

  g_assert (matcha_config_finalize (host, &error));
  g_assert_no_error (error);
  g_assert_cmpstr (host->sources_dir, ==, "/mnt/matcha/sources");
  g_assert_cmpstr (host->work_dir, ==, "/mnt/matcha/build");

  /* Partitions have no defaults */
  g_assert (!matcha_config_require_devices (host, &error));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_CONFIG);
  g_assert (strstr (error->message, "ROOT_PART") != NULL);

  g_autoptr (MatchaConfig) target = matcha_config_new_defaults (MATCHA_ENV_TARGET);
  g_assert_cmpstr (target->root, ==, "/");
}

static void
test_layering (void)
{
  g_autoptr (GError) error = NULL;
  char *tmpdir = matcha_test_tmpdir_new ();
  g_autofree char *path = g_build_filename (tmpdir, "bootstrap.conf", NULL);
  const char *contents = "[Bootstrap]\n"
                         "Root=/srv/matcha\n"
                         "Hostname=teapot\n"
                         "RootPartition=/dev/nvme0n1p2\n"
                         "Jobs=3\n"
                         "StateBackend=keyfile\n"
                         "PackageManager=true\n";
  g_assert (glnx_file_replace_contents_at (AT_FDCWD, path, (const guint8 *)contents, -1,
                                           GLNX_FILE_REPLACE_NODATASYNC, NULL, &error));
  g_assert_no_error (error);

  g_autoptr (MatchaConfig) config = matcha_config_new_defaults (MATCHA_ENV_HOST);
  g_assert (matcha_config_load_file (config, path, FALSE, &error));
  g_assert_no_error (error);
  g_assert_cmpstr (config->root, ==, "/srv/matcha");
  g_assert_cmpstr (config->hostname, ==, "teapot");
  g_assert_cmpuint (config->jobs, ==, 3);
  g_assert_cmpint (config->state_backend, ==, MATCHA_STATE_BACKEND_KEYFILE);
  g_assert (config->with_package_manager);
  g_assert (!config->with_kernel);

  /* The environment wins over the file; empty values are ignored */
  const char *envp[] = { "MATCHA=/mnt/lfs", "ROOT_PART=", "HOME_PART=/dev/sdb3",
                         "SWAP_PART=/dev/sdb1", "MATCHA_JOBS=12", NULL };
  g_assert (matcha_config_merge_environ (config, envp, &error));
  g_assert_no_error (error);
  g_assert_cmpstr (config->root, ==, "/mnt/lfs");
  g_assert_cmpstr (config->root_part, ==, "/dev/nvme0n1p2");
  g_assert_cmpstr (config->home_part, ==, "/dev/sdb3");
  g_assert_cmpuint (config->jobs, ==, 12);

  g_assert (matcha_config_finalize (config, &error));
  g_assert_no_error (error);
  g_assert (matcha_config_require_devices (config, &error));
  g_assert_no_error (error);
  g_assert_cmpstr (config->sources_dir, ==, "/mnt/lfs/sources");

  /* A missing file is only acceptable for the default path */
  g_autofree char *missing = g_build_filename (tmpdir, "nope.conf", NULL);
  g_assert (matcha_config_load_file (config, missing, TRUE, &error));
  g_assert_no_error (error);
  g_assert (!matcha_config_load_file (config, missing, FALSE, &error));
  g_assert_error (error, G_FILE_ERROR, G_FILE_ERROR_NOENT);

  matcha_test_tmpdir_free (tmpdir);
}

static void
test_invalid (void)
{
  g_autoptr (MatchaConfig) config = matcha_config_new_defaults (MATCHA_ENV_HOST);

  {
    g_autoptr (GError) error = NULL;
    const char *envp[] = { "MATCHA_JOBS=lots", NULL };
    g_assert (!matcha_config_merge_environ (config, envp, &error));
    g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_CONFIG);
  }
  {
    g_autoptr (GError) error = NULL;
    const char *envp[] = { "MATCHA_STATE_BACKEND=sqlite", NULL };
    g_assert (!matcha_config_merge_environ (config, envp, &error));
    g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_CONFIG);
  }
  {
    g_autoptr (GError) error = NULL;
    g_autoptr (GKeyFile) kf = g_key_file_new ();
    g_key_file_set_string (kf, MATCHA_CONFIG_GROUP, "InstallKernel", "maybe");
    g_assert (!matcha_config_merge_keyfile (config, kf, &error));
    g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_CONFIG);
  }
  {
    g_autoptr (GError) error = NULL;
    MatchaEnvKind env;
    g_assert (!matcha_env_kind_from_string ("vm", &env, &error));
    g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_CONFIG);
    g_clear_error (&error);
    g_assert (matcha_env_kind_from_string ("chroot", &env, &error));
    g_assert_cmpint (env, ==, MATCHA_ENV_TARGET);
  }
  {
    g_autoptr (GError) error = NULL;
    g_free (config->root);
    config->root = g_strdup ("relative/root");
    g_assert (!matcha_config_finalize (config, &error));
    g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_CONFIG);
  }
}

static void
test_target_keyfile (void)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaConfig) config = matcha_config_new_defaults (MATCHA_ENV_HOST);
  config->root_part = g_strdup ("/dev/sda2");
  config->with_kernel = TRUE;
  g_assert (matcha_config_finalize (config, &error));
  g_assert_no_error (error);

  g_autoptr (GKeyFile) kf = matcha_config_to_target_keyfile (config);
  g_autofree char *data = g_key_file_to_data (kf, NULL, NULL);

  /* What the host writes, the target reads back */
  g_autoptr (MatchaConfig) target = matcha_config_new_defaults (MATCHA_ENV_HOST);
  g_assert (matcha_config_merge_keyfile (target, kf, &error));
  g_assert_no_error (error);
  g_assert_cmpint (target->env, ==, MATCHA_ENV_TARGET);
  g_assert_cmpstr (target->root, ==, "/");
  g_assert_cmpstr (target->root_part, ==, "/dev/sda2");
  g_assert_cmpstr (target->sources_dir, ==, "/sources");
  g_assert_cmpstr (target->work_dir, ==, "/build");
  g_assert_cmpstr (target->target_triplet, ==, config->target_triplet);
  g_assert (target->with_kernel);
  g_assert (!target->with_package_manager);
  g_assert (strstr (data, "HomePartition") == NULL);
}

int
main (int argc, char *argv[])
{
  g_test_init (&argc, &argv, NULL);

  g_test_add_func ("/config/defaults", test_defaults);
  g_test_add_func ("/config/layering", test_layering);
  g_test_add_func ("/config/invalid", test_invalid);
  g_test_add_func ("/config/target-keyfile", test_target_keyfile);

  return g_test_run ();
}
