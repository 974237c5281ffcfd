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
#include <sys/stat.h>
#include <unistd.h>

#include "libglnx.h"
#include "libtest.h"
#include "matcha-errors.h"
#include "matcha-host.h"
#include "matcha-target.h"
#include "matcha-transition.h"
#include "matcha-util.h"

typedef struct {
  char *tmpdir;
  MatchaConfig *config;
  MatchaTestRecorder *rec;
  MatchaExecutor *executor;
  MatchaStateStore *store;
  MatchaBuildContext *ctx;
  MatchaTestOutput out;
} Fixture;

static void
setup (Fixture *fx, MatchaEnvKind env, gboolean optional_phases)
{
  fx->tmpdir = matcha_test_tmpdir_new ();
  fx->config = matcha_test_config_new (fx->tmpdir, env);
  fx->config->with_package_manager = optional_phases;
  fx->config->with_kernel = optional_phases;
  fx->rec = matcha_test_recorder_new ();
  fx->executor = matcha_test_recorder_new_executor (fx->rec);
  fx->store = matcha_state_store_new_memory (matcha_env_kind_to_string (env));
  fx->ctx = matcha_build_context_new (fx->config, fx->executor, fx->store);
  matcha_test_output_capture (&fx->out);
}

static void
host_setup (Fixture *fx, gconstpointer data)
{
  setup (fx, MATCHA_ENV_HOST, FALSE);
}

static void
target_setup (Fixture *fx, gconstpointer data)
{
  setup (fx, MATCHA_ENV_TARGET, FALSE);
}

static void
fixture_teardown (Fixture *fx, gconstpointer data)
{
  matcha_test_output_release (&fx->out);
  matcha_build_context_free (fx->ctx);
  matcha_state_store_unref (fx->store);
  matcha_executor_unref (fx->executor);
  matcha_test_recorder_free (fx->rec);
  matcha_config_free (fx->config);
  matcha_test_tmpdir_free (fx->tmpdir);
}

static char *
phase_steps (MatchaPhase *phase)
{
  g_autoptr (GPtrArray) ids = g_ptr_array_new ();
  for (guint i = 0; i < matcha_phase_get_n_steps (phase); i++)
    g_ptr_array_add (ids, (gpointer)matcha_phase_get_step_id (phase, i));
  g_ptr_array_add (ids, NULL);
  return g_strjoinv (",", (char **)ids->pdata);
}

static char *
plan_phases (MatchaPlan *plan)
{
  g_autoptr (GPtrArray) names = g_ptr_array_new ();
  for (guint i = 0; i < matcha_plan_get_n_phases (plan); i++)
    g_ptr_array_add (names, (gpointer)matcha_phase_get_name (matcha_plan_get_phase (plan, i)));
  g_ptr_array_add (names, NULL);
  return g_strjoinv (",", (char **)names->pdata);
}

/* Mark everything but @step_id done, then run the plan */
static gboolean
run_only (Fixture *fx, MatchaPlan *plan, const char *step_id, GError **error)
{
  g_autoptr (GPtrArray) ids = matcha_plan_get_step_ids (plan);
  for (guint i = 0; i < ids->len; i++)
    {
      auto id = static_cast<const char *> (ids->pdata[i]);
      if (g_str_equal (id, step_id))
        g_assert (matcha_state_store_clear (fx->store, id, error));
      else
        g_assert (matcha_state_store_set_done (fx->store, id, error));
    }
  return matcha_plan_run (plan, fx->ctx, NULL, error);
}

static void
test_host_layout (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaPlan) plan = matcha_host_plan_new (fx->ctx, "/proc/self/exe", &error);
  g_assert_no_error (error);

  g_autofree char *phases = plan_phases (plan);
  g_assert_cmpstr (phases, ==,
                   "filesystem-preparation,base-setup,profile,pseudo-filesystems,"
                   "temporary-toolchain,environment-transition");
  g_autofree char *toolchain
      = phase_steps (matcha_plan_lookup_phase (plan, "temporary-toolchain"));
  g_assert_cmpstr (toolchain, ==, "binutils-pass1,gcc-pass1,linux-headers,glibc-pass1");

  fx->config->with_package_manager = TRUE;
  g_autoptr (MatchaPlan) full = matcha_host_plan_new (fx->ctx, "/proc/self/exe", &error);
  g_assert_no_error (error);
  g_autofree char *guix = phase_steps (matcha_plan_lookup_phase (full, "package-manager"));
  g_assert_cmpstr (guix, ==, "guix-fetch,guix-build,guix-users,guix-daemon");
}

static void
test_prepare_fs (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaPlan) plan = matcha_host_plan_new (fx->ctx, "/proc/self/exe", &error);
  g_assert_no_error (error);

  /* Devices already formatted and mounted: only swap gets touched */
  g_assert (run_only (fx, plan, "prepare-fs", &error));
  g_assert_no_error (error);
  g_assert_cmpuint (matcha_test_recorder_count (fx->rec, "blkid"), ==, 2);
  g_assert_cmpuint (matcha_test_recorder_count (fx->rec, "mkfs"), ==, 0);
  g_assert_cmpuint (matcha_test_recorder_count (fx->rec, "swapon /dev/vdb1"), ==, 1);
  g_assert_cmpuint (matcha_test_recorder_count (fx->rec, "mount -v"), ==, 0);

  /* Fresh devices */
  matcha_test_recorder_clear (fx->rec);
  matcha_test_recorder_fail_on (fx->rec, "blkid");
  matcha_test_recorder_fail_on (fx->rec, "mountpoint");
  g_assert (run_only (fx, plan, "prepare-fs", &error));
  g_assert_no_error (error);
  g_assert_cmpint (matcha_test_recorder_index (fx->rec, "mkfs -v -t ext4 /dev/vdb2"), >, 0);
  g_assert_cmpint (matcha_test_recorder_index (fx->rec, "mkfs -v -t ext4 /dev/vdb3"), >, 0);
  g_autofree char *mount_root = g_strdup_printf ("mount -v -t ext4 /dev/vdb2 %s", fx->tmpdir);
  g_assert_cmpint (matcha_test_recorder_index (fx->rec, mount_root), >, 0);
  g_autofree char *log = g_build_filename (fx->config->log_dir, "prepare-fs-mkfs-root.log", NULL);
  g_assert (g_file_test (log, G_FILE_TEST_IS_REGULAR));
}

/* A fake binary plus the libraries ldd will report for it */
static char *
setup_fake_self (Fixture *fx, const char *extra_ldd_line)
{
  g_autoptr (GError) error = NULL;
  g_autofree char *self_exe = g_build_filename (fx->tmpdir, "self", NULL);
  g_assert (glnx_file_replace_contents_at (AT_FDCWD, self_exe, (const guint8 *)"\177ELF", 4,
                                           GLNX_FILE_REPLACE_NODATASYNC, NULL, &error));
  g_assert_no_error (error);

  g_autofree char *hostlib = g_build_filename (fx->tmpdir, "hostlib", NULL);
  g_assert (glnx_shutil_mkdir_p_at (AT_FDCWD, hostlib, 0755, NULL, &error));
  g_assert_no_error (error);
  const char *files[][2] = { { "libglib-2.0.so.0.8000.0", "glib" },
                             { "libarchive.so.13.7.4", "archive" },
                             { "ld-linux-x86-64.so.2", "interp" } };
  for (guint i = 0; i < G_N_ELEMENTS (files); i++)
    {
      g_autofree char *path = g_build_filename (hostlib, files[i][0], NULL);
      g_assert (glnx_file_replace_contents_at (AT_FDCWD, path, (const guint8 *)files[i][1], -1,
                                               GLNX_FILE_REPLACE_NODATASYNC, NULL, &error));
      g_assert_no_error (error);
    }
  g_autofree char *soname = g_build_filename (hostlib, "libglib-2.0.so.0", NULL);
  g_assert_cmpint (symlink ("libglib-2.0.so.0.8000.0", soname), ==, 0);

  g_autofree char *ldd = g_strdup_printf (
      "\tlinux-vdso.so.1 (0x00007ffd4a3f2000)\n"
      "\tlibglib-2.0.so.0 => %s/libglib-2.0.so.0 (0x00007f1c2a000000)\n"
      "\tlibarchive.so.13 => %s/libarchive.so.13.7.4 (0x00007f1c29e00000)\n"
      "%s"
      "\t%s/ld-linux-x86-64.so.2 (0x00007f1c2a400000)\n",
      hostlib, hostlib, extra_ldd_line ?: "", hostlib);
  matcha_test_recorder_set_output (fx->rec, "ldd", ldd);
  return util::move_nullify (self_exe);
}

static void
test_transition (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autofree char *self_exe = setup_fake_self (fx, NULL);

  g_autoptr (MatchaPlan) plan = matcha_host_plan_new (fx->ctx, self_exe, &error);
  g_assert_no_error (error);
  g_assert (run_only (fx, plan, MATCHA_TRANSITION_STEP, &error));
  g_assert_no_error (error);

  g_autofree char *binary = g_build_filename (fx->tmpdir, MATCHA_TARGET_BINARY, NULL);
  g_assert (g_file_test (binary, G_FILE_TEST_IS_EXECUTABLE));
  g_assert_cmpint (matcha_test_recorder_index (fx->rec, "ldd"), >=, 0);

  /* The libraries and the interpreter land in a private directory under
   * their sonames, symlinks copied as regular files.
   */
  g_autofree char *libdir = g_build_filename (fx->tmpdir, MATCHA_TARGET_LIBDIR, NULL);
  const char *installed[][2] = { { "libglib-2.0.so.0", "glib" },
                                 { "libarchive.so.13", "archive" },
                                 { "ld-linux-x86-64.so.2", "interp" } };
  for (guint i = 0; i < G_N_ELEMENTS (installed); i++)
    {
      g_autofree char *path = g_build_filename (libdir, installed[i][0], NULL);
      struct stat stbuf;
      g_assert_cmpint (lstat (path, &stbuf), ==, 0);
      g_assert (S_ISREG (stbuf.st_mode));
      g_autofree char *contents = glnx_file_get_contents_utf8_at (AT_FDCWD, path, NULL, NULL,
                                                                  &error);
      g_assert_no_error (error);
      g_assert_cmpstr (contents, ==, installed[i][1]);
    }
  g_autofree char *vdso = g_build_filename (libdir, "linux-vdso.so.1", NULL);
  g_assert (!g_file_test (vdso, G_FILE_TEST_EXISTS));

  /* The target half reads its configuration from inside the root */
  g_autofree char *conf = g_build_filename (fx->tmpdir, MATCHA_TARGET_CONFIG, NULL);
  g_autoptr (MatchaConfig) target = matcha_config_new_defaults (MATCHA_ENV_HOST);
  g_assert (matcha_config_load_file (target, conf, FALSE, &error));
  g_assert_no_error (error);
  g_assert_cmpint (target->env, ==, MATCHA_ENV_TARGET);
  g_assert_cmpstr (target->root, ==, "/");
  g_assert_cmpstr (target->root_part, ==, "/dev/vdb2");

  const char *command = "/" MATCHA_TARGET_LIBDIR "/ld-linux-x86-64.so.2 --library-path /"
                        MATCHA_TARGET_LIBDIR " /" MATCHA_TARGET_BINARY " run --env=target";

  g_autofree char *launcher = g_build_filename (fx->tmpdir, MATCHA_TARGET_LAUNCHER, NULL);
  g_assert (g_file_test (launcher, G_FILE_TEST_IS_EXECUTABLE));
  g_autofree char *script = glnx_file_get_contents_utf8_at (AT_FDCWD, launcher, NULL, NULL, &error);
  g_assert_no_error (error);
  g_assert (strstr (script, command) != NULL);

  /* The host helper starts the binary directly, without a shell in the root */
  g_autofree char *helper = g_build_filename (fx->config->helper_dir, MATCHA_ENTER_CHROOT_HELPER,
                                              NULL);
  g_autofree char *enter = glnx_file_get_contents_utf8_at (AT_FDCWD, helper, NULL, NULL, &error);
  g_assert_no_error (error);
  g_assert (strstr (enter, fx->tmpdir) != NULL);
  g_autofree char *chroot_line = g_strconcat ("chroot \"$MATCHA\" ", command, NULL);
  g_assert (strstr (enter, chroot_line) != NULL);
  g_assert (matcha_test_output_has (&fx->out, "MSG Installed 3 shared libraries"));
  g_assert (matcha_test_output_has (&fx->out, "MSG Created chroot automation script"));
}

static void
test_transition_missing_library (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autofree char *self_exe = setup_fake_self (fx, "\tlibsystemd.so.0 => not found\n");

  g_autoptr (MatchaPlan) plan = matcha_host_plan_new (fx->ctx, self_exe, &error);
  g_assert_no_error (error);
  g_assert (!run_only (fx, plan, MATCHA_TRANSITION_STEP, &error));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_NOT_FOUND);
  g_assert (strstr (error->message, "libsystemd.so.0") != NULL);
  g_clear_error (&error);

  MatchaStepStatus status;
  g_assert (matcha_state_store_get_status (fx->store, MATCHA_TRANSITION_STEP, &status, &error));
  g_assert_no_error (error);
  g_assert_cmpint (status, ==, MATCHA_STEP_STATUS_PENDING);

  g_autofree char *launcher = g_build_filename (fx->tmpdir, MATCHA_TARGET_LAUNCHER, NULL);
  g_assert (!g_file_test (launcher, G_FILE_TEST_EXISTS));
}

static void
test_target_layout (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaPlan) plan = matcha_target_plan_new (fx->ctx, NULL, &error);
  g_assert_no_error (error);

  g_autofree char *phases = plan_phases (plan);
  g_assert_cmpstr (phases, ==, "packages,system-configuration");
  MatchaPhase *packages = matcha_plan_get_phase (plan, 0);
  g_autofree char *steps = phase_steps (packages);
  g_assert_cmpstr (steps, ==,
                   "bzip2,coreutils,make,gcc-final,linux-build,util-linux,e2fsprogs,bash");
  g_assert_cmpuint (matcha_phase_get_n_steps (packages) + matcha_phase_get_n_notices (packages),
                    ==, MATCHA_N_TARGET_PACKAGES);

  fx->config->with_kernel = TRUE;
  g_autoptr (MatchaPlan) kernel = matcha_target_plan_new (fx->ctx, NULL, &error);
  g_assert_no_error (error);
  g_autofree char *kernel_steps = phase_steps (matcha_plan_lookup_phase (kernel, "kernel"));
  g_assert_cmpstr (kernel_steps, ==, "kernel-build,kernel-install,bootloader");
}

static void
test_target_only (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  const char *only[] = { "perl", "coreutils", NULL };
  g_autoptr (MatchaPlan) plan = matcha_target_plan_new (fx->ctx, only, &error);
  g_assert_no_error (error);
  MatchaPhase *packages = matcha_plan_get_phase (plan, 0);
  g_autofree char *steps = phase_steps (packages);
  g_assert_cmpstr (steps, ==, "coreutils");
  g_assert_cmpuint (matcha_phase_get_n_notices (packages), ==, 1);

  const char *host_only[] = { "glibc", NULL };
  g_assert (matcha_target_plan_new (fx->ctx, host_only, &error) == NULL);
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_UNSUPPORTED);
  g_clear_error (&error);

  const char *unknown[] = { "emacs", NULL };
  g_assert (matcha_target_plan_new (fx->ctx, unknown, &error) == NULL);
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_UNSUPPORTED);
}

static void
test_target_unsupported_continues (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  const char *only[] = { "diffutils", "perl", NULL };
  g_autoptr (MatchaPlan) plan = matcha_target_plan_new (fx->ctx, only, &error);
  g_assert_no_error (error);

  g_assert (matcha_plan_run (plan, fx->ctx, NULL, &error));
  g_assert_no_error (error);
  g_assert (matcha_test_output_has (&fx->out, "WARN No automated recipe for diffutils"));
  g_assert (matcha_test_output_has (&fx->out, "WARN No automated recipe for perl"));

  /* The loop went on to the next phase */
  g_autofree char *hosts = g_build_filename (fx->tmpdir, "etc", "hosts", NULL);
  g_autofree char *contents = glnx_file_get_contents_utf8_at (AT_FDCWD, hosts, NULL, NULL, &error);
  g_assert_no_error (error);
  g_assert_cmpstr (contents, ==, "127.0.0.1 localhost\n127.0.1.1 matcha\n");
}

int
main (int argc, char *argv[])
{
  g_test_init (&argc, &argv, NULL);

  g_test_add ("/plans/host/layout", Fixture, NULL, host_setup, test_host_layout,
              fixture_teardown);
  g_test_add ("/plans/host/prepare-fs", Fixture, NULL, host_setup, test_prepare_fs,
              fixture_teardown);
  g_test_add ("/plans/host/transition", Fixture, NULL, host_setup, test_transition,
              fixture_teardown);
  g_test_add ("/plans/host/transition-missing-library", Fixture, NULL, host_setup,
              test_transition_missing_library, fixture_teardown);
  g_test_add ("/plans/target/layout", Fixture, NULL, target_setup, test_target_layout,
              fixture_teardown);
  g_test_add ("/plans/target/only", Fixture, NULL, target_setup, test_target_only,
              fixture_teardown);
  g_test_add ("/plans/target/unsupported-continues", Fixture, NULL, target_setup,
              test_target_unsupported_continues, fixture_teardown);

  return g_test_run ();
}
