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
#include "matcha-errors.h"
#include "matcha-recipes.h"
#include "matcha-stepper.h"

static const MatchaRecipeAction demo_actions[] = {
  { MATCHA_ACTION_CONFIGURE, "configure", MATCHA_RECIPE_ACTION_NONE, { "./configure", NULL } },
  { MATCHA_ACTION_INSTALL, "install", MATCHA_RECIPE_ACTION_NONE, { "make", "install", NULL } },
};

static const MatchaRecipeAction misordered_actions[] = {
  { MATCHA_ACTION_INSTALL, "install", MATCHA_RECIPE_ACTION_NONE, { "make", "install", NULL } },
  { MATCHA_ACTION_CONFIGURE, "configure", MATCHA_RECIPE_ACTION_NONE, { "./configure", NULL } },
};

static const MatchaRecipeAction duplicate_phase_actions[] = {
  { MATCHA_ACTION_COMPILE, "make", MATCHA_RECIPE_ACTION_NONE, { "make", NULL } },
  { MATCHA_ACTION_COMPILE, "make", MATCHA_RECIPE_ACTION_NONE, { "make", "check", NULL } },
};

static void
assert_register_fails (const MatchaRecipe *recipe)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaRecipeRegistry) registry = matcha_recipe_registry_new ();
  g_assert (!matcha_recipe_registry_register (registry, recipe, &error));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_INVALID);
  g_assert_cmpuint (matcha_recipe_registry_get_size (registry), ==, 0);
}

static void
test_register_validation (void)
{
  const MatchaRecipe no_actions
      = { MATCHA_PACKAGE_GREP, "grep", "grep", MATCHA_RECIPE_NONE, NULL, NULL, 0, NULL, 0 };
  assert_register_fails (&no_actions);

  const MatchaRecipe bad_id = { MATCHA_PACKAGE_GREP, "grep/../x", "grep", MATCHA_RECIPE_NONE,
                                NULL, NULL, 0, demo_actions, G_N_ELEMENTS (demo_actions) };
  assert_register_fails (&bad_id);

  const MatchaRecipe misordered
      = { MATCHA_PACKAGE_GREP, "grep", "grep", MATCHA_RECIPE_NONE, NULL, NULL, 0,
          misordered_actions, G_N_ELEMENTS (misordered_actions) };
  assert_register_fails (&misordered);

  const MatchaRecipe dup_phase
      = { MATCHA_PACKAGE_GREP, "grep", "grep", MATCHA_RECIPE_NONE, NULL, NULL, 0,
          duplicate_phase_actions, G_N_ELEMENTS (duplicate_phase_actions) };
  assert_register_fails (&dup_phase);

  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaRecipeRegistry) registry = matcha_recipe_registry_new ();
  const MatchaRecipe grep = { MATCHA_PACKAGE_GREP, "grep", "grep", MATCHA_RECIPE_NONE, NULL,
                              NULL, 0, demo_actions, G_N_ELEMENTS (demo_actions) };
  g_assert (matcha_recipe_registry_register (registry, &grep, &error));
  g_assert_no_error (error);

  /* Each package and each step id at most once */
  g_assert (!matcha_recipe_registry_register (registry, &grep, &error));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_INVALID);
  g_clear_error (&error);
  const MatchaRecipe same_step = { MATCHA_PACKAGE_GAWK, "grep", "gawk", MATCHA_RECIPE_NONE, NULL,
                                   NULL, 0, demo_actions, G_N_ELEMENTS (demo_actions) };
  g_assert (!matcha_recipe_registry_register (registry, &same_step, &error));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_INVALID);

  g_assert_cmpuint (matcha_recipe_registry_get_size (registry), ==, 1);
  g_assert (matcha_recipe_registry_dispatch (registry, MATCHA_PACKAGE_GREP) == &grep);
  g_assert (matcha_recipe_registry_dispatch (registry, MATCHA_PACKAGE_GAWK) == NULL);
}

static void
test_builtin_registries (void)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaRecipeRegistry) host = matcha_recipe_registry_new_host (&error);
  g_assert_no_error (error);
  g_autoptr (MatchaRecipeRegistry) target = matcha_recipe_registry_new_target (&error);
  g_assert_no_error (error);

  const MatchaRecipe *binutils = matcha_recipe_registry_dispatch (host, MATCHA_PACKAGE_BINUTILS);
  g_assert (binutils);
  g_assert_cmpstr (binutils->step_id, ==, "binutils-pass1");
  g_assert (matcha_recipe_registry_dispatch (host, MATCHA_PACKAGE_GUIX));

  const MatchaRecipe *gcc = matcha_recipe_registry_dispatch (target, MATCHA_PACKAGE_GCC);
  g_assert (gcc);
  g_assert_cmpstr (gcc->step_id, ==, "gcc-final");
  g_assert (matcha_recipe_registry_dispatch (target, MATCHA_PACKAGE_BZIP2));
  g_assert (matcha_recipe_registry_dispatch (target, MATCHA_PACKAGE_BASH));
  /* Packages the operator has to build by hand */
  g_assert (matcha_recipe_registry_dispatch (target, MATCHA_PACKAGE_DIFFUTILS) == NULL);
  g_assert (matcha_recipe_registry_dispatch (target, MATCHA_PACKAGE_PERL) == NULL);
}

static void
test_package_names (void)
{
  g_autoptr (GError) error = NULL;
  MatchaPackage pkg;

  for (guint i = 0; i < MATCHA_N_PACKAGES; i++)
    {
      const char *name = matcha_package_to_name ((MatchaPackage)i);
      g_assert (matcha_package_from_name (name, &pkg, &error));
      g_assert_no_error (error);
      g_assert_cmpint (pkg, ==, i);
    }
  g_assert_cmpstr (matcha_package_to_name (MATCHA_PACKAGE_PROCPS_NG), ==, "procps-ng");

  g_assert (!matcha_package_from_name ("emacs", &pkg, &error));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_UNSUPPORTED);
}

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
fixture_setup (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  fx->tmpdir = matcha_test_tmpdir_new ();
  fx->config = matcha_test_config_new (fx->tmpdir, MATCHA_ENV_HOST);
  g_assert (glnx_shutil_mkdir_p_at (AT_FDCWD, fx->config->sources_dir, 0755, NULL, &error));
  g_assert_no_error (error);
  fx->rec = matcha_test_recorder_new ();
  fx->executor = matcha_test_recorder_new_executor (fx->rec);
  fx->store = matcha_state_store_new_markers (fx->tmpdir, "host");
  fx->ctx = matcha_build_context_new (fx->config, fx->executor, fx->store);
  matcha_test_output_capture (&fx->out);
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

static void
write_source (Fixture *fx, const char *filename, const char *topdir)
{
  g_autoptr (GError) error = NULL;
  g_autofree char *path = g_build_filename (fx->config->sources_dir, filename, NULL);
  g_autofree char *dir = g_strconcat (topdir, "/", NULL);
  g_autofree char *configure = g_strconcat (topdir, "/configure=#!/bin/sh\n", NULL);
  const char *entries[] = { dir, configure, NULL };
  g_assert (matcha_test_write_tarball (path, entries, &error));
  g_assert_no_error (error);
}

static void
test_toolchain_resume (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaRecipeRegistry) host = matcha_recipe_registry_new_host (&error);
  g_assert_no_error (error);
  const MatchaRecipe *recipe = matcha_recipe_registry_dispatch (host, MATCHA_PACKAGE_BINUTILS);

  write_source (fx, "binutils-2.42.tar.xz", "binutils-2.42");

  gboolean ran = FALSE;
  g_assert (matcha_step_run (fx->ctx, "temporary-toolchain", recipe->step_id,
                             matcha_recipe_step_func, (gpointer)recipe, &ran, NULL, &error));
  g_assert_no_error (error);
  g_assert (ran);

  g_autofree char *srcdir = g_build_filename (fx->config->work_dir, "binutils-2.42", NULL);
  g_autofree char *builddir = g_build_filename (fx->config->work_dir, "build-binutils", NULL);
  g_assert (g_file_test (srcdir, G_FILE_TEST_IS_DIR));
  g_assert (g_file_test (builddir, G_FILE_TEST_IS_DIR));

  /* configure, then make, then install; all out of tree */
  int configure = matcha_test_recorder_index (fx->rec, "binutils-2.42/configure");
  int make = matcha_test_recorder_index (fx->rec, "make -j4");
  int install = matcha_test_recorder_index (fx->rec, "make install");
  g_assert_cmpint (configure, ==, 0);
  g_assert_cmpint (make, ==, 1);
  g_assert_cmpint (install, ==, 2);
  g_assert_cmpuint (fx->rec->commands->len, ==, 3);
  for (guint i = 0; i < fx->rec->cwds->len; i++)
    g_assert_cmpstr (static_cast<const char *> (fx->rec->cwds->pdata[i]), ==, builddir);

  g_autofree char *prefix = g_strdup_printf ("--prefix=%s/tools", fx->tmpdir);
  g_assert_cmpint (matcha_test_recorder_index (fx->rec, prefix), ==, 0);
  g_autofree char *target = g_strdup_printf ("--target=%s", fx->config->target_triplet);
  g_assert_cmpint (matcha_test_recorder_index (fx->rec, target), ==, 0);

  static const char *const logs[] = { "configure", "make", "install" };
  for (guint i = 0; i < G_N_ELEMENTS (logs); i++)
    {
      g_autofree char *name = g_strdup_printf ("binutils-pass1-%s.log", logs[i]);
      g_autofree char *log = g_build_filename (fx->config->log_dir, name, NULL);
      g_assert (g_file_test (log, G_FILE_TEST_IS_REGULAR));
    }

  /* A second invocation, as after a reboot: new store over the same
   * root, and nothing gets extracted or built.
   */
  g_assert (glnx_shutil_rm_rf_at (AT_FDCWD, srcdir, NULL, &error));
  g_assert_no_error (error);
  matcha_test_recorder_clear (fx->rec);

  g_autoptr (MatchaStateStore) store2 = matcha_state_store_new_markers (fx->tmpdir, "host");
  g_autoptr (MatchaBuildContext) ctx2 = matcha_build_context_new (fx->config, fx->executor, store2);
  g_assert (matcha_step_run (ctx2, "temporary-toolchain", recipe->step_id,
                             matcha_recipe_step_func, (gpointer)recipe, &ran, NULL, &error));
  g_assert_no_error (error);
  g_assert (!ran);
  g_assert_cmpuint (fx->rec->commands->len, ==, 0);
  g_assert (!g_file_test (srcdir, G_FILE_TEST_EXISTS));
  g_assert (matcha_test_output_has (&fx->out, "SKIP binutils-pass1"));
}

static void
test_missing_archive (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaRecipeRegistry) host = matcha_recipe_registry_new_host (&error);
  g_assert_no_error (error);
  const MatchaRecipe *recipe = matcha_recipe_registry_dispatch (host, MATCHA_PACKAGE_BINUTILS);

  g_assert (!matcha_step_run (fx->ctx, "temporary-toolchain", recipe->step_id,
                              matcha_recipe_step_func, (gpointer)recipe, NULL, NULL, &error));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_NOT_FOUND);
  g_assert (strstr (error->message, "binutils-pass1") != NULL);
  g_assert_cmpuint (fx->rec->commands->len, ==, 0);

  MatchaStepStatus status;
  g_clear_error (&error);
  g_assert (matcha_state_store_get_status (fx->store, recipe->step_id, &status, &error));
  g_assert_no_error (error);
  g_assert_cmpint (status, ==, MATCHA_STEP_STATUS_PENDING);
}

static void
test_optional_archive (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaRecipeRegistry) host = matcha_recipe_registry_new_host (&error);
  g_assert_no_error (error);
  const MatchaRecipe *recipe = matcha_recipe_registry_dispatch (host, MATCHA_PACKAGE_LINUX);
  g_assert (recipe->flags & MATCHA_RECIPE_OPTIONAL);

  g_assert (matcha_recipe_build (fx->ctx, recipe, NULL, &error));
  g_assert_no_error (error);
  g_assert_cmpuint (fx->rec->commands->len, ==, 0);
  g_assert (matcha_test_output_has (&fx->out, "WARN Skipping optional linux-headers"));
}

static void
test_allowed_failure (Fixture *fx, gconstpointer data)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (MatchaRecipeRegistry) host = matcha_recipe_registry_new_host (&error);
  g_assert_no_error (error);
  const MatchaRecipe *recipe = matcha_recipe_registry_dispatch (host, MATCHA_PACKAGE_GCC);

  write_source (fx, "gcc-14.2.0.tar.xz", "gcc-14.2.0");
  write_source (fx, "gmp-6.3.0.tar.xz", "gmp-6.3.0");
  matcha_test_recorder_fail_on (fx->rec, "download_prerequisites");

  g_assert (matcha_recipe_build (fx->ctx, recipe, NULL, &error));
  g_assert_no_error (error);
  g_assert (matcha_test_output_has (&fx->out, "WARN Ignoring failure"));
  /* Missing mpfr and mpc only warn; gmp gets unpacked into the tree */
  g_autofree char *gmp = g_build_filename (fx->config->work_dir, "gcc-14.2.0", "gmp", "configure",
                                           NULL);
  g_assert (g_file_test (gmp, G_FILE_TEST_IS_REGULAR));
  g_assert_cmpint (matcha_test_recorder_index (fx->rec, "install-target-libgcc"), >, 0);

  /* A failure that is not allowed stops the recipe */
  matcha_test_recorder_clear (fx->rec);
  matcha_test_recorder_fail_on (fx->rec, "all-gcc");
  g_assert (!matcha_recipe_build (fx->ctx, recipe, NULL, &error));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_ACTION_FAILED);
  g_assert_cmpint (matcha_test_recorder_index (fx->rec, "install-gcc"), ==, -1);
}

int
main (int argc, char *argv[])
{
  g_test_init (&argc, &argv, NULL);

  g_test_add_func ("/recipes/register-validation", test_register_validation);
  g_test_add_func ("/recipes/builtin-registries", test_builtin_registries);
  g_test_add_func ("/recipes/package-names", test_package_names);
  g_test_add ("/recipes/toolchain-resume", Fixture, NULL, fixture_setup, test_toolchain_resume,
              fixture_teardown);
  g_test_add ("/recipes/missing-archive", Fixture, NULL, fixture_setup, test_missing_archive,
              fixture_teardown);
  g_test_add ("/recipes/optional-archive", Fixture, NULL, fixture_setup, test_optional_archive,
              fixture_teardown);
  g_test_add ("/recipes/allowed-failure", Fixture, NULL, fixture_setup, test_allowed_failure,
              fixture_teardown);

  return g_test_run ();
}
