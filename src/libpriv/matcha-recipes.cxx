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

#include "matcha-archive.h"
#include "matcha-errors.h"
#include "matcha-output.h"
#include "matcha-recipes.h"
#include "matcha-util.h"

#include <libglnx.h>

static const char *const package_names[] = {
  "bzip2", "coreutils", "diffutils", "findutils", "gawk",   "grep",      "gzip",
  "make",  "patch",     "tar",       "xz",        "binutils", "gcc",     "linux",
  "util-linux", "e2fsprogs", "shadow", "sysklogd", "procps-ng", "man-db", "perl",
  "python3", "bash",    "mpfr",      "gmp",       "mpc",    "glibc",     "guix",
};
G_STATIC_ASSERT (G_N_ELEMENTS (package_names) == MATCHA_N_PACKAGES);

const char *
matcha_package_to_name (MatchaPackage pkg)
{
  g_assert_cmpint (pkg, >=, 0);
  g_assert_cmpint (pkg, <, MATCHA_N_PACKAGES);
  return package_names[pkg];
}

gboolean
matcha_package_from_name (const char *name, MatchaPackage *out_pkg, GError **error)
{
  for (guint i = 0; i < MATCHA_N_PACKAGES; i++)
    {
      if (g_str_equal (package_names[i], name))
        {
          *out_pkg = (MatchaPackage)i;
          return TRUE;
        }
    }
  return matcha_throw (error, MATCHA_ERROR_UNSUPPORTED, "Unknown package '%s'", name);
}

struct MatchaRecipeRegistry {
  const MatchaRecipe *recipes[MATCHA_N_PACKAGES];
  GHashTable *step_ids;
};

MatchaRecipeRegistry *
matcha_recipe_registry_new (void)
{
  MatchaRecipeRegistry *registry = g_new0 (MatchaRecipeRegistry, 1);
  registry->step_ids = g_hash_table_new (g_str_hash, g_str_equal);
  return registry;
}

void
matcha_recipe_registry_free (MatchaRecipeRegistry *registry)
{
  g_hash_table_unref (registry->step_ids);
  g_free (registry);
}

static gboolean
validate_recipe (const MatchaRecipe *recipe, GError **error)
{
  if (!matcha_step_id_validate (recipe->step_id, error))
    return FALSE;
  if (!recipe->archive || !*recipe->archive)
    return glnx_throw (error, "Empty archive name");
  if (recipe->n_actions == 0 || !recipe->actions)
    return glnx_throw (error, "No actions");

  g_autoptr (GHashTable) log_phases = g_hash_table_new (g_str_hash, g_str_equal);
  for (guint i = 0; i < recipe->n_actions; i++)
    {
      const MatchaRecipeAction *action = &recipe->actions[i];
      if (!action->log_phase || !*action->log_phase)
        return glnx_throw (error, "Action %u has no log phase", i);
      if (!action->argv[0])
        return glnx_throw (error, "Action '%s' has an empty command line", action->log_phase);
      if (i > 0 && action->kind < recipe->actions[i - 1].kind)
        return glnx_throw (error, "Action '%s' is out of order", action->log_phase);
      /* Would overwrite another action's log */
      if (!g_hash_table_add (log_phases, (gpointer)action->log_phase))
        return glnx_throw (error, "Duplicate log phase '%s'", action->log_phase);
    }

  for (guint i = 0; i < recipe->n_extra_packages; i++)
    {
      MatchaPackage extra = recipe->extra_packages[i];
      if (extra < 0 || extra >= MATCHA_N_PACKAGES)
        return glnx_throw (error, "Unknown extra package %d", (int)extra);
    }
  return TRUE;
}

/**
 * matcha_recipe_registry_register:
 * @recipe: (transfer none): Must outlive @registry
 *
 * Add @recipe.  Malformed recipes, a second recipe for the same package
 * and a reused step id are all rejected here rather than when the
 * recipe runs.
 */
gboolean
matcha_recipe_registry_register (MatchaRecipeRegistry *registry, const MatchaRecipe *recipe,
                                 GError **error)
{
  if (recipe->package < 0 || recipe->package >= MATCHA_N_PACKAGES)
    return matcha_throw (error, MATCHA_ERROR_INVALID, "Invalid package identifier %d",
                         (int)recipe->package);

  const char *pkgname = matcha_package_to_name (recipe->package);
  g_autoptr (GError) local_error = NULL;
  if (!validate_recipe (recipe, &local_error))
    return matcha_throw (error, MATCHA_ERROR_INVALID, "Recipe for %s: %s", pkgname,
                         local_error->message);

  if (registry->recipes[recipe->package])
    return matcha_throw (error, MATCHA_ERROR_INVALID, "Duplicate recipe for %s", pkgname);
  if (g_hash_table_contains (registry->step_ids, recipe->step_id))
    return matcha_throw (error, MATCHA_ERROR_INVALID, "Recipe for %s: step id '%s' already used",
                         pkgname, recipe->step_id);

  registry->recipes[recipe->package] = recipe;
  g_hash_table_add (registry->step_ids, (gpointer)recipe->step_id);
  return TRUE;
}

/* Returns %NULL if there is no automated recipe for @pkg */
const MatchaRecipe *
matcha_recipe_registry_dispatch (MatchaRecipeRegistry *registry, MatchaPackage pkg)
{
  if (pkg < 0 || pkg >= MATCHA_N_PACKAGES)
    return NULL;
  return registry->recipes[pkg];
}

guint
matcha_recipe_registry_get_size (MatchaRecipeRegistry *registry)
{
  return g_hash_table_size (registry->step_ids);
}

static gboolean
register_all (MatchaRecipeRegistry *registry, const MatchaRecipe *recipes, guint n,
              GError **error)
{
  for (guint i = 0; i < n; i++)
    {
      if (!matcha_recipe_registry_register (registry, &recipes[i], error))
        return FALSE;
    }
  return TRUE;
}

/* Host: the temporary toolchain, installed below @ROOT@/tools */

static const MatchaRecipeAction binutils_pass1_actions[] = {
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "@SRCDIR@/configure", "--prefix=@ROOT@/tools", "--with-sysroot=@ROOT@", "--target=@TARGET@",
      "--enable-gold", "--enable-ld=default", "--enable-plugins", "--disable-nls",
      "--disable-werror", NULL } },
  { MATCHA_ACTION_COMPILE, "make", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "install", NULL } },
};

static const MatchaPackage gcc_pass1_extras[]
    = { MATCHA_PACKAGE_MPFR, MATCHA_PACKAGE_GMP, MATCHA_PACKAGE_MPC };

static const MatchaRecipeAction gcc_pass1_actions[] = {
  { MATCHA_ACTION_PRE_BUILD,
    "prerequisites",
    MATCHA_RECIPE_ACTION_ALLOW_FAILURE,
    { "./contrib/download_prerequisites", NULL } },
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "@SRCDIR@/configure", "--target=@TARGET@", "--prefix=@ROOT@/tools", "--with-sysroot=@ROOT@",
      "--disable-nls", "--enable-languages=c,c++", "--without-headers", NULL } },
  { MATCHA_ACTION_COMPILE, "make-all-gcc", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "-j@JOBS@", "all-gcc", NULL } },
  { MATCHA_ACTION_COMPILE, "make-all-target-libgcc", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "-j@JOBS@", "all-target-libgcc", NULL } },
  { MATCHA_ACTION_INSTALL, "install-gcc", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "install-gcc", NULL } },
  { MATCHA_ACTION_INSTALL, "install-target-libgcc", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "install-target-libgcc", NULL } },
};

static const MatchaRecipeAction linux_headers_actions[] = {
  { MATCHA_ACTION_PRE_BUILD, "mrproper", 0, { "make", "mrproper", NULL } },
  { MATCHA_ACTION_INSTALL, "headers-install", 0,
    { "make", "headers_install", "INSTALL_HDR_PATH=@ROOT@/usr", NULL } },
};

static const MatchaRecipeAction glibc_pass1_actions[] = {
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "@SRCDIR@/configure", "--prefix=/usr", "--host=@TARGET@", "--build=@BUILD@",
      "--disable-profile", "--enable-kernel=2.6.32", NULL } },
  { MATCHA_ACTION_COMPILE, "make", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "DESTDIR=@ROOT@", "install", NULL } },
};

static const MatchaRecipeAction guix_actions[] = {
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    0,
    { "./configure", "--prefix=/usr/local", "--sysconfdir=/etc", "--localstatedir=/var",
      NULL } },
  { MATCHA_ACTION_COMPILE, "make", 0, { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", 0, { "make", "DESTDIR=@ROOT@", "install", NULL } },
};

static const MatchaRecipe host_recipes[] = {
  { MATCHA_PACKAGE_BINUTILS, "binutils-pass1", "binutils", MATCHA_RECIPE_NONE, "build-binutils",
    NULL, 0, binutils_pass1_actions, G_N_ELEMENTS (binutils_pass1_actions) },
  { MATCHA_PACKAGE_GCC, "gcc-pass1", "gcc", MATCHA_RECIPE_NONE, "build-gcc", gcc_pass1_extras,
    G_N_ELEMENTS (gcc_pass1_extras), gcc_pass1_actions, G_N_ELEMENTS (gcc_pass1_actions) },
  { MATCHA_PACKAGE_LINUX, "linux-headers", "linux", MATCHA_RECIPE_OPTIONAL, NULL, NULL, 0,
    linux_headers_actions, G_N_ELEMENTS (linux_headers_actions) },
  { MATCHA_PACKAGE_GLIBC, "glibc-pass1", "glibc", MATCHA_RECIPE_OPTIONAL, "build-glibc", NULL, 0,
    glibc_pass1_actions, G_N_ELEMENTS (glibc_pass1_actions) },
  { MATCHA_PACKAGE_GUIX, "guix-build", "guix", MATCHA_RECIPE_NONE, NULL, NULL, 0, guix_actions,
    G_N_ELEMENTS (guix_actions) },
};

MatchaRecipeRegistry *
matcha_recipe_registry_new_host (GError **error)
{
  g_autoptr (MatchaRecipeRegistry) registry = matcha_recipe_registry_new ();
  if (!register_all (registry, host_recipes, G_N_ELEMENTS (host_recipes), error))
    return NULL;
  return util::move_nullify (registry);
}

/* Target: native packages built inside the new root */

static const MatchaRecipeAction bzip2_actions[] = {
  { MATCHA_ACTION_COMPILE, "make-libbz2-so", 0, { "make", "-f", "Makefile-libbz2_so", NULL } },
  { MATCHA_ACTION_COMPILE, "clean", 0, { "make", "clean", NULL } },
  { MATCHA_ACTION_INSTALL, "install", 0, { "make", "PREFIX=/usr", "install", NULL } },
};

static const MatchaRecipeAction coreutils_actions[] = {
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    0,
    { "./configure", "--prefix=/usr", "--enable-no-install-program=kill,uptime", NULL } },
  { MATCHA_ACTION_COMPILE, "make", 0, { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", 0, { "make", "install", NULL } },
};

static const MatchaRecipeAction make_actions[] = {
  { MATCHA_ACTION_CONFIGURE, "configure", 0, { "./configure", "--prefix=/usr", NULL } },
  { MATCHA_ACTION_COMPILE, "make", 0, { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", 0, { "make", "install", NULL } },
};

static const MatchaRecipeAction gcc_final_actions[] = {
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "@SRCDIR@/configure", "--prefix=/usr", "--enable-languages=c,c++", "--disable-multilib",
      "--disable-bootstrap", "--with-system-zlib", NULL } },
  { MATCHA_ACTION_COMPILE, "make", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "install", NULL } },
};

static const MatchaRecipeAction linux_build_actions[] = {
  { MATCHA_ACTION_PRE_BUILD, "mrproper", 0, { "make", "mrproper", NULL } },
  { MATCHA_ACTION_CONFIGURE, "defconfig", 0, { "make", "defconfig", NULL } },
  { MATCHA_ACTION_COMPILE, "make", 0, { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "modules-install", 0,
    { "make", "modules_install", "INSTALL_MOD_PATH=/", NULL } },
};

static const MatchaRecipeAction util_linux_actions[] = {
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    0,
    { "./configure", "--prefix=/usr", "--sysconfdir=/etc", "--with-rootlibdir=/lib", NULL } },
  { MATCHA_ACTION_COMPILE, "make", 0, { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", 0, { "make", "install", NULL } },
};

static const MatchaRecipeAction e2fsprogs_actions[] = {
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "@SRCDIR@/configure", "--prefix=/usr", "--enable-elf-shlibs", NULL } },
  { MATCHA_ACTION_COMPILE, "make", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", MATCHA_RECIPE_ACTION_IN_BUILD_DIR,
    { "make", "install", NULL } },
};

static const MatchaRecipeAction bash_actions[] = {
  { MATCHA_ACTION_CONFIGURE,
    "configure",
    0,
    { "./configure", "--prefix=/usr", "--without-bash-malloc", NULL } },
  { MATCHA_ACTION_COMPILE, "make", 0, { "make", "-j@JOBS@", NULL } },
  { MATCHA_ACTION_INSTALL, "install", 0, { "make", "install", NULL } },
};

static const MatchaRecipe target_recipes[] = {
  { MATCHA_PACKAGE_BZIP2, "bzip2", "bzip2", MATCHA_RECIPE_NONE, NULL, NULL, 0, bzip2_actions,
    G_N_ELEMENTS (bzip2_actions) },
  { MATCHA_PACKAGE_COREUTILS, "coreutils", "coreutils", MATCHA_RECIPE_NONE, NULL, NULL, 0,
    coreutils_actions, G_N_ELEMENTS (coreutils_actions) },
  { MATCHA_PACKAGE_MAKE, "make", "make", MATCHA_RECIPE_NONE, NULL, NULL, 0, make_actions,
    G_N_ELEMENTS (make_actions) },
  { MATCHA_PACKAGE_GCC, "gcc-final", "gcc", MATCHA_RECIPE_NONE, "@SRCDIR@/build", NULL, 0,
    gcc_final_actions, G_N_ELEMENTS (gcc_final_actions) },
  { MATCHA_PACKAGE_LINUX, "linux-build", "linux", MATCHA_RECIPE_NONE, NULL, NULL, 0,
    linux_build_actions, G_N_ELEMENTS (linux_build_actions) },
  { MATCHA_PACKAGE_UTIL_LINUX, "util-linux", "util-linux", MATCHA_RECIPE_NONE, NULL, NULL, 0,
    util_linux_actions, G_N_ELEMENTS (util_linux_actions) },
  { MATCHA_PACKAGE_E2FSPROGS, "e2fsprogs", "e2fsprogs", MATCHA_RECIPE_NONE, "@SRCDIR@/build",
    NULL, 0, e2fsprogs_actions, G_N_ELEMENTS (e2fsprogs_actions) },
  { MATCHA_PACKAGE_BASH, "bash", "bash", MATCHA_RECIPE_NONE, NULL, NULL, 0, bash_actions,
    G_N_ELEMENTS (bash_actions) },
};

MatchaRecipeRegistry *
matcha_recipe_registry_new_target (GError **error)
{
  g_autoptr (MatchaRecipeRegistry) registry = matcha_recipe_registry_new ();
  if (!register_all (registry, target_recipes, G_N_ELEMENTS (target_recipes), error))
    return NULL;
  return util::move_nullify (registry);
}

/* Unpack an extra archive such as mpfr into @srcdir/<name>.  These are
 * best-effort; a missing one only produces a warning.
 */
static gboolean
unpack_extra (MatchaBuildContext *ctx, MatchaPackage pkg, const char *srcdir,
              GCancellable *cancellable, GError **error)
{
  const char *name = matcha_package_to_name (pkg);
  g_autofree char *archive_path = NULL;
  g_autoptr (GError) local_error = NULL;
  if (!matcha_archive_resolve (ctx->config->sources_dir, name, &archive_path, &local_error))
    {
      if (!g_error_matches (local_error, MATCHA_ERROR, MATCHA_ERROR_NOT_FOUND))
        {
          g_propagate_error (error, util::move_nullify (local_error));
          return FALSE;
        }
      matcha_output_warning ("%s", local_error->message);
      return TRUE;
    }

  g_autofree char *topdir = NULL;
  if (!matcha_archive_extract (archive_path, srcdir, &topdir, cancellable, error))
    return FALSE;
  g_autofree char *target = g_build_filename (srcdir, name, NULL);
  if (g_str_equal (topdir, target))
    return TRUE;
  if (!glnx_shutil_rm_rf_at (AT_FDCWD, target, cancellable, error))
    return FALSE;
  return glnx_renameat (AT_FDCWD, topdir, AT_FDCWD, target, error);
}

static gboolean
prepare_build_dir (MatchaBuildContext *ctx, const MatchaRecipe *recipe, GHashTable *vars,
                   char **out_builddir, GCancellable *cancellable, GError **error)
{
  g_autofree char *expanded = matcha_subst_vars (recipe->build_dir, vars, error);
  if (!expanded)
    return FALSE;
  g_autofree char *builddir = g_path_is_absolute (expanded)
                                  ? util::move_nullify (expanded)
                                  : g_build_filename (ctx->config->work_dir, expanded, NULL);

  /* Leftovers of an interrupted configure are never reused */
  if (!glnx_shutil_rm_rf_at (AT_FDCWD, builddir, cancellable, error))
    return FALSE;
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, builddir, 0755, cancellable, error))
    return FALSE;
  *out_builddir = util::move_nullify (builddir);
  return TRUE;
}

static gboolean
run_recipe_action (MatchaBuildContext *ctx, const MatchaRecipe *recipe,
                   const MatchaRecipeAction *action, GHashTable *vars, const char *srcdir,
                   const char *builddir, GCancellable *cancellable, GError **error)
{
  g_autoptr (GPtrArray) argv = g_ptr_array_new_with_free_func (g_free);
  for (const char *const *arg = action->argv; *arg; arg++)
    {
      char *expanded = matcha_subst_vars (*arg, vars, error);
      if (!expanded)
        return glnx_prefix_error (error, "%s-%s", recipe->step_id, action->log_phase);
      g_ptr_array_add (argv, expanded);
    }
  g_ptr_array_add (argv, NULL);

  const char *cwd = (action->flags & MATCHA_RECIPE_ACTION_IN_BUILD_DIR) ? builddir : srcdir;
  g_autoptr (GError) local_error = NULL;
  if (!matcha_build_context_run (ctx, recipe->step_id, action->log_phase,
                                 (const char *const *)argv->pdata, cwd, cancellable,
                                 &local_error))
    {
      if ((action->flags & MATCHA_RECIPE_ACTION_ALLOW_FAILURE)
          && !g_error_matches (local_error, G_IO_ERROR, G_IO_ERROR_CANCELLED))
        {
          matcha_output_warning ("Ignoring failure: %s", local_error->message);
          return TRUE;
        }
      g_propagate_error (error, util::move_nullify (local_error));
      return FALSE;
    }
  return TRUE;
}

/**
 * matcha_recipe_build:
 *
 * Resolve and unpack the recipe's archive into the work directory, then
 * run its actions in order.  For an optional recipe a missing archive
 * counts as success.
 */
gboolean
matcha_recipe_build (MatchaBuildContext *ctx, const MatchaRecipe *recipe,
                     GCancellable *cancellable, GError **error)
{
  MatchaConfig *config = ctx->config;

  g_autofree char *archive_path = NULL;
  g_autoptr (GError) local_error = NULL;
  if (!matcha_archive_resolve (config->sources_dir, recipe->archive, &archive_path, &local_error))
    {
      if ((recipe->flags & MATCHA_RECIPE_OPTIONAL)
          && g_error_matches (local_error, MATCHA_ERROR, MATCHA_ERROR_NOT_FOUND))
        {
          matcha_output_warning ("Skipping optional %s: %s", recipe->step_id,
                                 local_error->message);
          return TRUE;
        }
      g_propagate_error (error, util::move_nullify (local_error));
      return FALSE;
    }

  g_autofree char *srcdir = NULL;
  if (!matcha_archive_extract (archive_path, config->work_dir, &srcdir, cancellable, error))
    return FALSE;

  for (guint i = 0; i < recipe->n_extra_packages; i++)
    {
      if (!unpack_extra (ctx, recipe->extra_packages[i], srcdir, cancellable, error))
        return FALSE;
    }

  g_autoptr (GHashTable) vars = matcha_build_context_new_vars (ctx);
  g_hash_table_insert (vars, (char *)"SRCDIR", g_strdup (srcdir));

  g_autofree char *builddir = NULL;
  if (recipe->build_dir)
    {
      if (!prepare_build_dir (ctx, recipe, vars, &builddir, cancellable, error))
        return FALSE;
    }
  else
    builddir = g_strdup (srcdir);
  g_hash_table_insert (vars, (char *)"BUILDDIR", g_strdup (builddir));

  for (guint i = 0; i < recipe->n_actions; i++)
    {
      if (!run_recipe_action (ctx, recipe, &recipe->actions[i], vars, srcdir, builddir,
                              cancellable, error))
        return FALSE;
    }
  return TRUE;
}

gboolean
matcha_recipe_step_func (MatchaBuildContext *ctx, gpointer recipe, GCancellable *cancellable,
                         GError **error)
{
  return matcha_recipe_build (ctx, static_cast<const MatchaRecipe *> (recipe), cancellable, error);
}
