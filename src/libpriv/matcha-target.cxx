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

#include <stdlib.h>
#include <string.h>
#include <sys/utsname.h>

#include "matcha-errors.h"
#include "matcha-output.h"
#include "matcha-recipes.h"
#include "matcha-target.h"
#include "matcha-util.h"

#include <libglnx.h>

static gboolean
write_config_file (MatchaBuildContext *ctx, const char *relpath, const char *contents,
                   GCancellable *cancellable, GError **error)
{
  g_autofree char *path = matcha_build_context_path (ctx, relpath);
  g_autofree char *dir = g_path_get_dirname (path);
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, dir, 0755, cancellable, error))
    return FALSE;
  return glnx_file_replace_contents_with_perms_at (AT_FDCWD, path, (guint8 *)contents,
                                                   strlen (contents), 0644, (uid_t)-1,
                                                   (gid_t)-1, GLNX_FILE_REPLACE_DATASYNC_NEW,
                                                   cancellable, error);
}

static gboolean
write_hosts (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
             GError **error)
{
  const char *hostname = ctx->config->hostname;
  g_autofree char *hosts
      = g_strdup_printf ("127.0.0.1 localhost\n127.0.1.1 %s\n", hostname);
  g_autofree char *hostname_contents = g_strconcat (hostname, "\n", NULL);
  if (!write_config_file (ctx, "etc/hosts", hosts, cancellable, error))
    return FALSE;
  return write_config_file (ctx, "etc/hostname", hostname_contents, cancellable, error);
}

static char *
kernel_source_dir (MatchaBuildContext *ctx)
{
  return matcha_build_context_path (ctx, ctx->config->kernel_source_dir);
}

static gboolean
kernel_build (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
              GError **error)
{
  g_autofree char *srcdir = kernel_source_dir (ctx);
  g_autofree char *jobs = g_strdup_printf ("-j%u", ctx->config->jobs);
  g_autofree char *mod_path = g_strconcat ("INSTALL_MOD_PATH=", ctx->config->root, NULL);

  const char *defconfig[] = { "make", "defconfig", NULL };
  if (!matcha_build_context_run (ctx, "kernel-build", "defconfig", defconfig, srcdir, cancellable,
                                 error))
    return FALSE;
  const char *make[] = { "make", jobs, NULL };
  if (!matcha_build_context_run (ctx, "kernel-build", "make", make, srcdir, cancellable, error))
    return FALSE;
  const char *modules[] = { "make", "modules_install", mod_path, NULL };
  return matcha_build_context_run (ctx, "kernel-build", "modules-install", modules, srcdir,
                                   cancellable, error);
}

static gboolean
copy_file (const char *src, const char *dest, GCancellable *cancellable, GError **error)
{
  /* arch/<machine>/boot/bzImage is usually a symlink into arch/x86 */
  g_autofree char *real_src = realpath (src, NULL);
  if (!real_src)
    return glnx_throw_errno_prefix (error, "realpath(%s)", src);
  if (!glnx_file_copy_at (AT_FDCWD, real_src, NULL, AT_FDCWD, dest,
                          (GLnxFileCopyFlags)(GLNX_FILE_COPY_OVERWRITE | GLNX_FILE_COPY_NOXATTRS),
                          cancellable, error))
    return glnx_prefix_error (error, "Copying %s", src);
  return TRUE;
}

/* Copy the kernel image, System.map and config into /boot */
static gboolean
kernel_install (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
                GError **error)
{
  MatchaConfig *config = ctx->config;
  const char *kver = config->kernel_version;
  g_autofree char *srcdir = kernel_source_dir (ctx);
  g_autofree char *bootdir = matcha_build_context_path (ctx, "boot");
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, bootdir, 0755, cancellable, error))
    return FALSE;

  struct utsname uts;
  if (uname (&uts) < 0)
    return glnx_throw_errno_prefix (error, "uname");

  g_autofree char *image = g_build_filename (srcdir, "arch", uts.machine, "boot", "bzImage", NULL);
  g_autofree char *vmlinuz_name
      = g_strdup_printf ("vmlinuz-%s-matcha-%s", kver, MATCHA_RELEASE);
  g_autofree char *vmlinuz = g_build_filename (bootdir, vmlinuz_name, NULL);
  if (!copy_file (image, vmlinuz, cancellable, error))
    return FALSE;

  g_autofree char *map_src = g_build_filename (srcdir, "System.map", NULL);
  g_autofree char *map_name = g_strconcat ("System.map-", kver, NULL);
  g_autofree char *map_dest = g_build_filename (bootdir, map_name, NULL);
  if (!copy_file (map_src, map_dest, cancellable, error))
    return FALSE;

  g_autofree char *config_src = g_build_filename (srcdir, ".config", NULL);
  g_autofree char *config_name = g_strconcat ("config-", kver, NULL);
  g_autofree char *config_dest = g_build_filename (bootdir, config_name, NULL);
  return copy_file (config_src, config_dest, cancellable, error);
}

static gboolean
bootloader (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
            GError **error)
{
  MatchaConfig *config = ctx->config;
  const char *grub_install[] = { "grub-install", config->disk, NULL };
  if (!matcha_build_context_run (ctx, "bootloader", "grub-install", grub_install, NULL,
                                 cancellable, error))
    return FALSE;

  g_autofree char *grub_cfg = g_strdup_printf (
      "set default=0\n"
      "set timeout=5\n"
      "set root=(hd0,2)\n"
      "menuentry \"MATCHA %s (%s)\" {\n"
      "  linux /boot/vmlinuz-%s-matcha-%s root=%s ro\n"
      "}\n",
      MATCHA_RELEASE, config->kernel_version, config->kernel_version, MATCHA_RELEASE,
      config->root_part);
  return write_config_file (ctx, "boot/grub/grub.cfg", grub_cfg, cancellable, error);
}

static gboolean
parse_only_packages (const char *const *only_packages, gboolean *selected, GError **error)
{
  for (const char *const *iter = only_packages; iter && *iter; iter++)
    {
      MatchaPackage pkg;
      if (!matcha_package_from_name (*iter, &pkg, error))
        return FALSE;
      if (pkg >= MATCHA_N_TARGET_PACKAGES)
        return matcha_throw (error, MATCHA_ERROR_UNSUPPORTED, "%s is not a target package",
                             *iter);
      selected[pkg] = TRUE;
    }
  return TRUE;
}

/**
 * matcha_target_plan_new:
 * @only_packages: (nullable): Restrict the package loop to these names
 *
 * Build the plan run inside the chroot.  The package loop follows the
 * fixed target order; packages without a recipe become notices and the
 * loop carries on.
 */
MatchaPlan *
matcha_target_plan_new (MatchaBuildContext *ctx, const char *const *only_packages,
                        GError **error)
{
  g_autoptr (MatchaRecipeRegistry) registry = matcha_recipe_registry_new_target (error);
  if (!registry)
    return NULL;

  gboolean selected[MATCHA_N_TARGET_PACKAGES] = {
    FALSE,
  };
  gboolean filtered = only_packages && *only_packages;
  if (filtered && !parse_only_packages (only_packages, selected, error))
    return NULL;

  g_autoptr (MatchaPlan) plan = matcha_plan_new ("target");
  MatchaPhase *phase = matcha_plan_add_phase (plan, "packages");
  for (guint i = 0; i < MATCHA_N_TARGET_PACKAGES; i++)
    {
      if (filtered && !selected[i])
        continue;
      auto pkg = (MatchaPackage)i;
      const MatchaRecipe *recipe = matcha_recipe_registry_dispatch (registry, pkg);
      if (!recipe)
        {
          matcha_phase_add_notice (phase, "No automated recipe for %s",
                                   matcha_package_to_name (pkg));
          continue;
        }
      matcha_phase_add_step (phase, recipe->step_id, matcha_recipe_step_func, (gpointer)recipe,
                             NULL);
    }

  phase = matcha_plan_add_phase (plan, "system-configuration");
  matcha_phase_add_step (phase, "hosts-file", write_hosts, NULL, NULL);

  if (ctx->config->with_kernel)
    {
      phase = matcha_plan_add_phase (plan, "kernel");
      matcha_phase_add_step (phase, "kernel-build", kernel_build, NULL, NULL);
      matcha_phase_add_step (phase, "kernel-install", kernel_install, NULL, NULL);
      matcha_phase_add_step (phase, "bootloader", bootloader, NULL, NULL);
    }

  if (!matcha_plan_validate (plan, error))
    return NULL;
  return util::move_nullify (plan);
}
