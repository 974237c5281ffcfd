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

#include <errno.h>
#include <pwd.h>
#include <string.h>
#include <sys/stat.h>

#include "matcha-errors.h"
#include "matcha-host.h"
#include "matcha-output.h"
#include "matcha-recipes.h"
#include "matcha-transition.h"
#include "matcha-util.h"

#include <libglnx.h>

#define RUN(ctx, name, phase, cancellable, error, ...)                                             \
  ({                                                                                               \
    const char *_argv[] = { __VA_ARGS__, NULL };                                                   \
    matcha_build_context_run (ctx, name, phase, _argv, NULL, cancellable, error);                  \
  })

#define PROBE(ctx, out_success, cancellable, error, ...)                                           \
  ({                                                                                               \
    const char *_argv[] = { __VA_ARGS__, NULL };                                                   \
    matcha_build_context_probe (ctx, _argv, NULL, out_success, cancellable, error);                \
  })

/* Whether some line of @path starts with @prefix; a missing file has no
 * lines.
 */
gboolean
matcha_file_has_line_prefix (const char *path, const char *prefix, gboolean *out_found,
                             GError **error)
{
  g_autofree char *contents = NULL;
  g_autoptr (GError) local_error = NULL;
  *out_found = FALSE;
  if (!g_file_get_contents (path, &contents, NULL, &local_error))
    {
      if (g_error_matches (local_error, G_FILE_ERROR, G_FILE_ERROR_NOENT))
        return TRUE;
      g_propagate_error (error, util::move_nullify (local_error));
      return FALSE;
    }
  g_auto (GStrv) lines = g_strsplit (contents, "\n", -1);
  for (char **iter = lines; *iter; iter++)
    {
      if (g_str_has_prefix (*iter, prefix))
        {
          *out_found = TRUE;
          break;
        }
    }
  return TRUE;
}

static gboolean
mkfs_if_needed (MatchaBuildContext *ctx, const char *device, const char *phase,
                GCancellable *cancellable, GError **error)
{
  gboolean has_fs = FALSE;
  if (!PROBE (ctx, &has_fs, cancellable, error, "blkid", device))
    return FALSE;
  if (has_fs)
    return TRUE;
  return RUN (ctx, "prepare-fs", phase, cancellable, error, "mkfs", "-v", "-t", "ext4", device);
}

static gboolean
mount_if_needed (MatchaBuildContext *ctx, const char *step, const char *phase,
                 const char *mountpoint, const char *const *mount_argv, GCancellable *cancellable,
                 GError **error)
{
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, mountpoint, 0755, cancellable, error))
    return FALSE;
  gboolean mounted = FALSE;
  if (!PROBE (ctx, &mounted, cancellable, error, "mountpoint", "-q", mountpoint))
    return FALSE;
  if (mounted)
    return TRUE;
  return matcha_build_context_run (ctx, step, phase, mount_argv, NULL, cancellable, error);
}

static gboolean
prepare_filesystems (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
                     GError **error)
{
  MatchaConfig *config = ctx->config;
  matcha_output_message ("Formatting and mounting filesystems");

  if (!mkfs_if_needed (ctx, config->root_part, "mkfs-root", cancellable, error))
    return FALSE;
  if (!mkfs_if_needed (ctx, config->home_part, "mkfs-home", cancellable, error))
    return FALSE;

  gboolean swap_active = FALSE;
  g_autofree char *swap_prefix = g_strconcat (config->swap_part, " ", NULL);
  if (!matcha_file_has_line_prefix ("/proc/swaps", swap_prefix, &swap_active, error))
    return FALSE;
  if (!swap_active)
    {
      if (!RUN (ctx, "prepare-fs", "mkswap", cancellable, error, "mkswap", config->swap_part))
        return FALSE;
      if (!RUN (ctx, "prepare-fs", "swapon", cancellable, error, "swapon", config->swap_part))
        return FALSE;
    }

  const char *mount_root[]
      = { "mount", "-v", "-t", "ext4", config->root_part, config->root, NULL };
  if (!mount_if_needed (ctx, "prepare-fs", "mount-root", config->root, mount_root, cancellable,
                        error))
    return FALSE;

  g_autofree char *home = matcha_build_context_path (ctx, "home");
  const char *mount_home[] = { "mount", "-v", "-t", "ext4", config->home_part, home, NULL };
  return mount_if_needed (ctx, "prepare-fs", "mount-home", home, mount_home, cancellable,
                          error);
}

static gboolean
setup_base (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
            GError **error)
{
  MatchaConfig *config = ctx->config;
  matcha_output_message ("Setting up base directories and the %s user", MATCHA_BUILD_USER);

  if (!RUN (ctx, "setup-base", "chown", cancellable, error, "chown", "root:root", config->root))
    return FALSE;
  if (chmod (config->root, 0755) < 0)
    return glnx_throw_errno_prefix (error, "chmod(%s)", config->root);

  g_autofree char *tools = matcha_build_context_path (ctx, "tools");
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, tools, 0755, cancellable, error))
    return FALSE;
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, config->sources_dir, 0755, cancellable, error))
    return FALSE;
  /* Sticky and world-writable, so the build user can drop archives in */
  if (chmod (config->sources_dir, 01777) < 0)
    return glnx_throw_errno_prefix (error, "chmod(%s)", config->sources_dir);

  gboolean exists = FALSE;
  if (!PROBE (ctx, &exists, cancellable, error, "getent", "group", MATCHA_BUILD_USER))
    return FALSE;
  if (!exists
      && !RUN (ctx, "setup-base", "groupadd", cancellable, error, "groupadd", MATCHA_BUILD_USER))
    return FALSE;

  if (!PROBE (ctx, &exists, cancellable, error, "id", "-u", MATCHA_BUILD_USER))
    return FALSE;
  if (!exists
      && !RUN (ctx, "setup-base", "useradd", cancellable, error, "useradd", "-s", "/bin/bash", "-g",
               MATCHA_BUILD_USER, "-m", "-k", "/dev/null", MATCHA_BUILD_USER))
    return FALSE;
  return TRUE;
}

static gboolean
write_profile (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
               GError **error)
{
  MatchaConfig *config = ctx->config;

  errno = 0;
  struct passwd *pw = getpwnam (MATCHA_BUILD_USER);
  if (pw == NULL)
    {
      if (errno != 0)
        return glnx_throw_errno_prefix (error, "getpwnam(%s)", MATCHA_BUILD_USER);
      return matcha_throw (error, MATCHA_ERROR_FAILED, "User %s does not exist",
                           MATCHA_BUILD_USER);
    }
  g_autofree char *homedir = g_strdup (pw->pw_dir);
  uid_t uid = pw->pw_uid;
  gid_t gid = pw->pw_gid;

  static const char bash_profile[]
      = "exec env -i HOME=$HOME TERM=$TERM PS1='\\u:\\w\\$ ' /bin/bash\n";
  g_autofree char *bashrc = g_strdup_printf ("set +h\n"
                                             "umask 022\n"
                                             "MATCHA=%s\n"
                                             "LC_ALL=POSIX\n"
                                             "MATCHA_TGT=%s\n"
                                             "PATH=/usr/bin\n"
                                             "if [ ! -L /bin ]; then PATH=/bin:$PATH; fi\n"
                                             "PATH=$MATCHA/tools/bin:$PATH\n"
                                             "CONFIG_SITE=$MATCHA/usr/share/config.site\n"
                                             "export MATCHA LC_ALL MATCHA_TGT PATH CONFIG_SITE\n"
                                             "export MAKEFLAGS=-j%u\n",
                                             config->root, config->target_triplet, config->jobs);

  const struct
  {
    const char *name;
    const char *contents;
  } files[] = {
    { ".bash_profile", bash_profile },
    { ".bashrc", bashrc },
  };
  for (guint i = 0; i < G_N_ELEMENTS (files); i++)
    {
      g_autofree char *path = g_build_filename (homedir, files[i].name, NULL);
      if (!glnx_file_replace_contents_with_perms_at (
              AT_FDCWD, path, (guint8 *)files[i].contents, strlen (files[i].contents), 0644, uid,
              gid, GLNX_FILE_REPLACE_NODATASYNC, cancellable, error))
        return FALSE;
    }
  return TRUE;
}

static gboolean
mount_pseudos (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
               GError **error)
{
  matcha_output_message ("Mounting pseudo-filesystems");

  static const struct
  {
    const char *phase;
    const char *relpath;
    const char *args[6];
  } mounts[] = {
    { "mount-dev", "dev", { "--bind", "/dev", NULL } },
    { "mount-devpts", "dev/pts", { "-t", "devpts", "devpts", "-o", "gid=5,mode=0620", NULL } },
    { "mount-proc", "proc", { "-t", "proc", "proc", NULL } },
    { "mount-sys", "sys", { "-t", "sysfs", "sysfs", NULL } },
    { "mount-run", "run", { "-t", "tmpfs", "tmpfs", NULL } },
  };
  for (guint i = 0; i < G_N_ELEMENTS (mounts); i++)
    {
      g_autofree char *target = matcha_build_context_path (ctx, mounts[i].relpath);
      g_autoptr (GPtrArray) argv = g_ptr_array_new ();
      g_ptr_array_add (argv, (char *)"mount");
      g_ptr_array_add (argv, (char *)"-v");
      for (const char *const *arg = mounts[i].args; *arg; arg++)
        g_ptr_array_add (argv, (char *)*arg);
      g_ptr_array_add (argv, target);
      g_ptr_array_add (argv, NULL);
      if (!mount_if_needed (ctx, "mount-pseudos", mounts[i].phase, target,
                            (const char *const *)argv->pdata, cancellable, error))
        return FALSE;
    }

  /* Some hosts make /dev/shm a symlink into /run */
  g_autofree char *shm = matcha_build_context_path (ctx, "dev/shm");
  struct stat stbuf;
  if (!glnx_fstatat_allow_noent (AT_FDCWD, shm, &stbuf, AT_SYMLINK_NOFOLLOW, error))
    return FALSE;
  if (errno != ENOENT && S_ISLNK (stbuf.st_mode))
    {
      g_autofree char *host_shm = realpath ("/dev/shm", NULL);
      if (!host_shm)
        return glnx_throw_errno_prefix (error, "realpath(/dev/shm)");
      g_autofree char *shm_target = matcha_build_context_path (ctx, host_shm);
      if (!glnx_shutil_mkdir_p_at (AT_FDCWD, shm_target, 01777, cancellable, error))
        return FALSE;
      if (chmod (shm_target, 01777) < 0)
        return glnx_throw_errno_prefix (error, "chmod(%s)", shm_target);
      return TRUE;
    }

  const char *mount_shm[] = { "mount", "-v", "-t", "tmpfs", "-o", "nosuid,nodev", "tmpfs", shm,
                              NULL };
  g_autoptr (GError) local_error = NULL;
  if (!mount_if_needed (ctx, "mount-pseudos", "mount-shm", shm, mount_shm, cancellable,
                        &local_error))
    matcha_output_warning ("%s", local_error->message);
  return TRUE;
}

static gboolean
guix_fetch (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
            GError **error)
{
  MatchaConfig *config = ctx->config;
  g_autofree char *basename = g_path_get_basename (MATCHA_GUIX_URL);
  g_autofree char *dest = g_build_filename (config->sources_dir, basename, NULL);
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, config->sources_dir, 0755, cancellable, error))
    return FALSE;
  return RUN (ctx, "guix-fetch", "wget", cancellable, error, "wget", "-O", dest, MATCHA_GUIX_URL);
}

/* Build users are created inside the root via --root, and the group and
 * passwd files there are checked directly.
 */
static gboolean
guix_users (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
            GError **error)
{
  MatchaConfig *config = ctx->config;
  g_autofree char *group_path = matcha_build_context_path (ctx, "etc/group");
  g_autofree char *passwd_path = matcha_build_context_path (ctx, "etc/passwd");

  gboolean found = FALSE;
  if (!matcha_file_has_line_prefix (group_path, "guixbuild:", &found, error))
    return FALSE;
  if (!found
      && !RUN (ctx, "guix-users", "groupadd", cancellable, error, "groupadd", "--root",
               config->root, "--system", "guixbuild"))
    return FALSE;

  for (guint i = 1; i <= MATCHA_GUIX_N_BUILD_USERS; i++)
    {
      g_autofree char *user = g_strdup_printf ("guixbuilder%02u", i);
      g_autofree char *prefix = g_strconcat (user, ":", NULL);
      if (!matcha_file_has_line_prefix (passwd_path, prefix, &found, error))
        return FALSE;
      if (found)
        continue;
      g_autofree char *comment = g_strdup_printf ("Guix build user %02u", i);
      g_autofree char *phase = g_strconcat ("useradd-", user, NULL);
      if (!RUN (ctx, "guix-users", phase, cancellable, error, "useradd", "--root", config->root,
                "-g", "guixbuild", "-G", "guixbuild", "-d", "/var/empty", "-s", "/bin/false", "-c",
                comment, user))
        return FALSE;
    }
  return TRUE;
}

static gboolean
guix_daemon (MatchaBuildContext *ctx, gpointer user_data, GCancellable *cancellable,
             GError **error)
{
  static const char init_script[]
      = "#!/bin/sh\n"
        "### BEGIN INIT INFO\n"
        "# Provides:          guix-daemon\n"
        "# Required-Start:    $remote_fs $syslog\n"
        "# Required-Stop:     $remote_fs $syslog\n"
        "# Default-Start:     2 3 4 5\n"
        "# Default-Stop:      0 1 6\n"
        "# Short-Description: GNU Guix Daemon\n"
        "### END INIT INFO\n"
        "case \"$1\" in\n"
        "  start)   /usr/local/bin/guix-daemon --build-users-group=guixbuild & ;;\n"
        "  stop)    killall guix-daemon ;;\n"
        "  restart) killall guix-daemon; /usr/local/bin/guix-daemon "
        "--build-users-group=guixbuild & ;;\n"
        "  *) echo \"Usage: $0 {start|stop|restart}\"; exit 1 ;;\n"
        "esac\n"
        "exit 0\n";

  g_autofree char *initd = matcha_build_context_path (ctx, "etc/init.d");
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, initd, 0755, cancellable, error))
    return FALSE;
  g_autofree char *path = g_build_filename (initd, "guix-daemon", NULL);
  return glnx_file_replace_contents_with_perms_at (AT_FDCWD, path, (guint8 *)init_script,
                                                   strlen (init_script), 0755, (uid_t)-1,
                                                   (gid_t)-1, GLNX_FILE_REPLACE_DATASYNC_NEW,
                                                   cancellable, error);
}

static void
add_recipe_step (MatchaPhase *phase, MatchaRecipeRegistry *registry, MatchaPackage pkg)
{
  const MatchaRecipe *recipe = matcha_recipe_registry_dispatch (registry, pkg);
  g_assert (recipe);
  matcha_phase_add_step (phase, recipe->step_id, matcha_recipe_step_func, (gpointer)recipe, NULL);
}

/**
 * matcha_host_plan_new:
 * @self_exe: Binary to install into the root for the target run
 *
 * Build the host-side plan.  The package-manager phase is only included
 * when enabled in the configuration.
 */
MatchaPlan *
matcha_host_plan_new (MatchaBuildContext *ctx, const char *self_exe, GError **error)
{
  g_autoptr (MatchaRecipeRegistry) registry = matcha_recipe_registry_new_host (error);
  if (!registry)
    return NULL;

  g_autoptr (MatchaPlan) plan = matcha_plan_new ("host");
  MatchaPhase *phase = matcha_plan_add_phase (plan, "filesystem-preparation");
  matcha_phase_add_step (phase, "prepare-fs", prepare_filesystems, NULL, NULL);
  phase = matcha_plan_add_phase (plan, "base-setup");
  matcha_phase_add_step (phase, "setup-base", setup_base, NULL, NULL);
  phase = matcha_plan_add_phase (plan, "profile");
  matcha_phase_add_step (phase, "write-matcha-profile", write_profile, NULL, NULL);
  phase = matcha_plan_add_phase (plan, "pseudo-filesystems");
  matcha_phase_add_step (phase, "mount-pseudos", mount_pseudos, NULL, NULL);

  phase = matcha_plan_add_phase (plan, "temporary-toolchain");
  add_recipe_step (phase, registry, MATCHA_PACKAGE_BINUTILS);
  add_recipe_step (phase, registry, MATCHA_PACKAGE_GCC);
  add_recipe_step (phase, registry, MATCHA_PACKAGE_LINUX);
  add_recipe_step (phase, registry, MATCHA_PACKAGE_GLIBC);

  phase = matcha_plan_add_phase (plan, "environment-transition");
  matcha_phase_add_step (phase, MATCHA_TRANSITION_STEP, matcha_transition_step_func,
                         g_strdup (self_exe), g_free);

  if (ctx->config->with_package_manager)
    {
      phase = matcha_plan_add_phase (plan, "package-manager");
      matcha_phase_add_step (phase, "guix-fetch", guix_fetch, NULL, NULL);
      add_recipe_step (phase, registry, MATCHA_PACKAGE_GUIX);
      matcha_phase_add_step (phase, "guix-users", guix_users, NULL, NULL);
      matcha_phase_add_step (phase, "guix-daemon", guix_daemon, NULL, NULL);
    }

  if (!matcha_plan_validate (plan, error))
    return NULL;
  return util::move_nullify (plan);
}
