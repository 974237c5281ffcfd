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
#include <sys/stat.h>

#include "matcha-action.h"
#include "matcha-errors.h"
#include "matcha-output.h"
#include "matcha-transition.h"
#include "matcha-util.h"

#include <libglnx.h>

static gboolean
write_file (const char *path, const char *contents, mode_t mode, GCancellable *cancellable,
            GError **error)
{
  g_autofree char *dir = g_path_get_dirname (path);
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, dir, 0755, cancellable, error))
    return FALSE;
  return glnx_file_replace_contents_with_perms_at (AT_FDCWD, path, (guint8 *)contents,
                                                   strlen (contents), mode, (uid_t)-1,
                                                   (gid_t)-1, GLNX_FILE_REPLACE_DATASYNC_NEW,
                                                   cancellable, error);
}

/* Copy what @src resolves to; /proc/self/exe and most sonames are
 * symlinks.
 */
static gboolean
copy_resolved (const char *src, const char *dest, mode_t mode, GCancellable *cancellable,
               GError **error)
{
  g_autofree char *destdir = g_path_get_dirname (dest);
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, destdir, 0755, cancellable, error))
    return FALSE;

  g_autofree char *real_src = realpath (src, NULL);
  if (!real_src)
    return glnx_throw_errno_prefix (error, "realpath(%s)", src);
  if (!glnx_file_copy_at (AT_FDCWD, real_src, NULL, AT_FDCWD, dest,
                          (GLnxFileCopyFlags)(GLNX_FILE_COPY_OVERWRITE | GLNX_FILE_COPY_NOXATTRS),
                          cancellable, error))
    return glnx_prefix_error (error, "Copying %s", real_src);
  if (chmod (dest, mode) < 0)
    return glnx_throw_errno_prefix (error, "chmod(%s)", dest);
  return TRUE;
}

/* Parse ldd output, skipping the log header.  Lines look like
 *
 *   linux-vdso.so.1 (0x00007ffc...)
 *   libglib-2.0.so.0 => /lib64/libglib-2.0.so.0 (0x00007f...)
 *   /lib64/ld-linux-x86-64.so.2 (0x00007f...)
 *
 * The one absolute path without "=>" is the ELF interpreter.
 */
static gboolean
parse_ldd_output (const char *output, GPtrArray *sonames, GPtrArray *paths, char **out_interp,
                  GError **error)
{
  g_autofree char *interp = NULL;
  g_auto (GStrv) lines = g_strsplit (output, "\n", -1);
  for (char **it = lines; *it; it++)
    {
      const char *line = *it;
      while (g_ascii_isspace (*line))
        line++;
      if (!*line || *line == '#' || *line == '$')
        continue;

      const char *arrow = strstr (line, " => ");
      const char *path = arrow ? arrow + strlen (" => ") : line;
      if (g_str_has_prefix (path, "not found"))
        {
          g_autofree char *soname = arrow ? g_strndup (line, arrow - line) : g_strdup (line);
          return matcha_throw (error, MATCHA_ERROR_NOT_FOUND, "Shared library %s not found",
                               soname);
        }
      if (*path != '/')
        continue;

      const char *end = strstr (path, " (");
      g_autofree char *libpath = end ? g_strndup (path, end - path) : g_strdup (path);
      if (!arrow && !interp)
        interp = util::move_nullify (libpath);
      else
        {
          g_autofree char *soname = arrow ? g_strndup (line, arrow - line) : g_strdup (libpath);
          g_ptr_array_add (sonames, g_path_get_basename (soname));
          g_ptr_array_add (paths, util::move_nullify (libpath));
        }
    }

  if (!interp)
    return matcha_throw (error, MATCHA_ERROR_NOT_FOUND, "No ELF interpreter in ldd output");
  *out_interp = util::move_nullify (interp);
  return TRUE;
}

/* Install this binary plus its shared library closure and ELF interpreter
 * into MATCHA_TARGET_LIBDIR.  Nothing the root build itself installs is
 * touched; the binary is started through the copied interpreter.
 */
static gboolean
install_self (MatchaBuildContext *ctx, const char *self_exe, char **out_interp,
              GCancellable *cancellable, GError **error)
{
  g_autofree char *dest = matcha_build_context_path (ctx, MATCHA_TARGET_BINARY);
  if (!copy_resolved (self_exe, dest, 0755, cancellable, error))
    return FALSE;

  g_autofree char *real_self = realpath (self_exe, NULL);
  if (!real_self)
    return glnx_throw_errno_prefix (error, "realpath(%s)", self_exe);
  const char *argv[] = { "ldd", real_self, NULL };
  if (!matcha_build_context_run (ctx, MATCHA_TRANSITION_STEP, "ldd", argv, ctx->config->root,
                                 cancellable, error))
    return FALSE;
  g_autofree char *log_path
      = matcha_action_log_path (ctx->config->log_dir, MATCHA_TRANSITION_STEP, "ldd");
  g_autofree char *output
      = glnx_file_get_contents_utf8_at (AT_FDCWD, log_path, NULL, cancellable, error);
  if (!output)
    return FALSE;

  g_autoptr (GPtrArray) sonames = g_ptr_array_new_with_free_func (g_free);
  g_autoptr (GPtrArray) paths = g_ptr_array_new_with_free_func (g_free);
  g_autofree char *interp = NULL;
  if (!parse_ldd_output (output, sonames, paths, &interp, error))
    return glnx_prefix_error (error, "Resolving libraries of %s", real_self);

  /* Named by soname, which is what the loader searches for */
  g_autofree char *libdir = matcha_build_context_path (ctx, MATCHA_TARGET_LIBDIR);
  for (guint i = 0; i < paths->len; i++)
    {
      auto soname = static_cast<const char *> (sonames->pdata[i]);
      auto libpath = static_cast<const char *> (paths->pdata[i]);
      g_autofree char *libdest = g_build_filename (libdir, soname, NULL);
      if (!copy_resolved (libpath, libdest, 0755, cancellable, error))
        return FALSE;
    }

  g_autofree char *interp_name = g_path_get_basename (interp);
  g_autofree char *interp_dest = g_build_filename (libdir, interp_name, NULL);
  if (!copy_resolved (interp, interp_dest, 0755, cancellable, error))
    return FALSE;

  matcha_output_message ("Installed %u shared libraries into /%s", paths->len + 1,
                         MATCHA_TARGET_LIBDIR);
  *out_interp = util::move_nullify (interp_name);
  return TRUE;
}

/* The command line that starts the target run inside the root */
static char *
target_command (const char *interp_name)
{
  return g_strdup_printf ("/%s/%s --library-path /%s /%s run --env=target --config=/%s",
                          MATCHA_TARGET_LIBDIR, interp_name, MATCHA_TARGET_LIBDIR,
                          MATCHA_TARGET_BINARY, MATCHA_TARGET_CONFIG);
}

static gboolean
write_target_config (MatchaBuildContext *ctx, GCancellable *cancellable, GError **error)
{
  g_autoptr (GKeyFile) kf = matcha_config_to_target_keyfile (ctx->config);
  g_autofree char *data = g_key_file_to_data (kf, NULL, NULL);
  g_autofree char *header = g_strdup_printf ("# Generated by %s for the target environment\n",
                                             PACKAGE_NAME);
  g_autofree char *contents = g_strconcat (header, data, NULL);
  g_autofree char *path = matcha_build_context_path (ctx, MATCHA_TARGET_CONFIG);
  return write_file (path, contents, 0644, cancellable, error);
}

static gboolean
write_launcher (MatchaBuildContext *ctx, const char *interp_name, GCancellable *cancellable,
                GError **error)
{
  g_autofree char *command = target_command (interp_name);
  g_autofree char *contents = g_strdup_printf (
      "#!/bin/sh\n"
      "# Builds the remaining packages from inside the chroot once a shell\n"
      "# exists there.  Safe to re-run; completed steps are skipped.\n"
      "set -e\n"
      "exec %s \"$@\"\n",
      command);
  g_autofree char *path = matcha_build_context_path (ctx, MATCHA_TARGET_LAUNCHER);
  return write_file (path, contents, 0755, cancellable, error);
}

/* Runs on the host, so it only needs the host's env and chroot */
static gboolean
write_enter_chroot (MatchaBuildContext *ctx, const char *interp_name, GCancellable *cancellable,
                    GError **error)
{
  g_autofree char *quoted_root = matcha_maybe_shell_quote (ctx->config->root);
  g_autofree char *command = target_command (interp_name);
  g_autofree char *contents = g_strdup_printf (
      "#!/bin/bash\n"
      "set -euo pipefail\n"
      "MATCHA=${MATCHA:-%s}\n"
      "if [ \"${1:-}\" = --shell ]; then\n"
      "    shift\n"
      "    exec env -i HOME=/root TERM=\"${TERM:-linux}\" \\\n"
      "        PS1='(matcha chroot) \\u:\\w\\$ ' PATH=/usr/bin:/usr/sbin:/bin:/sbin \\\n"
      "        chroot \"$MATCHA\" /bin/bash --login \"$@\"\n"
      "fi\n"
      "exec env -i HOME=/root TERM=\"${TERM:-linux}\" PATH=/usr/bin:/usr/sbin:/bin:/sbin \\\n"
      "    chroot \"$MATCHA\" %s \"$@\"\n",
      quoted_root ?: ctx->config->root, command);
  g_autofree char *path = g_build_filename (ctx->config->helper_dir, MATCHA_ENTER_CHROOT_HELPER,
                                            NULL);
  return write_file (path, contents, 0755, cancellable, error);
}

/**
 * matcha_transition_generate:
 * @self_exe: Path of the running binary, normally /proc/self/exe
 *
 * Prepare the root for the second half of the build: install this binary
 * with the libraries it runs on and a target configuration inside it, a
 * launcher for the target run, and a host helper that starts the target
 * run in the chroot.  Fails if ldd cannot resolve every library.
 */
gboolean
matcha_transition_generate (MatchaBuildContext *ctx, const char *self_exe,
                            GCancellable *cancellable, GError **error)
{
  GLNX_AUTO_PREFIX_ERROR ("Generating chroot scripts", error);

  g_autofree char *interp_name = NULL;
  if (!install_self (ctx, self_exe, &interp_name, cancellable, error))
    return FALSE;
  if (!write_target_config (ctx, cancellable, error))
    return FALSE;
  if (!write_launcher (ctx, interp_name, cancellable, error))
    return FALSE;
  if (!write_enter_chroot (ctx, interp_name, cancellable, error))
    return FALSE;

  g_autofree char *launcher = matcha_build_context_path (ctx, MATCHA_TARGET_LAUNCHER);
  matcha_output_message ("Created chroot automation script at %s", launcher);
  return TRUE;
}

gboolean
matcha_transition_step_func (MatchaBuildContext *ctx, gpointer self_exe,
                             GCancellable *cancellable, GError **error)
{
  return matcha_transition_generate (ctx, static_cast<const char *> (self_exe), cancellable,
                                     error);
}
