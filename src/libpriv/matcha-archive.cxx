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
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

#include "matcha-archive.h"
#include "matcha-errors.h"
#include "matcha-util.h"

#include <libglnx.h>

const char *const matcha_archive_suffixes[]
    = { "tar.xz", "tar.gz", "tar.bz2", "tar.lz", "tar.zst", "tar", NULL };

static gboolean
throw_libarchive_error (struct archive *ar, MatchaError code, GError **error, const char *prefix)
{
  const char *err_string = archive_error_string (ar);
  g_set_error (error, MATCHA_ERROR, code, "%s: %s", prefix, err_string ?: "unknown error");
  return FALSE;
}

/* Regular files, or symlinks to them */
static gboolean
dent_is_regular (GLnxDirFdIterator *dfd_iter, struct dirent *dent, gboolean *out_regular,
                 GError **error)
{
  if (dent->d_type == DT_REG)
    {
      *out_regular = TRUE;
      return TRUE;
    }
  if (dent->d_type != DT_LNK)
    {
      *out_regular = FALSE;
      return TRUE;
    }
  struct stat stbuf;
  if (!glnx_fstatat_allow_noent (dfd_iter->fd, dent->d_name, &stbuf, 0, error))
    return FALSE;
  *out_regular = (errno != ENOENT && S_ISREG (stbuf.st_mode));
  return TRUE;
}

static gboolean
name_matches (const char *filename, const char *prefix, const char *suffix)
{
  if (!g_str_has_prefix (filename, prefix))
    return FALSE;
  const char *rest = filename + strlen (prefix);
  size_t restlen = strlen (rest);
  size_t suffixlen = strlen (suffix);
  /* Need at least one character of version, then ".<suffix>" */
  if (restlen < suffixlen + 2)
    return FALSE;
  return rest[restlen - suffixlen - 1] == '.' && strcmp (rest + restlen - suffixlen, suffix) == 0;
}

static gint
cmp_filenames (gconstpointer a, gconstpointer b)
{
  return strcmp (*(const char *const *)a, *(const char *const *)b);
}

/**
 * matcha_archive_resolve:
 * @sources_dir: Directory holding the source archives
 * @name: Logical name, e.g. "binutils" or "binutils-"
 * @out_path: (out): Full path of the selected archive
 *
 * Pick the archive for @name.  Versions starting with a digit are
 * preferred over any other text after the prefix; within that, suffixes
 * are tried in the order of matcha_archive_suffixes, and among several
 * files with the same suffix the byte-wise smallest name wins, so the
 * result never depends on directory order.
 */
gboolean
matcha_archive_resolve (const char *sources_dir, const char *name, char **out_path,
                        GError **error)
{
  if (!name || !*name)
    return glnx_throw (error, "Empty archive name");

  g_autofree char *prefix = g_str_has_suffix (name, "-") ? g_strdup (name)
                                                         : g_strconcat (name, "-", NULL);

  struct stat stbuf;
  if (!glnx_fstatat_allow_noent (AT_FDCWD, sources_dir, &stbuf, 0, error))
    return FALSE;
  if (errno == ENOENT)
    return matcha_throw (error, MATCHA_ERROR_NOT_FOUND, "Sources directory %s does not exist",
                         sources_dir);

  g_autoptr (GPtrArray) candidates = g_ptr_array_new_with_free_func (g_free);
  g_auto (GLnxDirFdIterator) dfd_iter = {
    0,
  };
  if (!glnx_dirfd_iterator_init_at (AT_FDCWD, sources_dir, TRUE, &dfd_iter, error))
    return glnx_prefix_error (error, "Opening %s", sources_dir);
  while (TRUE)
    {
      struct dirent *dent = NULL;
      if (!glnx_dirfd_iterator_next_dent_ensure_dtype (&dfd_iter, &dent, NULL, error))
        return FALSE;
      if (!dent)
        break;
      if (!g_str_has_prefix (dent->d_name, prefix))
        continue;
      gboolean regular = FALSE;
      if (!dent_is_regular (&dfd_iter, dent, &regular, error))
        return FALSE;
      if (regular)
        g_ptr_array_add (candidates, g_strdup (dent->d_name));
    }
  g_ptr_array_sort (candidates, cmp_filenames);

  /* Names whose version starts with a digit come first, so that "bash"
   * never lands on bash-completion-2.14 while a bash-5.2 exists.
   */
  const size_t prefixlen = strlen (prefix);
  for (guint pass = 0; pass < 2; pass++)
    {
      for (const char *const *suffix = matcha_archive_suffixes; *suffix; suffix++)
        {
          for (guint i = 0; i < candidates->len; i++)
            {
              auto filename = static_cast<const char *> (candidates->pdata[i]);
              if (!name_matches (filename, prefix, *suffix))
                continue;
              gboolean numeric = g_ascii_isdigit (filename[prefixlen]);
              if ((pass == 0 && !numeric) || (pass == 1 && numeric))
                continue;
              *out_path = g_build_filename (sources_dir, filename, NULL);
              return TRUE;
            }
        }
    }

  return matcha_throw (error, MATCHA_ERROR_NOT_FOUND, "No archive matching %s* in %s", prefix,
                       sources_dir);
}

static gboolean
copy_data (struct archive *ar, struct archive *aw, GError **error)
{
  while (TRUE)
    {
      const void *buf;
      size_t size;
      la_int64_t offset;
      int r = archive_read_data_block (ar, &buf, &size, &offset);
      if (r == ARCHIVE_EOF)
        return TRUE;
      if (r < ARCHIVE_WARN)
        return throw_libarchive_error (ar, MATCHA_ERROR_ARCHIVE_CORRUPT, error, "Reading data");
      if (archive_write_data_block (aw, buf, size, offset) < ARCHIVE_WARN)
        return throw_libarchive_error (aw, MATCHA_ERROR_FAILED, error, "Writing data");
    }
}

/* Strip any leading "./" components and slashes; entries are always
 * rewritten below dest_dir.
 */
static const char *
entry_relpath (const char *path)
{
  while (g_str_has_prefix (path, "./"))
    path += 2;
  while (*path == '/')
    path++;
  return path;
}

static gboolean
path_has_dotdot (const char *path)
{
  g_auto (GStrv) components = g_strsplit (path, "/", -1);
  for (char **it = components; *it; it++)
    {
      if (g_str_equal (*it, ".."))
        return TRUE;
    }
  return FALSE;
}

/**
 * matcha_archive_extract:
 * @archive_path: Archive to unpack
 * @dest_dir: Directory to unpack into; created if needed
 * @out_topdir: (out) (optional): Path of the archive's top-level directory
 *
 * Unpack @archive_path into @dest_dir.  Any existing copy of the archive's
 * top-level directory is removed first, so a half-extracted tree left by
 * an interrupted run never gets built on.  Unreadable or truncated
 * archives are reported as %MATCHA_ERROR_ARCHIVE_CORRUPT.
 */
gboolean
matcha_archive_extract (const char *archive_path, const char *dest_dir, char **out_topdir,
                        GCancellable *cancellable, GError **error)
{
  g_autofree char *errprefix = g_strdup_printf ("Extracting %s", archive_path);
  GLNX_AUTO_PREFIX_ERROR (errprefix, error);

  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, dest_dir, 0755, cancellable, error))
    return FALSE;
  /* SECURE_SYMLINKS checks every component of the rewritten entry path,
   * so the prefix must be free of symlinks.
   */
  g_autofree char *real_dest = realpath (dest_dir, NULL);
  if (!real_dest)
    return glnx_throw_errno_prefix (error, "realpath(%s)", dest_dir);

  g_autoptr (archive) ar = archive_read_new ();
  if (ar == NULL)
    return glnx_throw (error, "Failed to initialize archive reader");
  archive_read_support_filter_all (ar);
  archive_read_support_format_all (ar);
  if (archive_read_open_filename (ar, archive_path, 10240) != ARCHIVE_OK)
    return throw_libarchive_error (ar, MATCHA_ERROR_ARCHIVE_CORRUPT, error, "Opening");

  g_autoptr (MatchaArchiveWriter) aw = archive_write_disk_new ();
  if (aw == NULL)
    return glnx_throw (error, "Failed to initialize archive writer");
  archive_write_disk_set_options (aw, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM
                                          | ARCHIVE_EXTRACT_UNLINK
                                          | ARCHIVE_EXTRACT_SECURE_NODOTDOT
                                          | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
  archive_write_disk_set_standard_lookup (aw);

  g_autofree char *topdir = NULL;
  guint n_entries = 0;
  while (TRUE)
    {
      if (g_cancellable_set_error_if_cancelled (cancellable, error))
        return FALSE;

      struct archive_entry *entry = NULL;
      int r = archive_read_next_header (ar, &entry);
      if (r == ARCHIVE_EOF)
        break;
      if (r < ARCHIVE_WARN)
        return throw_libarchive_error (ar, MATCHA_ERROR_ARCHIVE_CORRUPT, error, "Reading header");

      g_autofree char *relpath = g_strdup (entry_relpath (archive_entry_pathname (entry)));
      if (!*relpath || g_str_equal (relpath, "."))
        continue;
      if (path_has_dotdot (relpath))
        return matcha_throw (error, MATCHA_ERROR_ARCHIVE_CORRUPT,
                             "Entry '%s' points outside the destination", relpath);
      n_entries++;

      if (!topdir)
        {
          const char *slash = strchr (relpath, '/');
          topdir = slash ? g_strndup (relpath, slash - relpath) : g_strdup (relpath);
          g_autofree char *stale = g_build_filename (real_dest, topdir, NULL);
          if (!glnx_shutil_rm_rf_at (AT_FDCWD, stale, cancellable, error))
            return FALSE;
        }

      g_autofree char *destpath = g_build_filename (real_dest, relpath, NULL);
      archive_entry_set_pathname (entry, destpath);
      const char *hardlink = archive_entry_hardlink (entry);
      if (hardlink)
        {
          g_autofree char *linkpath
              = g_build_filename (real_dest, entry_relpath (hardlink), NULL);
          archive_entry_set_hardlink (entry, linkpath);
        }

      if (archive_write_header (aw, entry) < ARCHIVE_WARN)
        return throw_libarchive_error (aw, MATCHA_ERROR_FAILED, error, relpath);
      if (archive_entry_size (entry) > 0 && !copy_data (ar, aw, error))
        return FALSE;
      if (archive_write_finish_entry (aw) < ARCHIVE_WARN)
        return throw_libarchive_error (aw, MATCHA_ERROR_FAILED, error, relpath);
    }

  if (n_entries == 0)
    return matcha_throw (error, MATCHA_ERROR_ARCHIVE_CORRUPT, "Archive contains no entries");
  if (archive_write_close (aw) != ARCHIVE_OK)
    return throw_libarchive_error (aw, MATCHA_ERROR_FAILED, error, "Finalizing");

  if (out_topdir)
    *out_topdir = g_build_filename (dest_dir, topdir, NULL);
  return TRUE;
}
