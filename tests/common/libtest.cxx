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

#include <archive.h>
#include <archive_entry.h>
#include <string.h>

#include "libglnx.h"
#include "libtest.h"
#include "matcha-archive.h"
#include "matcha-util.h"

char *
matcha_test_tmpdir_new (void)
{
  g_autoptr (GError) error = NULL;
  char *path = g_dir_make_tmp ("matcha-test-XXXXXX", &error);
  g_assert_no_error (error);
  return path;
}

void
matcha_test_tmpdir_free (char *path)
{
  g_autoptr (GError) error = NULL;
  glnx_shutil_rm_rf_at (AT_FDCWD, path, NULL, &error);
  g_assert_no_error (error);
  g_free (path);
}

MatchaConfig *
matcha_test_config_new (const char *root, MatchaEnvKind env)
{
  g_autoptr (GError) error = NULL;
  MatchaConfig *config = matcha_config_new_defaults (env);
  g_free (config->root);
  config->root = g_strdup (root);
  g_free (config->log_dir);
  config->log_dir = g_build_filename (root, "logs", NULL);
  g_free (config->helper_dir);
  config->helper_dir = g_strdup (root);
  config->root_part = g_strdup ("/dev/vdb2");
  config->home_part = g_strdup ("/dev/vdb3");
  config->swap_part = g_strdup ("/dev/vdb1");
  config->jobs = 4;
  matcha_config_finalize (config, &error);
  g_assert_no_error (error);
  return config;
}

MatchaTestRecorder *
matcha_test_recorder_new (void)
{
  MatchaTestRecorder *rec = g_new0 (MatchaTestRecorder, 1);
  rec->commands = g_ptr_array_new_with_free_func (g_free);
  rec->cwds = g_ptr_array_new_with_free_func (g_free);
  rec->fail_on = g_ptr_array_new_with_free_func (g_free);
  rec->output_on = g_ptr_array_new_with_free_func (g_free);
  rec->outputs = g_ptr_array_new_with_free_func (g_free);
  return rec;
}

void
matcha_test_recorder_free (MatchaTestRecorder *rec)
{
  g_ptr_array_unref (rec->commands);
  g_ptr_array_unref (rec->cwds);
  g_ptr_array_unref (rec->fail_on);
  g_ptr_array_unref (rec->output_on);
  g_ptr_array_unref (rec->outputs);
  g_free (rec);
}

void
matcha_test_recorder_fail_on (MatchaTestRecorder *rec, const char *substring)
{
  g_ptr_array_add (rec->fail_on, g_strdup (substring));
}

void
matcha_test_recorder_set_output (MatchaTestRecorder *rec, const char *substring,
                                 const char *output)
{
  g_ptr_array_add (rec->output_on, g_strdup (substring));
  g_ptr_array_add (rec->outputs, g_strdup (output));
}

void
matcha_test_recorder_clear (MatchaTestRecorder *rec)
{
  g_ptr_array_set_size (rec->commands, 0);
  g_ptr_array_set_size (rec->cwds, 0);
}

static gboolean
recorder_run (MatchaExecutor *executor, const char *const *argv, const char *cwd,
              const char *const *envp, const char *log_path, GCancellable *cancellable,
              GError **error)
{
  auto rec = static_cast<MatchaTestRecorder *> (matcha_executor_get_user_data (executor));
  g_autofree char *cmd = g_strjoinv (" ", (char **)argv);

  g_ptr_array_add (rec->cwds, g_strdup (cwd));
  g_ptr_array_add (rec->commands, g_strdup (cmd));

  if (log_path)
    {
      g_autoptr (GString) contents = g_string_new (NULL);
      g_string_append_printf (contents, "$ %s\n", cmd);
      for (guint i = 0; i < rec->output_on->len; i++)
        {
          if (strstr (cmd, static_cast<const char *> (rec->output_on->pdata[i])))
            g_string_append (contents, static_cast<const char *> (rec->outputs->pdata[i]));
        }
      if (!glnx_file_replace_contents_at (AT_FDCWD, log_path, (const guint8 *)contents->str,
                                          contents->len,
                                          GLNX_FILE_REPLACE_NODATASYNC, cancellable, error))
        return FALSE;
    }

  for (guint i = 0; i < rec->fail_on->len; i++)
    {
      if (strstr (cmd, static_cast<const char *> (rec->fail_on->pdata[i])))
        {
          g_set_error (error, G_SPAWN_EXIT_ERROR, 1, "Child process exited with code 1");
          return FALSE;
        }
    }
  return TRUE;
}

MatchaExecutor *
matcha_test_recorder_new_executor (MatchaTestRecorder *rec)
{
  return matcha_executor_new_custom (recorder_run, rec, NULL);
}

guint
matcha_test_recorder_count (MatchaTestRecorder *rec, const char *substring)
{
  guint n = 0;
  for (guint i = 0; i < rec->commands->len; i++)
    {
      if (strstr (static_cast<const char *> (rec->commands->pdata[i]), substring))
        n++;
    }
  return n;
}

int
matcha_test_recorder_index (MatchaTestRecorder *rec, const char *substring)
{
  for (guint i = 0; i < rec->commands->len; i++)
    {
      if (strstr (static_cast<const char *> (rec->commands->pdata[i]), substring))
        return i;
    }
  return -1;
}

static void
output_cb (MatchaOutputType type, void *data, void *opaque)
{
  auto out = static_cast<MatchaTestOutput *> (opaque);
  switch (type)
    {
    case MATCHA_OUTPUT_MESSAGE:
      g_ptr_array_add (out->events,
                       g_strconcat ("MSG ", ((MatchaOutputMessage *)data)->text, NULL));
      break;
    case MATCHA_OUTPUT_WARNING:
      g_ptr_array_add (out->events,
                       g_strconcat ("WARN ", ((MatchaOutputMessage *)data)->text, NULL));
      break;
    case MATCHA_OUTPUT_STEP_BEGIN:
    case MATCHA_OUTPUT_STEP_SKIP:
    case MATCHA_OUTPUT_STEP_DONE:
    case MATCHA_OUTPUT_STEP_FAIL:
      {
        static const char *const kinds[] = { "BEGIN", "SKIP", "DONE", "FAIL" };
        auto step = static_cast<MatchaOutputStep *> (data);
        g_ptr_array_add (out->events, g_strdup_printf ("%s %s", kinds[type - MATCHA_OUTPUT_STEP_BEGIN],
                                                       step->step_id));
      }
      break;
    default:
      break;
    }
}

void
matcha_test_output_capture (MatchaTestOutput *out)
{
  out->events = g_ptr_array_new_with_free_func (g_free);
  matcha_output_set_callback (output_cb, out);
}

void
matcha_test_output_release (MatchaTestOutput *out)
{
  matcha_output_set_callback (NULL, NULL);
  g_clear_pointer (&out->events, g_ptr_array_unref);
}

gboolean
matcha_test_output_has (MatchaTestOutput *out, const char *prefix)
{
  for (guint i = 0; i < out->events->len; i++)
    {
      if (g_str_has_prefix (static_cast<const char *> (out->events->pdata[i]), prefix))
        return TRUE;
    }
  return FALSE;
}

static gboolean
throw_archive (struct archive *a, const char *path, GError **error)
{
  return glnx_throw (error, "Writing %s: %s", path, archive_error_string (a));
}

gboolean
matcha_test_write_tarball (const char *path, const char *const *entries, GError **error)
{
  g_autoptr (MatchaArchiveWriter) a = archive_write_new ();
  int r;
  if (g_str_has_suffix (path, ".xz"))
    r = archive_write_add_filter_xz (a);
  else if (g_str_has_suffix (path, ".gz"))
    r = archive_write_add_filter_gzip (a);
  else if (g_str_has_suffix (path, ".bz2"))
    r = archive_write_add_filter_bzip2 (a);
  else
    r = archive_write_add_filter_none (a);
  if (r != ARCHIVE_OK)
    return throw_archive (a, path, error);
  if (archive_write_set_format_pax_restricted (a) != ARCHIVE_OK)
    return throw_archive (a, path, error);
  if (archive_write_open_filename (a, path) != ARCHIVE_OK)
    return throw_archive (a, path, error);

  for (const char *const *it = entries; it && *it; it++)
    {
      const char *eq = strchr (*it, '=');
      g_autofree char *name = eq ? g_strndup (*it, eq - *it) : g_strdup (*it);
      const char *content = eq ? eq + 1 : NULL;
      struct archive_entry *entry = archive_entry_new ();

      archive_entry_set_pathname (entry, name);
      if (content)
        {
          archive_entry_set_filetype (entry, AE_IFREG);
          /* Anything named like a script is executable */
          archive_entry_set_perm (entry, g_str_has_suffix (name, "configure") ? 0755 : 0644);
          archive_entry_set_size (entry, strlen (content));
        }
      else
        {
          archive_entry_set_filetype (entry, AE_IFDIR);
          archive_entry_set_perm (entry, 0755);
        }
      archive_entry_set_mtime (entry, 1700000000, 0);

      r = archive_write_header (a, entry);
      if (r == ARCHIVE_OK && content)
        r = archive_write_data (a, content, strlen (content)) < 0 ? ARCHIVE_FATAL : ARCHIVE_OK;
      archive_entry_free (entry);
      if (r != ARCHIVE_OK)
        return throw_archive (a, path, error);
    }

  if (archive_write_close (a) != ARCHIVE_OK)
    return throw_archive (a, path, error);
  return TRUE;
}
