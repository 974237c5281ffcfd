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
#include <systemd/sd-journal.h>

#include "matcha-errors.h"
#include "matcha-util.h"

char *
matcha_maybe_shell_quote (const char *s)
{
  static gsize regex_initialized;
  static GRegex *safe_chars_regex;
  if (g_once_init_enter (&regex_initialized))
    {
      safe_chars_regex = g_regex_new ("^[[:alnum:]-._/=:,+@]+$", (GRegexCompileFlags)0,
                                      (GRegexMatchFlags)0, NULL);
      g_assert (safe_chars_regex);
      g_once_init_leave (&regex_initialized, 1);
    }

  if (g_regex_match (safe_chars_regex, s, (GRegexMatchFlags)0, 0))
    return NULL;
  return g_shell_quote (s);
}

/* Render @argv the way a human would type it; used for log headers and
 * error messages.
 */
char *
matcha_argv_to_string (const char *const *argv)
{
  g_autoptr (GString) buf = g_string_new (NULL);
  for (const char *const *iter = argv; iter && *iter; iter++)
    {
      if (buf->len > 0)
        g_string_append_c (buf, ' ');
      g_autofree char *quoted = matcha_maybe_shell_quote (*iter);
      g_string_append (buf, quoted ?: *iter);
    }
  return g_string_free (util::move_nullify (buf), FALSE);
}

char *
matcha_timestamp_now (void)
{
  g_autoptr (GDateTime) now = g_date_time_new_now_local ();
  return g_date_time_format (now, "%FT%T");
}

guint
matcha_get_default_jobs (void)
{
  return MAX (g_get_num_processors (), 1);
}

static gboolean
is_var_char (char c)
{
  return g_ascii_isupper (c) || c == '_';
}

/**
 * matcha_subst_vars:
 * @tmpl: A string possibly containing `@NAME@` references
 * @vars: (element-type utf8 utf8): Variable table
 * @error: Error
 *
 * Replace every `@NAME@` in @tmpl with its value from @vars.  A reference
 * to a name missing from @vars is an error; an `@` that does not start a
 * well-formed reference is copied verbatim.
 */
char *
matcha_subst_vars (const char *tmpl, GHashTable *vars, GError **error)
{
  g_autoptr (GString) buf = g_string_new (NULL);
  const char *p = tmpl;

  while (*p)
    {
      const char *at = strchr (p, '@');
      if (!at)
        {
          g_string_append (buf, p);
          break;
        }
      g_string_append_len (buf, p, at - p);

      const char *name_start = at + 1;
      const char *name_end = name_start;
      while (is_var_char (*name_end))
        name_end++;

      if (name_end == name_start || *name_end != '@')
        {
          g_string_append_c (buf, '@');
          p = name_start;
          continue;
        }

      g_autofree char *name = g_strndup (name_start, name_end - name_start);
      auto value = static_cast<const char *> (g_hash_table_lookup (vars, name));
      if (!value)
        {
          matcha_throw (error, MATCHA_ERROR_INVALID, "Unknown variable @%s@ in '%s'", name, tmpl);
          return NULL;
        }
      g_string_append (buf, value);
      p = name_end + 1;
    }

  return g_string_free (util::move_nullify (buf), FALSE);
}

/* Given an error, log it to the systemd journal; use this
 * for code paths where we can't easily propagate it back
 * up the stack.
 */
void
matcha_journal_error (GError *error)
{
  sd_journal_print (LOG_WARNING, "%s", error->message);
}
