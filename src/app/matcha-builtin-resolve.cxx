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

#include "matcha-archive.h"
#include "matcha-builtins.h"
#include "matcha-errors.h"
#include "matcha-libbuiltin.h"

#include <libglnx.h>

static GOptionEntry option_entries[] = { { NULL } };

gboolean
matcha_builtin_resolve (int argc, char **argv, MatchaCommandInvocation *invocation,
                        GCancellable *cancellable, GError **error)
{
  g_autoptr (GOptionContext) context = g_option_context_new ("NAME...");
  g_autoptr (MatchaConfig) config = NULL;

  if (!matcha_option_context_parse (context, option_entries, &argc, &argv, invocation,
                                    cancellable, &config, error))
    return FALSE;

  if (argc < 2)
    {
      matcha_usage_error (context, "At least one NAME must be specified", error);
      return FALSE;
    }

  guint n_missing = 0;
  for (int i = 1; i < argc; i++)
    {
      g_autoptr (GError) local_error = NULL;
      g_autofree char *path = NULL;
      if (!matcha_archive_resolve (config->sources_dir, argv[i], &path, &local_error))
        {
          if (!g_error_matches (local_error, MATCHA_ERROR, MATCHA_ERROR_NOT_FOUND))
            {
              g_propagate_error (error, util::move_nullify (local_error));
              return FALSE;
            }
          g_printerr ("%s%s%s: %s\n", get_red_start (), argv[i], get_red_end (),
                      local_error->message);
          n_missing++;
          continue;
        }
      g_print ("%s: %s\n", argv[i], path);
    }

  if (n_missing > 0)
    return matcha_throw (error, MATCHA_ERROR_NOT_FOUND, "%u of %d archives not found", n_missing,
                         argc - 1);
  return TRUE;
}
