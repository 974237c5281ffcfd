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
#include "matcha-errors.h"
#include "matcha-util.h"

static void
test_subst_vars (void)
{
  g_autoptr (GError) error = NULL;
  g_autoptr (GHashTable) vars = g_hash_table_new (g_str_hash, g_str_equal);
  g_hash_table_insert (vars, (char *)"ROOT", (char *)"/mnt/matcha");
  g_hash_table_insert (vars, (char *)"JOBS", (char *)"8");

  g_autofree char *a = matcha_subst_vars ("--prefix=@ROOT@/tools", vars, &error);
  g_assert_no_error (error);
  g_assert_cmpstr (a, ==, "--prefix=/mnt/matcha/tools");

  g_autofree char *b = matcha_subst_vars ("-j@JOBS@ @ROOT@@ROOT@", vars, &error);
  g_assert_no_error (error);
  g_assert_cmpstr (b, ==, "-j8 /mnt/matcha/mnt/matcha");

  /* Lone and unterminated '@' pass through */
  g_autofree char *c = matcha_subst_vars ("root@localhost @ @ROOT", vars, &error);
  g_assert_no_error (error);
  g_assert_cmpstr (c, ==, "root@localhost @ @ROOT");

  g_autofree char *d = matcha_subst_vars ("@KVER@", vars, &error);
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_INVALID);
  g_assert (d == NULL);
}

static void
test_shell_quote (void)
{
  g_autofree char *safe = matcha_maybe_shell_quote ("/mnt/matcha/tools");
  g_assert (safe == NULL);
  g_autofree char *spaced = matcha_maybe_shell_quote ("/mnt/my disk");
  g_assert_cmpstr (spaced, ==, "'/mnt/my disk'");

  const char *argv[] = { "mount", "-t", "tmpfs", "/mnt/my disk", NULL };
  g_autofree char *s = matcha_argv_to_string (argv);
  g_assert_cmpstr (s, ==, "mount -t tmpfs '/mnt/my disk'");
}

static void
test_misc (void)
{
  g_assert_cmpuint (matcha_get_default_jobs (), >=, 1);
  g_autofree char *ts = matcha_timestamp_now ();
  g_assert (ts && strlen (ts) >= 19);

  g_autoptr (GError) error = NULL;
  g_assert (!matcha_throw (&error, MATCHA_ERROR_UNSUPPORTED, "no %s", "luck"));
  g_assert_error (error, MATCHA_ERROR, MATCHA_ERROR_UNSUPPORTED);
  g_assert_cmpstr (error->message, ==, "no luck");
}

int
main (int argc, char *argv[])
{
  g_test_init (&argc, &argv, NULL);

  g_test_add_func ("/utils/subst-vars", test_subst_vars);
  g_test_add_func ("/utils/shell-quote", test_shell_quote);
  g_test_add_func ("/utils/misc", test_misc);

  return g_test_run ();
}
