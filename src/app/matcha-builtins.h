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

#pragma once

#include "matcha-builtin-types.h"
#include "matcha-config.h"

G_BEGIN_DECLS

#define BUILTINPROTO(name)                                                                         \
  gboolean matcha_builtin_##name (int argc, char **argv, MatchaCommandInvocation *invocation,     \
                                  GCancellable *cancellable, GError **error)

BUILTINPROTO (run);
BUILTINPROTO (status);
BUILTINPROTO (reset);
BUILTINPROTO (resolve);

#undef BUILTINPROTO

gboolean matcha_option_context_parse (GOptionContext *context, const GOptionEntry *main_entries,
                                      int *argc, char ***argv,
                                      MatchaCommandInvocation *invocation,
                                      GCancellable *cancellable, MatchaConfig **out_config,
                                      GError **error);

int matcha_main (int argc, char **argv);

G_END_DECLS
