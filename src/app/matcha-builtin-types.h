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

#include <gio/gio.h>

G_BEGIN_DECLS

typedef enum {
  MATCHA_BUILTIN_FLAG_NONE = 0,
  MATCHA_BUILTIN_FLAG_REQUIRES_ROOT = 1 << 0,
  /* Accepts --env/--config/--root/--log-dir and loads the configuration */
  MATCHA_BUILTIN_FLAG_USES_CONFIG = 1 << 1,
} MatchaBuiltinFlags;

typedef struct MatchaCommand MatchaCommand;
typedef struct MatchaCommandInvocation MatchaCommandInvocation;

struct MatchaCommand {
  const char *name;
  MatchaBuiltinFlags flags;
  const char *description; /* a short decription to describe the functionality */
  gboolean (*fn) (int argc, char **argv, MatchaCommandInvocation *invocation,
                  GCancellable *cancellable, GError **error);
};

/* @command: Passed from core cmdline parsing to cmds
 * @exit_code: Set by commands; default -1 meaning "if GError is set exit 1, otherwise 0"
 */
struct MatchaCommandInvocation {
  MatchaCommand *command;
  int exit_code;
};

G_END_DECLS
