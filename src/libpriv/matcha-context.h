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

#include "matcha-action.h"
#include "matcha-config.h"
#include "matcha-state.h"

G_BEGIN_DECLS

/* Everything a step needs; every path-sensitive operation resolves
 * relative to config->root.
 */
typedef struct {
  MatchaConfig *config; /* borrowed */
  MatchaEnvKind env;
  MatchaExecutor *executor;
  MatchaStateStore *store;
  char **child_env;
} MatchaBuildContext;

MatchaBuildContext *matcha_build_context_new (MatchaConfig *config, MatchaExecutor *executor,
                                              MatchaStateStore *store);
void matcha_build_context_free (MatchaBuildContext *ctx);
G_DEFINE_AUTOPTR_CLEANUP_FUNC (MatchaBuildContext, matcha_build_context_free)

char *matcha_build_context_path (MatchaBuildContext *ctx, const char *relpath);

GHashTable *matcha_build_context_new_vars (MatchaBuildContext *ctx);

gboolean matcha_build_context_run (MatchaBuildContext *ctx, const char *name, const char *phase,
                                   const char *const *argv, const char *cwd,
                                   GCancellable *cancellable, GError **error);

gboolean matcha_build_context_probe (MatchaBuildContext *ctx, const char *const *argv,
                                     const char *cwd, gboolean *out_success,
                                     GCancellable *cancellable, GError **error);

G_END_DECLS
