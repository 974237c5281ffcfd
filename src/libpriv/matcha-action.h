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

#include "libglnx.h"

G_BEGIN_DECLS

typedef struct MatchaExecutor MatchaExecutor;

/* Run @argv to completion in @cwd with environment @envp.  Combined
 * stdout/stderr goes to @log_path; when @log_path is %NULL the output is
 * discarded.  A non-zero exit is reported as a G_SPAWN_EXIT_ERROR.
 */
typedef gboolean (*MatchaExecutorRunFunc) (MatchaExecutor *executor, const char *const *argv,
                                           const char *cwd, const char *const *envp,
                                           const char *log_path, GCancellable *cancellable,
                                           GError **error);

MatchaExecutor *matcha_executor_new_subprocess (gboolean echo);
MatchaExecutor *matcha_executor_new_custom (MatchaExecutorRunFunc func, gpointer user_data,
                                            GDestroyNotify notify);
gpointer matcha_executor_get_user_data (MatchaExecutor *executor);

MatchaExecutor *matcha_executor_ref (MatchaExecutor *executor);
void matcha_executor_unref (MatchaExecutor *executor);
G_DEFINE_AUTOPTR_CLEANUP_FUNC (MatchaExecutor, matcha_executor_unref)

gboolean matcha_executor_run (MatchaExecutor *executor, const char *const *argv, const char *cwd,
                              const char *const *envp, const char *log_path,
                              GCancellable *cancellable, GError **error);

char *matcha_action_log_path (const char *log_dir, const char *name, const char *phase);

gboolean matcha_action_run (MatchaExecutor *executor, const char *log_dir, const char *name,
                            const char *phase, const char *const *argv, const char *cwd,
                            const char *const *envp, GCancellable *cancellable, GError **error);

gboolean matcha_action_probe (MatchaExecutor *executor, const char *const *argv, const char *cwd,
                              const char *const *envp, gboolean *out_success,
                              GCancellable *cancellable, GError **error);

G_END_DECLS
