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

#include "matcha-config.h"

G_BEGIN_DECLS

/* Everything the store persists lives below this directory of the root */
#define MATCHA_STATE_DIR ".matcha-state"
#define MATCHA_STATE_KEYFILE "state.conf"

typedef enum {
  MATCHA_STEP_STATUS_PENDING,
  MATCHA_STEP_STATUS_DONE,
} MatchaStepStatus;

typedef struct MatchaStateStore MatchaStateStore;

/* Persistence adapter.  Implementations only see step ids that have
 * already been validated.
 */
typedef struct {
  const char *name;
  gboolean (*get_status) (MatchaStateStore *store, const char *step_id,
                          MatchaStepStatus *out_status, GError **error);
  gboolean (*set_done) (MatchaStateStore *store, const char *step_id, GError **error);
  gboolean (*clear) (MatchaStateStore *store, const char *step_id, GError **error);
  void (*finalize) (MatchaStateStore *store);
} MatchaStateStoreClass;

MatchaStateStore *matcha_state_store_ref (MatchaStateStore *store);
void matcha_state_store_unref (MatchaStateStore *store);
G_DEFINE_AUTOPTR_CLEANUP_FUNC (MatchaStateStore, matcha_state_store_unref)

MatchaStateStore *matcha_state_store_new (const MatchaStateStoreClass *klass, const char *ns,
                                          gpointer priv, GDestroyNotify priv_destroy);
gpointer matcha_state_store_get_priv (MatchaStateStore *store);

MatchaStateStore *matcha_state_store_new_markers (const char *root, const char *ns);
MatchaStateStore *matcha_state_store_new_keyfile (const char *root, const char *ns);
MatchaStateStore *matcha_state_store_new_memory (const char *ns);
MatchaStateStore *matcha_state_store_new_for_config (MatchaConfig *config);

const char *matcha_state_store_get_namespace (MatchaStateStore *store);
const char *matcha_state_store_get_backend_name (MatchaStateStore *store);

gboolean matcha_state_store_get_status (MatchaStateStore *store, const char *step_id,
                                        MatchaStepStatus *out_status, GError **error);
gboolean matcha_state_store_set_done (MatchaStateStore *store, const char *step_id,
                                      GError **error);
gboolean matcha_state_store_clear (MatchaStateStore *store, const char *step_id, GError **error);

gboolean matcha_step_id_validate (const char *step_id, GError **error);

G_END_DECLS
