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

#include "matcha-stepper.h"

G_BEGIN_DECLS

typedef enum {
  MATCHA_PHASE_PENDING,
  MATCHA_PHASE_RUNNING,
  MATCHA_PHASE_DONE,
  MATCHA_PHASE_FAILED,
} MatchaPhaseState;

typedef struct MatchaPlan MatchaPlan;
typedef struct MatchaPhase MatchaPhase;

MatchaPlan *matcha_plan_new (const char *name);
void matcha_plan_free (MatchaPlan *plan);
G_DEFINE_AUTOPTR_CLEANUP_FUNC (MatchaPlan, matcha_plan_free)

/* The returned phase is owned by @plan */
MatchaPhase *matcha_plan_add_phase (MatchaPlan *plan, const char *name);

void matcha_phase_add_step (MatchaPhase *phase, const char *step_id, MatchaStepFunc func,
                            gpointer user_data, GDestroyNotify notify);
void matcha_phase_add_notice (MatchaPhase *phase, const char *format, ...) G_GNUC_PRINTF (2, 3);

gboolean matcha_plan_validate (MatchaPlan *plan, GError **error);

gboolean matcha_plan_run (MatchaPlan *plan, MatchaBuildContext *ctx, GCancellable *cancellable,
                          GError **error);

gboolean matcha_plan_refresh_state (MatchaPlan *plan, MatchaStateStore *store, GError **error);

const char *matcha_plan_get_name (MatchaPlan *plan);
guint matcha_plan_get_n_phases (MatchaPlan *plan);
MatchaPhase *matcha_plan_get_phase (MatchaPlan *plan, guint i);
MatchaPhase *matcha_plan_lookup_phase (MatchaPlan *plan, const char *name);
const char *matcha_plan_get_failed_step (MatchaPlan *plan);
GPtrArray *matcha_plan_get_step_ids (MatchaPlan *plan);

const char *matcha_phase_get_name (MatchaPhase *phase);
MatchaPhaseState matcha_phase_get_state (MatchaPhase *phase);
guint matcha_phase_get_n_steps (MatchaPhase *phase);
const char *matcha_phase_get_step_id (MatchaPhase *phase, guint i);
guint matcha_phase_get_n_notices (MatchaPhase *phase);

const char *matcha_phase_state_to_string (MatchaPhaseState state);

G_END_DECLS
