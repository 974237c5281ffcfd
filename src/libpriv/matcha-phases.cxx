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

#include "matcha-errors.h"
#include "matcha-output.h"
#include "matcha-phases.h"
#include "matcha-util.h"

#include <libglnx.h>

typedef enum {
  ITEM_STEP,
  ITEM_NOTICE,
} ItemKind;

typedef struct {
  ItemKind kind;
  char *step_id; /* or the notice text */
  MatchaStepFunc func;
  gpointer user_data;
  GDestroyNotify notify;
} PlanItem;

struct MatchaPhase {
  char *name;
  MatchaPhaseState state;
  GPtrArray *items;
};

struct MatchaPlan {
  char *name;
  GPtrArray *phases;
  char *failed_step;
};

static void
plan_item_free (PlanItem *item)
{
  if (item->notify)
    item->notify (item->user_data);
  g_free (item->step_id);
  g_free (item);
}

static void
phase_free (MatchaPhase *phase)
{
  g_ptr_array_unref (phase->items);
  g_free (phase->name);
  g_free (phase);
}

MatchaPlan *
matcha_plan_new (const char *name)
{
  MatchaPlan *plan = g_new0 (MatchaPlan, 1);
  plan->name = g_strdup (name);
  plan->phases = g_ptr_array_new_with_free_func ((GDestroyNotify)phase_free);
  return plan;
}

void
matcha_plan_free (MatchaPlan *plan)
{
  g_ptr_array_unref (plan->phases);
  g_free (plan->failed_step);
  g_free (plan->name);
  g_free (plan);
}

MatchaPhase *
matcha_plan_add_phase (MatchaPlan *plan, const char *name)
{
  MatchaPhase *phase = g_new0 (MatchaPhase, 1);
  phase->name = g_strdup (name);
  phase->state = MATCHA_PHASE_PENDING;
  phase->items = g_ptr_array_new_with_free_func ((GDestroyNotify)plan_item_free);
  g_ptr_array_add (plan->phases, phase);
  return phase;
}

void
matcha_phase_add_step (MatchaPhase *phase, const char *step_id, MatchaStepFunc func,
                       gpointer user_data, GDestroyNotify notify)
{
  PlanItem *item = g_new0 (PlanItem, 1);
  item->kind = ITEM_STEP;
  item->step_id = g_strdup (step_id);
  item->func = func;
  item->user_data = user_data;
  item->notify = notify;
  g_ptr_array_add (phase->items, item);
}

/* A notice marks a known gap, such as a package without a recipe.  It is
 * reported when the phase runs and never fails it.
 */
void
matcha_phase_add_notice (MatchaPhase *phase, const char *format, ...)
{
  va_list args;
  va_start (args, format);
  PlanItem *item = g_new0 (PlanItem, 1);
  item->kind = ITEM_NOTICE;
  item->step_id = g_strdup_vprintf (format, args);
  va_end (args);
  g_ptr_array_add (phase->items, item);
}

/* Step ids must be valid marker names and unique across the whole plan,
 * otherwise two steps would share a marker.
 */
gboolean
matcha_plan_validate (MatchaPlan *plan, GError **error)
{
  g_autoptr (GHashTable) seen = g_hash_table_new (g_str_hash, g_str_equal);
  for (guint i = 0; i < plan->phases->len; i++)
    {
      auto phase = static_cast<MatchaPhase *> (plan->phases->pdata[i]);
      for (guint j = 0; j < phase->items->len; j++)
        {
          auto item = static_cast<PlanItem *> (phase->items->pdata[j]);
          if (item->kind != ITEM_STEP)
            continue;
          if (!matcha_step_id_validate (item->step_id, error))
            return glnx_prefix_error (error, "Phase '%s'", phase->name);
          if (!g_hash_table_add (seen, item->step_id))
            return matcha_throw (error, MATCHA_ERROR_INVALID, "Duplicate step id '%s' in plan %s",
                                 item->step_id, plan->name);
        }
    }
  return TRUE;
}

static gboolean
phase_run (MatchaPhase *phase, MatchaBuildContext *ctx, char **out_failed_step,
           GCancellable *cancellable, GError **error)
{
  for (guint i = 0; i < phase->items->len; i++)
    {
      auto item = static_cast<PlanItem *> (phase->items->pdata[i]);
      if (item->kind == ITEM_NOTICE)
        {
          matcha_output_warning ("%s", item->step_id);
          continue;
        }

      if (!matcha_step_run (ctx, phase->name, item->step_id, item->func, item->user_data, NULL,
                            cancellable, error))
        {
          *out_failed_step = g_strdup (item->step_id);
          return FALSE;
        }
    }
  return TRUE;
}

/**
 * matcha_plan_run:
 *
 * Run every phase in order.  A phase starts only once the previous one is
 * done; the first failing step marks its phase failed and stops the plan,
 * leaving later phases pending.  Steps that are already done are skipped,
 * so re-running a completed plan does nothing.
 */
gboolean
matcha_plan_run (MatchaPlan *plan, MatchaBuildContext *ctx, GCancellable *cancellable,
                 GError **error)
{
  if (!matcha_plan_validate (plan, error))
    return FALSE;

  g_clear_pointer (&plan->failed_step, g_free);
  for (guint i = 0; i < plan->phases->len; i++)
    static_cast<MatchaPhase *> (plan->phases->pdata[i])->state = MATCHA_PHASE_PENDING;

  g_autofree char *msg = g_strdup_printf ("Running %s plan", plan->name);
  auto progress = matcha::progress_nitems_begin (plan->phases->len, msg);
  for (guint i = 0; i < plan->phases->len; i++)
    {
      auto phase = static_cast<MatchaPhase *> (plan->phases->pdata[i]);
      progress->nitems_update (i + 1);
      progress->set_sub_message (phase->name);

      phase->state = MATCHA_PHASE_RUNNING;
      if (!phase_run (phase, ctx, &plan->failed_step, cancellable, error))
        {
          phase->state = MATCHA_PHASE_FAILED;
          progress->end ("failed");
          return FALSE;
        }
      phase->state = MATCHA_PHASE_DONE;
    }
  progress->end ("complete");
  return TRUE;
}

/* Derive each phase's state from the store alone, without running
 * anything.
 */
gboolean
matcha_plan_refresh_state (MatchaPlan *plan, MatchaStateStore *store, GError **error)
{
  for (guint i = 0; i < plan->phases->len; i++)
    {
      auto phase = static_cast<MatchaPhase *> (plan->phases->pdata[i]);
      gboolean all_done = TRUE;
      for (guint j = 0; j < phase->items->len && all_done; j++)
        {
          auto item = static_cast<PlanItem *> (phase->items->pdata[j]);
          if (item->kind != ITEM_STEP)
            continue;
          MatchaStepStatus status;
          if (!matcha_state_store_get_status (store, item->step_id, &status, error))
            return FALSE;
          all_done = (status == MATCHA_STEP_STATUS_DONE);
        }
      phase->state = all_done ? MATCHA_PHASE_DONE : MATCHA_PHASE_PENDING;
    }
  return TRUE;
}

const char *
matcha_plan_get_name (MatchaPlan *plan)
{
  return plan->name;
}

guint
matcha_plan_get_n_phases (MatchaPlan *plan)
{
  return plan->phases->len;
}

MatchaPhase *
matcha_plan_get_phase (MatchaPlan *plan, guint i)
{
  g_assert_cmpuint (i, <, plan->phases->len);
  return static_cast<MatchaPhase *> (plan->phases->pdata[i]);
}

MatchaPhase *
matcha_plan_lookup_phase (MatchaPlan *plan, const char *name)
{
  for (guint i = 0; i < plan->phases->len; i++)
    {
      auto phase = static_cast<MatchaPhase *> (plan->phases->pdata[i]);
      if (g_str_equal (phase->name, name))
        return phase;
    }
  return NULL;
}

const char *
matcha_plan_get_failed_step (MatchaPlan *plan)
{
  return plan->failed_step;
}

/* Returns every step id of the plan in execution order; the strings are
 * owned by @plan.
 */
GPtrArray *
matcha_plan_get_step_ids (MatchaPlan *plan)
{
  GPtrArray *ret = g_ptr_array_new ();
  for (guint i = 0; i < plan->phases->len; i++)
    {
      auto phase = static_cast<MatchaPhase *> (plan->phases->pdata[i]);
      for (guint j = 0; j < phase->items->len; j++)
        {
          auto item = static_cast<PlanItem *> (phase->items->pdata[j]);
          if (item->kind == ITEM_STEP)
            g_ptr_array_add (ret, item->step_id);
        }
    }
  return ret;
}

const char *
matcha_phase_get_name (MatchaPhase *phase)
{
  return phase->name;
}

MatchaPhaseState
matcha_phase_get_state (MatchaPhase *phase)
{
  return phase->state;
}

static PlanItem *
phase_get_nth_item (MatchaPhase *phase, ItemKind kind, guint n)
{
  for (guint i = 0; i < phase->items->len; i++)
    {
      auto item = static_cast<PlanItem *> (phase->items->pdata[i]);
      if (item->kind != kind)
        continue;
      if (n == 0)
        return item;
      n--;
    }
  return NULL;
}

guint
matcha_phase_get_n_steps (MatchaPhase *phase)
{
  guint n = 0;
  while (phase_get_nth_item (phase, ITEM_STEP, n))
    n++;
  return n;
}

const char *
matcha_phase_get_step_id (MatchaPhase *phase, guint i)
{
  PlanItem *item = phase_get_nth_item (phase, ITEM_STEP, i);
  g_assert (item);
  return item->step_id;
}

guint
matcha_phase_get_n_notices (MatchaPhase *phase)
{
  guint n = 0;
  while (phase_get_nth_item (phase, ITEM_NOTICE, n))
    n++;
  return n;
}

const char *
matcha_phase_state_to_string (MatchaPhaseState state)
{
  switch (state)
    {
    case MATCHA_PHASE_PENDING:
      return "pending";
    case MATCHA_PHASE_RUNNING:
      return "running";
    case MATCHA_PHASE_DONE:
      return "done";
    case MATCHA_PHASE_FAILED:
      return "failed";
    }
  g_assert_not_reached ();
}
