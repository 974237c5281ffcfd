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

#include "matcha-errors.h"
#include "matcha-output.h"
#include "matcha-stepper.h"
#include "matcha-util.h"

#include <libglnx.h>

/**
 * matcha_step_run:
 * @ctx: Build context
 * @phase: Name of the enclosing phase, for reporting
 * @step_id: Step id; also the name of its marker
 * @func: The step's action
 * @out_ran: (out) (optional): Set to %TRUE if @func was invoked
 *
 * Run @func unless @step_id is already marked done.  The marker is
 * written only after @func succeeds; if writing it fails the step counts
 * as failed, so the next run redoes it.  There is no retry.
 */
gboolean
matcha_step_run (MatchaBuildContext *ctx, const char *phase, const char *step_id,
                 MatchaStepFunc func, gpointer user_data, gboolean *out_ran,
                 GCancellable *cancellable, GError **error)
{
  if (out_ran)
    *out_ran = FALSE;

  MatchaStepStatus status;
  if (!matcha_state_store_get_status (ctx->store, step_id, &status, error))
    return glnx_prefix_error (error, "Step '%s' (phase '%s')", step_id, phase);

  if (status == MATCHA_STEP_STATUS_DONE)
    {
      matcha_output_step (MATCHA_OUTPUT_STEP_SKIP, phase, step_id, NULL);
      return TRUE;
    }

  matcha_output_step (MATCHA_OUTPUT_STEP_BEGIN, phase, step_id, NULL);
  if (out_ran)
    *out_ran = TRUE;

  g_autoptr (GError) local_error = NULL;
  if (!func (ctx, user_data, cancellable, &local_error)
      || !matcha_state_store_set_done (ctx->store, step_id, &local_error))
    {
      if (!local_error)
        local_error = g_error_new_literal (MATCHA_ERROR, MATCHA_ERROR_FAILED,
                                           "Step returned failure without an error");
      matcha_output_step (MATCHA_OUTPUT_STEP_FAIL, phase, step_id, local_error->message);
      g_propagate_prefixed_error (error, util::move_nullify (local_error),
                                  "Step '%s' (phase '%s') failed: ", step_id, phase);
      return FALSE;
    }

  matcha_output_step (MATCHA_OUTPUT_STEP_DONE, phase, step_id, NULL);
  return TRUE;
}
