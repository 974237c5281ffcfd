/*
 * Copyright (C) 2026 Matcha Linux contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA 02110-1301 USA
 */

#pragma once

#include <glib.h>
#include <memory>
#include <stdbool.h>

// C++ APIs here
namespace matcha
{

enum class ProgressType
{
  N_ITEMS,
};

struct Progress
{
public:
  void set_sub_message (const char *msg);
  void nitems_update (guint n);

  void end (const char *msg);
  ~Progress ()
  {
    if (!this->ended)
      this->end ("");
  }
  Progress (ProgressType t)
  {
    ptype = t;
    ended = false;
  }
  ProgressType ptype;
  bool ended;
};

std::unique_ptr<Progress> progress_nitems_begin (guint n, const char *msg) noexcept;
}

// C APIs
G_BEGIN_DECLS

typedef enum
{
  MATCHA_OUTPUT_MESSAGE,
  MATCHA_OUTPUT_WARNING,
  MATCHA_OUTPUT_STEP_BEGIN,
  MATCHA_OUTPUT_STEP_SKIP,
  MATCHA_OUTPUT_STEP_DONE,
  MATCHA_OUTPUT_STEP_FAIL,
  MATCHA_OUTPUT_PROGRESS_BEGIN,
  MATCHA_OUTPUT_PROGRESS_UPDATE,
  MATCHA_OUTPUT_PROGRESS_SUB_MESSAGE,
  MATCHA_OUTPUT_PROGRESS_END,
} MatchaOutputType;

typedef void (*MatchaOutputCallback) (MatchaOutputType type, void *data, void *opaque);

void matcha_output_default_handler (MatchaOutputType type, void *data, void *opaque);

void matcha_output_set_callback (MatchaOutputCallback cb, void *opaque);

/* Used for both MESSAGE and WARNING */
typedef struct
{
  const char *text;
} MatchaOutputMessage;

void matcha_output_message (const char *format, ...) G_GNUC_PRINTF (1, 2);
void matcha_output_warning (const char *format, ...) G_GNUC_PRINTF (1, 2);

/* Step lifecycle events.  @detail is only set for STEP_FAIL, where it
 * carries the error message.
 */
typedef struct
{
  const char *phase;
  const char *step_id;
  const char *detail;
} MatchaOutputStep;

void matcha_output_step (MatchaOutputType type, const char *phase, const char *step_id,
                         const char *detail);

/* If n is zero, then it is taken to be an indefinite task.  Otherwise,
 * n is used for n_items.
 */
typedef struct
{
  const char *prefix;
  guint n;
} MatchaOutputProgressBegin;

typedef struct
{
  guint c;
} MatchaOutputProgressUpdate;

typedef struct
{
  const char *msg;
} MatchaOutputProgressEnd;

G_END_DECLS
