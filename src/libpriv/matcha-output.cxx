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

#include "config.h"

#include <libglnx.h>
#include <memory>
#include <systemd/sd-journal.h>

#include "matcha-output.h"
#include "matcha-util.h"

#define MATCHA_MESSAGE_STEP_DONE SD_ID128_MAKE (3b, 8f, 27, 41, 6c, 0e, 4d, 52, 9a, 1d, c4, 70, 5e, 22, b9, 13)
#define MATCHA_MESSAGE_STEP_FAIL SD_ID128_MAKE (a4, 61, 0c, d9, 87, 5b, 4f, e8, 86, 3a, 12, ff, 09, 7d, c3, 5e)

/* Default progress state; only touched by the default handler */
static char *progress_prefix;
static guint progress_n;
static guint progress_c;

static void
print_step (const char *verb, MatchaOutputStep *step, gboolean to_stderr)
{
  g_autofree char *ts = matcha_timestamp_now ();
  if (to_stderr)
    g_printerr ("[%s] %s %s%s%s\n", ts, verb, step->step_id, step->detail ? ": " : "",
                step->detail ?: "");
  else
    g_print ("[%s] %s %s\n", ts, verb, step->step_id);
}

/* These print directly to the terminal; the step completion events are
 * additionally sent to the journal so an operator can find them after a
 * reboot.
 */
void
matcha_output_default_handler (MatchaOutputType type, void *data, void *opaque)
{
  switch (type)
    {
    case MATCHA_OUTPUT_MESSAGE:
      g_print ("%s\n", ((MatchaOutputMessage *)data)->text);
      break;
    case MATCHA_OUTPUT_WARNING:
      {
        auto msg = static_cast<MatchaOutputMessage *> (data);
        g_printerr ("warning: %s\n", msg->text);
        sd_journal_print (LOG_WARNING, "%s", msg->text);
      }
      break;
    case MATCHA_OUTPUT_STEP_BEGIN:
      print_step ("START", static_cast<MatchaOutputStep *> (data), FALSE);
      break;
    case MATCHA_OUTPUT_STEP_SKIP:
      {
        auto step = static_cast<MatchaOutputStep *> (data);
        g_autofree char *ts = matcha_timestamp_now ();
        g_print ("[%s] SKIP %s (already done)\n", ts, step->step_id);
      }
      break;
    case MATCHA_OUTPUT_STEP_DONE:
      {
        auto step = static_cast<MatchaOutputStep *> (data);
        print_step ("DONE", step, FALSE);
        sd_journal_send ("MESSAGE_ID=" SD_ID128_FORMAT_STR,
                         SD_ID128_FORMAT_VAL (MATCHA_MESSAGE_STEP_DONE),
                         "MESSAGE=Completed step %s (phase %s)", step->step_id, step->phase,
                         "MATCHA_STEP=%s", step->step_id, "MATCHA_PHASE=%s", step->phase,
                         "PRIORITY=%i", LOG_INFO, NULL);
      }
      break;
    case MATCHA_OUTPUT_STEP_FAIL:
      {
        auto step = static_cast<MatchaOutputStep *> (data);
        print_step ("FAIL", step, TRUE);
        sd_journal_send ("MESSAGE_ID=" SD_ID128_FORMAT_STR,
                         SD_ID128_FORMAT_VAL (MATCHA_MESSAGE_STEP_FAIL),
                         "MESSAGE=Step %s (phase %s) failed: %s", step->step_id, step->phase,
                         step->detail ?: "unknown error", "MATCHA_STEP=%s", step->step_id,
                         "MATCHA_PHASE=%s", step->phase, "PRIORITY=%i", LOG_ERR, NULL);
      }
      break;
    case MATCHA_OUTPUT_PROGRESS_BEGIN:
      {
        auto begin = static_cast<MatchaOutputProgressBegin *> (data);
        g_free (progress_prefix);
        progress_prefix = g_strdup (begin->prefix);
        progress_n = begin->n;
        progress_c = 0;
        g_print ("==> %s\n", begin->prefix);
      }
      break;
    case MATCHA_OUTPUT_PROGRESS_UPDATE:
      {
        auto upd = static_cast<MatchaOutputProgressUpdate *> (data);
        progress_c = upd->c;
      }
      break;
    case MATCHA_OUTPUT_PROGRESS_SUB_MESSAGE:
      {
        auto msg = static_cast<const char *> (data);
        if (progress_n > 0)
          g_print ("==> [%u/%u] %s\n", progress_c, progress_n, msg ?: "");
        else
          g_print ("==> %s\n", msg ?: "");
      }
      break;
    case MATCHA_OUTPUT_PROGRESS_END:
      {
        auto end = static_cast<MatchaOutputProgressEnd *> (data);
        if (end->msg && *end->msg)
          g_print ("==> %s: %s\n", progress_prefix ?: "", end->msg);
        g_clear_pointer (&progress_prefix, g_free);
        progress_n = progress_c = 0;
      }
      break;
    }
}

static GPrivate active_cb;
static GPrivate active_cb_opaque;

static void
invoke_output (MatchaOutputType ty, void *task)
{
  MatchaOutputCallback cb
      = (MatchaOutputCallback)g_private_get (&active_cb) ?: matcha_output_default_handler;
  void *data = g_private_get (&active_cb_opaque);
  cb (ty, task, data);
}

/* Passing %NULL for @cb restores the default handler. */
void
matcha_output_set_callback (MatchaOutputCallback cb, void *opaque)
{
  g_private_replace (&active_cb, (void *)cb);
  g_private_replace (&active_cb_opaque, opaque);
}

#define strdup_vprintf(format)                                                                     \
  ({                                                                                               \
    va_list args;                                                                                  \
    va_start (args, format);                                                                       \
    char *s = g_strdup_vprintf (format, args);                                                     \
    va_end (args);                                                                                 \
    s;                                                                                             \
  })

void
matcha_output_message (const char *format, ...)
{
  g_autofree char *final_msg = strdup_vprintf (format);
  MatchaOutputMessage task = { final_msg };
  invoke_output (MATCHA_OUTPUT_MESSAGE, &task);
}

void
matcha_output_warning (const char *format, ...)
{
  g_autofree char *final_msg = strdup_vprintf (format);
  MatchaOutputMessage task = { final_msg };
  invoke_output (MATCHA_OUTPUT_WARNING, &task);
}

void
matcha_output_step (MatchaOutputType type, const char *phase, const char *step_id,
                    const char *detail)
{
  g_assert (type >= MATCHA_OUTPUT_STEP_BEGIN && type <= MATCHA_OUTPUT_STEP_FAIL);
  MatchaOutputStep step = { phase, step_id, detail };
  invoke_output (type, &step);
}

namespace matcha
{

// When working on a task/nitems, often we want to display a particular
// item (such as a phase).
void
Progress::set_sub_message (const char *msg)
{
  invoke_output (MATCHA_OUTPUT_PROGRESS_SUB_MESSAGE, (void *)msg);
}

// Start working on a 0-n task.
std::unique_ptr<Progress>
progress_nitems_begin (guint n, const char *msg) noexcept
{
  MatchaOutputProgressBegin begin = { msg, n };
  invoke_output (MATCHA_OUTPUT_PROGRESS_BEGIN, &begin);
  auto v = std::make_unique<Progress> (ProgressType::N_ITEMS);
  g_debug ("init progress nitems n=%u text=%s", n, msg);
  return v;
}

void
Progress::nitems_update (guint n)
{
  MatchaOutputProgressUpdate progress = { n };
  invoke_output (MATCHA_OUTPUT_PROGRESS_UPDATE, &progress);
}

void
Progress::end (const char *msg)
{
  g_assert (!this->ended);
  MatchaOutputProgressEnd done = { msg };
  invoke_output (MATCHA_OUTPUT_PROGRESS_END, &done);
  this->ended = true;
}

} /* namespace */
