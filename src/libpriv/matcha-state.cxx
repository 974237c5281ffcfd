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

#include <errno.h>
#include <string.h>
#include <sys/stat.h>

#include "matcha-errors.h"
#include "matcha-state.h"
#include "matcha-util.h"

#include <libglnx.h>

struct MatchaStateStore {
  guint refcount;
  const MatchaStateStoreClass *klass;
  char *ns;
  gpointer priv;
  GDestroyNotify priv_destroy;
};

MatchaStateStore *
matcha_state_store_new (const MatchaStateStoreClass *klass, const char *ns, gpointer priv,
                        GDestroyNotify priv_destroy)
{
  g_assert (klass);
  g_assert (ns && *ns);
  MatchaStateStore *store = g_new0 (MatchaStateStore, 1);
  store->refcount = 1;
  store->klass = klass;
  store->ns = g_strdup (ns);
  store->priv = priv;
  store->priv_destroy = priv_destroy;
  return store;
}

MatchaStateStore *
matcha_state_store_ref (MatchaStateStore *store)
{
  store->refcount++;
  return store;
}

void
matcha_state_store_unref (MatchaStateStore *store)
{
  store->refcount--;
  if (store->refcount > 0)
    return;

  if (store->klass->finalize)
    store->klass->finalize (store);
  if (store->priv_destroy)
    store->priv_destroy (store->priv);
  g_free (store->ns);
  g_free (store);
}

gpointer
matcha_state_store_get_priv (MatchaStateStore *store)
{
  return store->priv;
}

const char *
matcha_state_store_get_namespace (MatchaStateStore *store)
{
  return store->ns;
}

const char *
matcha_state_store_get_backend_name (MatchaStateStore *store)
{
  return store->klass->name;
}

/* Step ids double as file names and keyfile keys, so keep them boring. */
gboolean
matcha_step_id_validate (const char *step_id, GError **error)
{
  if (!step_id || !*step_id)
    return matcha_throw (error, MATCHA_ERROR_INVALID, "Empty step id");
  if (step_id[0] == '.')
    return matcha_throw (error, MATCHA_ERROR_INVALID,
                         "Invalid step id '%s': must not start with '.'", step_id);
  for (const char *p = step_id; *p; p++)
    {
      if (!(g_ascii_isalnum (*p) || *p == '-' || *p == '_' || *p == '.' || *p == '+'))
        return matcha_throw (error, MATCHA_ERROR_INVALID, "Invalid character '%c' in step id '%s'",
                             *p, step_id);
    }
  return TRUE;
}

gboolean
matcha_state_store_get_status (MatchaStateStore *store, const char *step_id,
                               MatchaStepStatus *out_status, GError **error)
{
  if (!matcha_step_id_validate (step_id, error))
    return FALSE;
  return store->klass->get_status (store, step_id, out_status, error);
}

gboolean
matcha_state_store_set_done (MatchaStateStore *store, const char *step_id, GError **error)
{
  if (!matcha_step_id_validate (step_id, error))
    return FALSE;
  GLNX_AUTO_PREFIX_ERROR ("Persisting step marker", error);
  return store->klass->set_done (store, step_id, error);
}

gboolean
matcha_state_store_clear (MatchaStateStore *store, const char *step_id, GError **error)
{
  if (!matcha_step_id_validate (step_id, error))
    return FALSE;
  return store->klass->clear (store, step_id, error);
}

/* Marker files: <root>/.matcha-state/<ns>/<step-id>.  Paths are resolved
 * on every call rather than through a cached fd, since the root may get a
 * filesystem mounted over it by the first step.
 */
typedef struct {
  char *dir;
} MarkersStore;

static void
markers_store_free (gpointer p)
{
  auto self = static_cast<MarkersStore *> (p);
  g_free (self->dir);
  g_free (self);
}

static gboolean
markers_get_status (MatchaStateStore *store, const char *step_id, MatchaStepStatus *out_status,
                    GError **error)
{
  auto self = static_cast<MarkersStore *> (matcha_state_store_get_priv (store));
  g_autofree char *path = g_build_filename (self->dir, step_id, NULL);
  struct stat stbuf;
  if (!glnx_fstatat_allow_noent (AT_FDCWD, path, &stbuf, AT_SYMLINK_NOFOLLOW, error))
    return FALSE;
  *out_status = (errno == ENOENT) ? MATCHA_STEP_STATUS_PENDING : MATCHA_STEP_STATUS_DONE;
  return TRUE;
}

static gboolean
markers_set_done (MatchaStateStore *store, const char *step_id, GError **error)
{
  auto self = static_cast<MarkersStore *> (matcha_state_store_get_priv (store));
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, self->dir, 0755, NULL, error))
    return FALSE;

  g_autofree char *path = g_build_filename (self->dir, step_id, NULL);
  g_autofree char *ts = matcha_timestamp_now ();
  g_autofree char *contents = g_strdup_printf ("completed=%s\n", ts);
  return glnx_file_replace_contents_at (AT_FDCWD, path, (guint8 *)contents, strlen (contents),
                                        GLNX_FILE_REPLACE_DATASYNC_NEW, NULL, error);
}

static gboolean
markers_clear (MatchaStateStore *store, const char *step_id, GError **error)
{
  auto self = static_cast<MarkersStore *> (matcha_state_store_get_priv (store));
  g_autofree char *path = g_build_filename (self->dir, step_id, NULL);
  if (unlinkat (AT_FDCWD, path, 0) < 0 && errno != ENOENT)
    return glnx_throw_errno_prefix (error, "unlinkat(%s)", path);
  return TRUE;
}

static const MatchaStateStoreClass markers_class = {
  "markers", markers_get_status, markers_set_done, markers_clear, NULL,
};

MatchaStateStore *
matcha_state_store_new_markers (const char *root, const char *ns)
{
  MarkersStore *self = g_new0 (MarkersStore, 1);
  self->dir = g_build_filename (root, MATCHA_STATE_DIR, ns, NULL);
  return matcha_state_store_new (&markers_class, ns, self, markers_store_free);
}

/* A single keyfile shared by all namespaces; one group per namespace.
 * The file is re-read for every operation.
 */
typedef struct {
  char *dir;
  char *path;
} KeyfileStore;

static void
keyfile_store_free (gpointer p)
{
  auto self = static_cast<KeyfileStore *> (p);
  g_free (self->dir);
  g_free (self->path);
  g_free (self);
}

static GKeyFile *
keyfile_store_load (KeyfileStore *self, GError **error)
{
  g_autoptr (GKeyFile) kf = g_key_file_new ();
  g_autoptr (GError) local_error = NULL;
  if (!g_key_file_load_from_file (kf, self->path, G_KEY_FILE_KEEP_COMMENTS, &local_error))
    {
      if (!g_error_matches (local_error, G_FILE_ERROR, G_FILE_ERROR_NOENT))
        {
          g_propagate_error (error, util::move_nullify (local_error));
          return (GKeyFile *)glnx_prefix_error_null (error, "Loading %s", self->path);
        }
    }
  return util::move_nullify (kf);
}

static gboolean
keyfile_store_save (KeyfileStore *self, GKeyFile *kf, GError **error)
{
  if (!glnx_shutil_mkdir_p_at (AT_FDCWD, self->dir, 0755, NULL, error))
    return FALSE;
  gsize len;
  g_autofree char *data = g_key_file_to_data (kf, &len, NULL);
  return glnx_file_replace_contents_at (AT_FDCWD, self->path, (guint8 *)data, len,
                                        GLNX_FILE_REPLACE_DATASYNC_NEW, NULL, error);
}

static gboolean
keyfile_get_status (MatchaStateStore *store, const char *step_id, MatchaStepStatus *out_status,
                    GError **error)
{
  auto self = static_cast<KeyfileStore *> (matcha_state_store_get_priv (store));
  g_autoptr (GKeyFile) kf = keyfile_store_load (self, error);
  if (!kf)
    return FALSE;
  gboolean done = g_key_file_has_key (kf, matcha_state_store_get_namespace (store), step_id, NULL);
  *out_status = done ? MATCHA_STEP_STATUS_DONE : MATCHA_STEP_STATUS_PENDING;
  return TRUE;
}

static gboolean
keyfile_set_done (MatchaStateStore *store, const char *step_id, GError **error)
{
  auto self = static_cast<KeyfileStore *> (matcha_state_store_get_priv (store));
  g_autoptr (GKeyFile) kf = keyfile_store_load (self, error);
  if (!kf)
    return FALSE;
  g_autofree char *ts = matcha_timestamp_now ();
  g_key_file_set_string (kf, matcha_state_store_get_namespace (store), step_id, ts);
  return keyfile_store_save (self, kf, error);
}

static gboolean
keyfile_clear (MatchaStateStore *store, const char *step_id, GError **error)
{
  auto self = static_cast<KeyfileStore *> (matcha_state_store_get_priv (store));
  g_autoptr (GKeyFile) kf = keyfile_store_load (self, error);
  if (!kf)
    return FALSE;
  const char *ns = matcha_state_store_get_namespace (store);
  if (!g_key_file_has_key (kf, ns, step_id, NULL))
    return TRUE;
  if (!g_key_file_remove_key (kf, ns, step_id, error))
    return FALSE;
  return keyfile_store_save (self, kf, error);
}

static const MatchaStateStoreClass keyfile_class = {
  "keyfile", keyfile_get_status, keyfile_set_done, keyfile_clear, NULL,
};

MatchaStateStore *
matcha_state_store_new_keyfile (const char *root, const char *ns)
{
  KeyfileStore *self = g_new0 (KeyfileStore, 1);
  self->dir = g_build_filename (root, MATCHA_STATE_DIR, NULL);
  self->path = g_build_filename (self->dir, MATCHA_STATE_KEYFILE, NULL);
  return matcha_state_store_new (&keyfile_class, ns, self, keyfile_store_free);
}

/* In-memory; nothing survives the process.  Used by the test suite. */
static gboolean
memory_get_status (MatchaStateStore *store, const char *step_id, MatchaStepStatus *out_status,
                   GError **error)
{
  auto done = static_cast<GHashTable *> (matcha_state_store_get_priv (store));
  *out_status = g_hash_table_contains (done, step_id) ? MATCHA_STEP_STATUS_DONE
                                                      : MATCHA_STEP_STATUS_PENDING;
  return TRUE;
}

static gboolean
memory_set_done (MatchaStateStore *store, const char *step_id, GError **error)
{
  auto done = static_cast<GHashTable *> (matcha_state_store_get_priv (store));
  g_hash_table_add (done, g_strdup (step_id));
  return TRUE;
}

static gboolean
memory_clear (MatchaStateStore *store, const char *step_id, GError **error)
{
  auto done = static_cast<GHashTable *> (matcha_state_store_get_priv (store));
  g_hash_table_remove (done, step_id);
  return TRUE;
}

static const MatchaStateStoreClass memory_class = {
  "memory", memory_get_status, memory_set_done, memory_clear, NULL,
};

MatchaStateStore *
matcha_state_store_new_memory (const char *ns)
{
  GHashTable *done = g_hash_table_new_full (g_str_hash, g_str_equal, g_free, NULL);
  return matcha_state_store_new (&memory_class, ns, done, (GDestroyNotify)g_hash_table_unref);
}

/* The namespace is the environment kind, so the host and target
 * orchestrators never see each other's markers.
 */
MatchaStateStore *
matcha_state_store_new_for_config (MatchaConfig *config)
{
  const char *ns = matcha_env_kind_to_string (config->env);
  switch (config->state_backend)
    {
    case MATCHA_STATE_BACKEND_MARKERS:
      return matcha_state_store_new_markers (config->root, ns);
    case MATCHA_STATE_BACKEND_KEYFILE:
      return matcha_state_store_new_keyfile (config->root, ns);
    }
  g_assert_not_reached ();
}
