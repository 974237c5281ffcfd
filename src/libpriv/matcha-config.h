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

#define MATCHA_CONFIG_GROUP "Bootstrap"
#define MATCHA_DEFAULT_CONFIG_PATH SYSCONFDIR "/matcha/bootstrap.conf"

typedef enum {
  MATCHA_ENV_HOST,
  MATCHA_ENV_TARGET,
} MatchaEnvKind;

typedef enum {
  MATCHA_STATE_BACKEND_MARKERS,
  MATCHA_STATE_BACKEND_KEYFILE,
} MatchaStateBackend;

typedef struct {
  MatchaEnvKind env;

  char *root;
  char *disk;
  char *root_part;
  char *home_part;
  char *swap_part;
  char *hostname;
  char *kernel_version;
  char *log_dir;

  /* Derived from @root unless set explicitly */
  char *sources_dir;
  char *work_dir;

  char *helper_dir;
  char *target_triplet;
  char *kernel_source_dir;
  guint jobs;
  MatchaStateBackend state_backend;
  gboolean with_package_manager;
  gboolean with_kernel;
} MatchaConfig;

MatchaConfig *matcha_config_new_defaults (MatchaEnvKind env);
void matcha_config_free (MatchaConfig *config);
G_DEFINE_AUTOPTR_CLEANUP_FUNC (MatchaConfig, matcha_config_free)

gboolean matcha_config_merge_keyfile (MatchaConfig *config, GKeyFile *keyfile, GError **error);

gboolean matcha_config_load_file (MatchaConfig *config, const char *path, gboolean allow_noent,
                                  GError **error);

gboolean matcha_config_merge_environ (MatchaConfig *config, const char *const *envp,
                                      GError **error);

gboolean matcha_config_finalize (MatchaConfig *config, GError **error);
gboolean matcha_config_require_devices (MatchaConfig *config, GError **error);

GKeyFile *matcha_config_to_target_keyfile (MatchaConfig *config);

char *matcha_config_root_path (MatchaConfig *config, const char *relpath);

const char *matcha_env_kind_to_string (MatchaEnvKind env);
gboolean matcha_env_kind_from_string (const char *str, MatchaEnvKind *out_env, GError **error);

const char *matcha_state_backend_to_string (MatchaStateBackend backend);
gboolean matcha_state_backend_from_string (const char *str, MatchaStateBackend *out_backend,
                                           GError **error);

G_END_DECLS
