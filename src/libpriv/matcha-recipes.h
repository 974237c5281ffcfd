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

#include "matcha-context.h"

G_BEGIN_DECLS

/* The first MATCHA_N_TARGET_PACKAGES entries are the target packages in
 * build order; the rest are only built on the host.
 */
typedef enum {
  MATCHA_PACKAGE_BZIP2,
  MATCHA_PACKAGE_COREUTILS,
  MATCHA_PACKAGE_DIFFUTILS,
  MATCHA_PACKAGE_FINDUTILS,
  MATCHA_PACKAGE_GAWK,
  MATCHA_PACKAGE_GREP,
  MATCHA_PACKAGE_GZIP,
  MATCHA_PACKAGE_MAKE,
  MATCHA_PACKAGE_PATCH,
  MATCHA_PACKAGE_TAR,
  MATCHA_PACKAGE_XZ,
  MATCHA_PACKAGE_BINUTILS,
  MATCHA_PACKAGE_GCC,
  MATCHA_PACKAGE_LINUX,
  MATCHA_PACKAGE_UTIL_LINUX,
  MATCHA_PACKAGE_E2FSPROGS,
  MATCHA_PACKAGE_SHADOW,
  MATCHA_PACKAGE_SYSKLOGD,
  MATCHA_PACKAGE_PROCPS_NG,
  MATCHA_PACKAGE_MAN_DB,
  MATCHA_PACKAGE_PERL,
  MATCHA_PACKAGE_PYTHON3,
  MATCHA_PACKAGE_BASH,

  MATCHA_PACKAGE_MPFR,
  MATCHA_PACKAGE_GMP,
  MATCHA_PACKAGE_MPC,
  MATCHA_PACKAGE_GLIBC,
  MATCHA_PACKAGE_GUIX,

  MATCHA_N_PACKAGES,
} MatchaPackage;

#define MATCHA_N_TARGET_PACKAGES (MATCHA_PACKAGE_BASH + 1)

const char *matcha_package_to_name (MatchaPackage pkg);
gboolean matcha_package_from_name (const char *name, MatchaPackage *out_pkg, GError **error);

typedef enum {
  MATCHA_ACTION_PRE_BUILD,
  MATCHA_ACTION_CONFIGURE,
  MATCHA_ACTION_COMPILE,
  MATCHA_ACTION_INSTALL,
} MatchaActionKind;

typedef enum {
  MATCHA_RECIPE_ACTION_NONE = 0,
  /* A failure is logged as a warning and the recipe continues */
  MATCHA_RECIPE_ACTION_ALLOW_FAILURE = (1 << 0),
  /* Run in the build directory instead of the source directory */
  MATCHA_RECIPE_ACTION_IN_BUILD_DIR = (1 << 1),
} MatchaRecipeActionFlags;

#define MATCHA_RECIPE_MAX_ARGS 16

typedef struct {
  MatchaActionKind kind;
  const char *log_phase;
  guint flags; /* MatchaRecipeActionFlags */
  const char *argv[MATCHA_RECIPE_MAX_ARGS];
} MatchaRecipeAction;

typedef enum {
  MATCHA_RECIPE_NONE = 0,
  /* A missing archive skips the recipe instead of failing it */
  MATCHA_RECIPE_OPTIONAL = (1 << 0),
} MatchaRecipeFlags;

typedef struct {
  MatchaPackage package;
  const char *step_id;
  const char *archive;
  guint flags; /* MatchaRecipeFlags */
  /* Out-of-tree build directory; relative paths are below the work
   * directory.  %NULL builds in the source tree.
   */
  const char *build_dir;
  /* Unpacked into the source tree as <srcdir>/<name>, if present */
  const MatchaPackage *extra_packages;
  guint n_extra_packages;
  const MatchaRecipeAction *actions;
  guint n_actions;
} MatchaRecipe;

typedef struct MatchaRecipeRegistry MatchaRecipeRegistry;

MatchaRecipeRegistry *matcha_recipe_registry_new (void);
void matcha_recipe_registry_free (MatchaRecipeRegistry *registry);
G_DEFINE_AUTOPTR_CLEANUP_FUNC (MatchaRecipeRegistry, matcha_recipe_registry_free)

gboolean matcha_recipe_registry_register (MatchaRecipeRegistry *registry,
                                          const MatchaRecipe *recipe, GError **error);
const MatchaRecipe *matcha_recipe_registry_dispatch (MatchaRecipeRegistry *registry,
                                                     MatchaPackage pkg);
guint matcha_recipe_registry_get_size (MatchaRecipeRegistry *registry);

MatchaRecipeRegistry *matcha_recipe_registry_new_host (GError **error);
MatchaRecipeRegistry *matcha_recipe_registry_new_target (GError **error);

gboolean matcha_recipe_build (MatchaBuildContext *ctx, const MatchaRecipe *recipe,
                              GCancellable *cancellable, GError **error);

gboolean matcha_recipe_step_func (MatchaBuildContext *ctx, gpointer recipe,
                                  GCancellable *cancellable, GError **error);

G_END_DECLS
