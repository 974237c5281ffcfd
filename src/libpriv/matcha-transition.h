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

#define MATCHA_TRANSITION_STEP "create-chroot-scripts"
#define MATCHA_TARGET_BINARY "usr/sbin/matcha-bootstrap"
/* Private copies of the binary's shared libraries and ELF interpreter */
#define MATCHA_TARGET_LIBDIR "usr/lib/matcha-bootstrap"
#define MATCHA_TARGET_CONFIG "etc/matcha/bootstrap.conf"
#define MATCHA_TARGET_LAUNCHER "root/matcha-chroot-auto.sh"
#define MATCHA_ENTER_CHROOT_HELPER "enter-chroot.sh"

gboolean matcha_transition_generate (MatchaBuildContext *ctx, const char *self_exe,
                                     GCancellable *cancellable, GError **error);

gboolean matcha_transition_step_func (MatchaBuildContext *ctx, gpointer self_exe,
                                      GCancellable *cancellable, GError **error);

G_END_DECLS
