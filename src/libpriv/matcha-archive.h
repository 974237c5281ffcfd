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

#include <archive.h>
#include <archive_entry.h>
#include <gio/gio.h>

G_BEGIN_DECLS

typedef struct archive MatchaArchiveWriter;
G_DEFINE_AUTOPTR_CLEANUP_FUNC (archive, archive_read_free)
G_DEFINE_AUTOPTR_CLEANUP_FUNC (MatchaArchiveWriter, archive_write_free)

/* In order of preference */
extern const char *const matcha_archive_suffixes[];

gboolean matcha_archive_resolve (const char *sources_dir, const char *name, char **out_path,
                                 GError **error);

gboolean matcha_archive_extract (const char *archive_path, const char *dest_dir, char **out_topdir,
                                 GCancellable *cancellable, GError **error);

G_END_DECLS
