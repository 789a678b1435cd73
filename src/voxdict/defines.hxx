/* Copyright 2024 The Voxdict Authors
 *
 * This file is part of Voxdict.
 *
 * Voxdict is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Voxdict is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with Voxdict.  If not, see <http://www.gnu.org/licenses/>.
 */

/**
 * @file
 * @brief Macros shared by all public headers.
 */

#ifndef VOXDICT_DEFINES_HXX
#define VOXDICT_DEFINES_HXX

#include "voxdict_export.h"

#define VOXDICT_BEGIN_INLINE_NAMESPACE inline namespace v1 {
#define VOXDICT_END_INLINE_NAMESPACE }

#endif // VOXDICT_DEFINES_HXX
