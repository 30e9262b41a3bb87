// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#ifndef WLANCTL_VERSION
#define WLANCTL_VERSION "0.1.0"
#endif
