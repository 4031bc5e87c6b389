/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "abstractapiclient.h"

namespace CDC {

AbstractApiClient::~AbstractApiClient() = default;

}
