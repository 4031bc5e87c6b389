/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QtGlobal>

namespace CDC {
namespace Constants {
    constexpr qint32 e2EeTagSize = 16;
    constexpr qint32 e2EeNonceSize = 12;
    constexpr qint32 symmetricKeySize = 32;

    // plaintext bytes per uploaded chunk
    constexpr qint64 chunkSize = 1024 * 1024;

    // ceiling for simultaneous requests in one fan-out
    constexpr int maxSmallCallers = 64;

    constexpr int searchTokenMinLength = 2;
    constexpr int searchTokenMaxLength = 16;
    constexpr int searchTokenLimit = 4096;

    constexpr int uploadKeyLength = 32;
    constexpr int removalTokenLength = 32;
    constexpr int linkKeyLength = 32;
}
}
