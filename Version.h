// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_VERSION_H
#define RINGDU_VERSION_H

#include <string_view>

namespace Version {
    inline constexpr std::string_view VERSION = "0.4.0";
};

#endif //RINGDU_VERSION_H
