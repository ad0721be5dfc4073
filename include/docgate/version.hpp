/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file version.hpp
 * @brief Release identification.
 */

#pragma once

#define DOCGATE_VERSION "1.0.0"
#define DOCGATE_PROTOCOL_VERSION "2024-11-05"
