#pragma once

/** \file wal.hpp
 *  \brief Umbrella header for WAL APIs.
 *
 *  This header includes the public Write-Ahead Log (WAL) interfaces:
 *   - Configuration (options.hpp)
 *   - SHA-256 integrity helpers (integrity.hpp)
 *   - Record line codec (record.hpp)
 *   - Segment files and rotating writer (segment.hpp)
 *   - Checkpoint persistence and pruning (checkpoint.hpp)
 *   - Recovery scanning (recovery.hpp)
 *   - The WriteAheadLog itself (log.hpp)
 */

#include "walden/wal/options.hpp"
#include "walden/wal/integrity.hpp"
#include "walden/wal/record.hpp"
#include "walden/wal/segment.hpp"
#include "walden/wal/checkpoint.hpp"
#include "walden/wal/recovery.hpp"
#include "walden/wal/log.hpp"
