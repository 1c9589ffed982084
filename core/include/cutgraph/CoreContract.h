#pragma once

/**
 * CoreContract.h - cutgraph core constants
 *
 * Contract-level constants shared by truncation, feature lookup, storage and
 * serialization. Changing any of them affects:
 *   - which truncations are accepted,
 *   - which stored features a supervision is matched to,
 *   - compatibility of previously written manifests and feature stores.
 */

namespace cutgraph {
namespace contract {

// ============================================================================
// Time tolerances
// ============================================================================

/**
 * TRUNCATE_END_TOLERANCE_SEC - Allowed overrun of a truncated cut's end
 *
 * new_start + new_duration may exceed the original end by at most this much.
 * Absorbs floating point drift from offset/until arithmetic; anything larger
 * is a precondition failure.
 */
constexpr double TRUNCATE_END_TOLERANCE_SEC = 1e-5;

/**
 * FEATURE_EXTENT_LEEWAY_SEC - Slack when matching a segment to stored features
 *
 * FeatureSet::find accepts features whose extent misses the requested
 * [start, start + duration] window by less than this amount on either side.
 * Feature extraction rounds extents to whole frames, so exact matches are rare.
 */
constexpr double FEATURE_EXTENT_LEEWAY_SEC = 0.05;

// ============================================================================
// Storage
// ============================================================================

/**
 * SQLITE_STORAGE_TYPE - storage_type tag of features kept in a FeatureStore
 */
constexpr const char* SQLITE_STORAGE_TYPE = "sqlite";

// ============================================================================
// Serialization
// ============================================================================

/**
 * CUT_TYPE_KEY - Discriminator field of every manifest record
 */
constexpr const char* CUT_TYPE_KEY = "type";

} // namespace contract
} // namespace cutgraph
