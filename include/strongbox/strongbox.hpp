// ============================================================================
// Strongbox - Main Include Header
// ============================================================================
// Include this single header to access all Strongbox functionality.
// ============================================================================

#ifndef STRONGBOX_STRONGBOX_HPP
#define STRONGBOX_STRONGBOX_HPP

// Core types and utilities
#include "strongbox/types.hpp"
#include "strongbox/version.hpp"
#include "strongbox/config.hpp"
#include "strongbox/file_io.hpp"

// Master key and envelope (AES-256-GCM)
#include "strongbox/key_store.hpp"
#include "strongbox/encoding.hpp"
#include "strongbox/envelope.hpp"

// Persistent service -> record mapping
#include "strongbox/record_store.hpp"

#endif // STRONGBOX_STRONGBOX_HPP
