/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * passes.hpp - Main include file for the sanitizer and mutation stages
 *
 * Usage:
 *   #include "passes/passes.hpp"
 *
 *   lfichef::traversal::TraversalExpander traversal;
 *   lfichef::encoding::EncodingTransformer encoder;
 *   lfichef::nullbyte::NullByteInjector injector;
 */

#ifndef LFICHEF_PASSES_HPP
#define LFICHEF_PASSES_HPP

#include "sanitize/path_sanitizer.hpp"
#include "traversal/traversal_expander.hpp"
#include "encoding/encoding_transformer.hpp"
#include "nullbyte/null_byte_injector.hpp"

#endif // LFICHEF_PASSES_HPP
