#pragma once
// Collab: @collab trust annotation engine
//
// Pipeline per file:
// - Comment extraction: language-aware lexer over comments and strings
// - Directive parsing: single-line, merged and block @collab directives
// - Scope detection: brace, indentation or explicit-marker styles
// - Precedence resolution: nested regions with inherited attributes
// - Region index: position → effective attributes
//
// Around it: trust configuration, scan cache, workspace.

#include "types.hpp"
#include "source_text.hpp"
#include "language.hpp"
#include "comment_extractor.hpp"
#include "directive_parser.hpp"
#include "scope_detector.hpp"
#include "precedence_resolver.hpp"
#include "region_index.hpp"
#include "scanner.hpp"
#include "scan_cache.hpp"
#include "trust_config.hpp"
#include "config.hpp"
#include "serialize.hpp"
#include "workspace.hpp"
