#pragma once

/// Convenience umbrella header for the stencil library.

#include <stencil/core/time.hpp>
#include <stencil/core/value.hpp>
#include <stencil/parser/ast.hpp>
#include <stencil/parser/lexer.hpp>
#include <stencil/parser/parser.hpp>
#include <stencil/runtime/evaluator.hpp>
#include <stencil/runtime/operation_registry.hpp>
#include <stencil/runtime/ops.hpp>
#include <stencil/runtime/path.hpp>
#include <stencil/runtime/template_cache.hpp>
