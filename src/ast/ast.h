#pragma once

// Umbrella header for the template AST
#include "node.h"
#include "expressions.h"
#include "view.h"
