#pragma once

#include "hir/Call.h"
#include "hir/Function.h"
#include "hir/Literal.h"
#include "hir/Module.h"
#include "hir/Node.h"
#include "hir/Variable.h"
