#pragma once
#include "rlink/bridged.hpp"
#include "rlink/decl.hpp"
#include "rlink/descriptor.hpp"
#include "rlink/diagnostics_json.hpp"
#include "rlink/engine.hpp"
#include "rlink/env.hpp"
#include "rlink/errors.hpp"
#include "rlink/form.hpp"
#include "rlink/linker.hpp"
#include "rlink/typed.hpp"
#include "rlink/types.hpp"
#include "rlink/value.hpp"
