#pragma once

#include "menukit/core/MenuSpec.hpp"
#include "menukit/ui/Context.hpp"
#include "menukit/ui/Menu.hpp"
#include "menukit/ui/Option.hpp"

namespace menukit::ui {

// Builds a menu from a declarative description. `defaults` supplies the font
// and anything the description leaves out; the description's background and
// spacing override `config`.
Menu BuildMenu(Context& context,
               const core::MenuSpec& spec,
               MenuConfig config = {},
               const OptionStyle& defaults = {});

}  // namespace menukit::ui
