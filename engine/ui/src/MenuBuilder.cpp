#include "menukit/ui/MenuBuilder.hpp"

#include <utility>

namespace menukit::ui {

Menu BuildMenu(Context& context,
               const core::MenuSpec& spec,
               MenuConfig config,
               const OptionStyle& defaults) {
    if (spec.background) {
        config.background = spec.background;
    }
    if (!spec.background_image.empty()) {
        config.background_image = spec.background_image;
    }
    config.spacing = spec.spacing;

    Menu menu(context, std::move(config));
    for (const auto& option_spec : spec.options) {
        OptionStyle style = defaults;
        style.message_color_onblur = option_spec.color_onblur;
        style.message_color_onfocus = option_spec.color_onfocus;
        style.background_color_onblur = option_spec.background_onblur;
        style.background_color_onfocus = option_spec.background_onfocus;
        if (option_spec.font_size > 0) {
            style.font_size = option_spec.font_size;
        }
        const std::size_t index = menu.Add(option_spec.message, std::move(style));
        menu.option(index).set_id(option_spec.id);
    }
    menu.LinkChain(spec.wrap);
    return menu;
}

}  // namespace menukit::ui
