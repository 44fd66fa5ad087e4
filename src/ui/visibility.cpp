#include "ui/visibility.h"

void apply_visibility(Gtk::Widget& widget, Visibility visibility) {
    switch (visibility) {
        case Visibility::Visible:
            widget.set_visible(true);
            widget.set_opacity(1.0);
            widget.set_can_target(true);
            break;
        case Visibility::Hidden:
            widget.set_visible(true);
            widget.set_opacity(0.0);
            widget.set_can_target(false);
            break;
        case Visibility::Collapsed:
            widget.set_visible(false);
            break;
    }
}
