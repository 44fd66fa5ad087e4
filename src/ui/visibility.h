#pragma once

#include <gtkmm.h>

#include "converters/binding_converters.h"

void apply_visibility(Gtk::Widget& widget, Visibility visibility);
