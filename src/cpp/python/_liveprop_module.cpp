/*
 * The entry point into the python _liveprop module exposing the C++ property engine to python.
 *
 * LiveObject instances are owned by python. Computed getters, setters and change handlers written in python are
 * held by the C++ object. The PropertyBinding returned by bind_properties keeps both bound objects alive, the
 * objects do not keep each other alive: once one is collected the binding stops propagating.
 */

#include <liveprop/python/py_property_value.h>

void export_types(nb::module_ &);

NB_MODULE(_liveprop, m) {
    m.doc() = "The liveprop C++ reactive property engine";

    export_types(m);
}
