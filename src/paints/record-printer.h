// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Writer for the constructor call records of a collection definition.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_RECORD_PRINTER_H
#define SEEN_PAINTS_RECORD_PRINTER_H

#include <sstream>
#include <string>

#include "colors/rgb.h"

namespace Paintmix::Paints {

/**
 * Prints `TypeName(key="value", rgb=RGB(0xFFFF, 0x8000, 0x0), ...)`.
 */
class RecordPrinter : public std::ostringstream
{
public:
    explicit RecordPrinter(std::string const &type_name)
    {
        imbue(std::locale("C"));
        *this << type_name << "(";
    }

    RecordPrinter &field(std::string const &name, std::string const &text);
    RecordPrinter &field(std::string const &name, Colors::RGB<Colors::BPC16> const &rgb);

    operator std::string()
    {
        if (!_done) {
            _done = true;
            *this << ")";
        }
        return str();
    }

    static std::string escape(std::string const &text);

private:
    void _key(std::string const &name);

    bool _done = false;
    unsigned _count = 0;
};

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_RECORD_PRINTER_H
