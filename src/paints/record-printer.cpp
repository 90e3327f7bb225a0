// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Writer for the constructor call records of a collection definition.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "record-printer.h"

#include <iomanip>

namespace Paintmix::Paints {

/**
 * Backslash escape double quotes and backslashes.
 */
std::string RecordPrinter::escape(std::string const &text)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

void RecordPrinter::_key(std::string const &name)
{
    *this << (_count++ ? ", " : "") << name << "=";
}

RecordPrinter &RecordPrinter::field(std::string const &name, std::string const &text)
{
    if (!_done) {
        _key(name);
        *this << '"' << escape(text) << '"';
    }
    return *this;
}

RecordPrinter &RecordPrinter::field(std::string const &name, Colors::RGB<Colors::BPC16> const &rgb)
{
    if (!_done) {
        _key(name);
        *this << "RGB(";
        for (unsigned i = 0; i < 3; i++) {
            *this << (i ? ", " : "") << "0x" << std::uppercase << std::hex << rgb[i] << std::dec;
        }
        *this << ")";
    }
    return *this;
}

} // namespace Paintmix::Paints
