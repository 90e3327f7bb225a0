// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Errors raised while building, mixing and reading paints.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_ERRORS_H
#define SEEN_PAINTS_ERRORS_H

#include <exception>
#include <string>

namespace Paintmix::Paints {

class PaintError : public std::exception
{
public:
    PaintError(std::string msg)
        : _msg(std::move(msg))
    {}
    char const *what() const noexcept override { return _msg.c_str(); }

private:
    std::string _msg;
};

/**
 * A characteristic label or value that matches no rating.
 */
class InvalidCharacteristic : public PaintError
{
public:
    using PaintError::PaintError;
};

/**
 * A mixture without any parts.
 */
class EmptyMixture : public PaintError
{
public:
    using PaintError::PaintError;
};

/**
 * A line of a collection definition which could not be read.
 */
class ParseError : public PaintError
{
public:
    ParseError(std::string line, std::string reason)
        : PaintError(line.empty() ? reason : reason + ": " + line)
        , _line(std::move(line))
        , _reason(std::move(reason))
    {}

    std::string const &line() const { return _line; }
    std::string const &reason() const { return _reason; }

private:
    std::string _line;
    std::string _reason;
};

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_ERRORS_H
