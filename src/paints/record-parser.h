// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Readers for the paint records of a collection definition, current and historical.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_RECORD_PARSER_H
#define SEEN_PAINTS_RECORD_PARSER_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <glibmm/refptr.h>

#include "paints/paint.h"

namespace Glib {
class Regex;
} // namespace Glib

namespace Paintmix::Paints {

/**
 * One way of writing a paint on a line. A parser is picked by testing the first record of
 * a file, every other record of that file must then be in the same format.
 */
class RecordParser
{
public:
    RecordParser(std::string name)
        : _name(std::move(name))
    {}
    virtual ~RecordParser() = default;

    std::string const &getName() const { return _name; }

    virtual bool detect(std::string const &line, PaintKind const &kind) const = 0;
    /// @throws ParseError if the line is not a record of this format.
    virtual Paint parse(std::string const &line, PaintKind const &kind) const = 0;

private:
    std::string _name;
};

/**
 * Regular expressions compiled once for each paint kind.
 */
class MatcherParser : public RecordParser
{
public:
    using RecordParser::RecordParser;

protected:
    Glib::RefPtr<Glib::Regex> const &matcher(PaintKind const &kind) const;
    virtual std::string pattern(PaintKind const &kind) const = 0;

private:
    mutable std::map<PaintKind const *, Glib::RefPtr<Glib::Regex>> _matchers;
};

/**
 * `ModelPaint(name="...", rgb=RGB(0xFFFF, 0x8000, 0x0), transparency="O", finish="F", fs_number="")`
 */
class CurrentRecordParser : public MatcherParser
{
public:
    CurrentRecordParser()
        : MatcherParser("current")
    {}
    bool detect(std::string const &line, PaintKind const &kind) const override;
    Paint parse(std::string const &line, PaintKind const &kind) const override;

protected:
    std::string pattern(PaintKind const &kind) const override;
};

/**
 * `NamedColour(name="...", rgb=RGB16(...), transparency="O", finish="F")`
 */
class NamedColourParser : public MatcherParser
{
public:
    NamedColourParser()
        : MatcherParser("NamedColour")
    {}
    bool detect(std::string const &line, PaintKind const &kind) const override;
    Paint parse(std::string const &line, PaintKind const &kind) const override;

protected:
    std::string pattern(PaintKind const &kind) const override;
};

/**
 * `Name: RGB(255, 128, 0), Transparency("O"), Finish("F")` with 8 bit channels.
 */
class LegacyRecordParser : public MatcherParser
{
public:
    LegacyRecordParser()
        : MatcherParser("legacy")
    {}
    bool detect(std::string const &line, PaintKind const &kind) const override;
    Paint parse(std::string const &line, PaintKind const &kind) const override;

protected:
    std::string pattern(PaintKind const &kind) const override;
};

/**
 * Any constructor call expression for the paint kind, accepts every line for detection.
 */
class ExpressionRecordParser : public RecordParser
{
public:
    ExpressionRecordParser()
        : RecordParser("expression")
    {}
    bool detect(std::string const &line, PaintKind const &kind) const override { return true; }
    Paint parse(std::string const &line, PaintKind const &kind) const override;
};

class RecordParsers
{
private:
    RecordParsers(RecordParsers const &) = delete;
    void operator=(RecordParsers const &) = delete;

public:
    RecordParsers();
    ~RecordParsers() = default;

    static RecordParsers &get()
    {
        static RecordParsers instance;
        return instance;
    }

    RecordParser const *detect(std::string const &line, PaintKind const &kind) const;
    std::vector<Paint> parse(std::vector<std::string> const &lines, PaintKind const &kind) const;

    void addParser(RecordParser *parser);

private:
    std::vector<std::shared_ptr<RecordParser>> _parsers;
};

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_RECORD_PARSER_H
