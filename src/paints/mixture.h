// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Parts weighted blends of paints.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PAINTS_MIXTURE_H
#define SEEN_PAINTS_MIXTURE_H

#include <memory>
#include <string>
#include <vector>

#include "paints/paint.h"

namespace Paintmix::Paints {

struct Blob
{
    std::shared_ptr<Paint const> paint;
    unsigned parts = 0;
};

/**
 * The colour and characteristics of paints mixed in whole parts.
 *
 * Blobs with no parts take no part and are dropped, the rest are kept largest first.
 */
class Mixture
{
public:
    explicit Mixture(std::vector<Blob> blobs);

    std::vector<Blob> const &blobs() const { return _blobs; }
    unsigned total_parts() const { return _total_parts; }
    PaintKind const &kind() const { return *_kind; }

    PaintColour const &colour() const { return _colour; }
    RGB16 const &rgb() const { return _colour.rgb(); }
    double value() const { return _colour.value(); }
    double chroma() const { return _colour.chroma(); }
    Characteristics const &characteristics() const { return _characteristics; }

    bool contains_paint(Paint const &paint) const;

private:
    std::vector<Blob> _blobs;
    unsigned _total_parts = 0;
    PaintKind const *_kind = nullptr;
    PaintColour _colour;
    Characteristics _characteristics;
};

/**
 * A mixture the user has named, with notes on what it was mixed for.
 */
class MixedPaint
{
public:
    MixedPaint(std::vector<Blob> blobs, std::string name, std::string notes = {});

    std::string const &name() const { return _name; }
    std::string const &notes() const { return _notes; }
    void set_notes(std::string notes) { _notes = std::move(notes); }
    Mixture const &mixture() const { return _mixture; }

    RGB16 const &rgb() const { return _mixture.rgb(); }
    Characteristics const &characteristics() const { return _mixture.characteristics(); }

private:
    Mixture _mixture;
    std::string _name;
    std::string _notes;
};

std::vector<Blob> simplify_parts(std::vector<Blob> blobs);

} // namespace Paintmix::Paints

#endif // SEEN_PAINTS_MIXTURE_H
