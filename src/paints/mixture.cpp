// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Parts weighted blends of paints.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "mixture.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <numeric>
#include <glibmm/i18n.h>
#include <glibmm/ustring.h>

#include "paints/errors.h"

namespace Paintmix::Paints {

Mixture::Mixture(std::vector<Blob> blobs)
    : _blobs(std::move(blobs))
    , _colour(RGB16::black())
    , _characteristics(Characteristics::Schema{})
{
    std::erase_if(_blobs, [](Blob const &blob) { return blob.parts == 0; });
    if (_blobs.empty()) {
        throw EmptyMixture(_("Empty Mixture"));
    }
    for (auto const &blob : _blobs) {
        if (!blob.paint) {
            throw PaintError(_("Mixture blob without a paint"));
        }
        if (!_kind) {
            _kind = &blob.paint->kind();
        } else if (blob.paint->kind() != *_kind) {
            throw PaintError(Glib::ustring::compose(_("Cannot mix %1 with %2"), _kind->name(), blob.paint->kind().name()));
        }
    }

    std::array<std::uint64_t, 3> total = {0, 0, 0};
    Characteristics sum = Characteristics(_kind->schema()) * 0.0;
    for (auto const &blob : _blobs) {
        _total_parts += blob.parts;
        auto const &rgb = blob.paint->rgb();
        for (unsigned i = 0; i < 3; i++) {
            total[i] += static_cast<std::uint64_t>(rgb[i]) * blob.parts;
        }
        sum += blob.paint->characteristics() * blob.parts;
    }
    sum /= _total_parts;
    _characteristics = std::move(sum);

    auto mean = [&](unsigned i) { return Colors::BPC16::round(static_cast<double>(total[i]) / _total_parts); };
    _colour = PaintColour(RGB16(mean(0), mean(1), mean(2)));

    std::stable_sort(_blobs.begin(), _blobs.end(), [](Blob const &a, Blob const &b) { return a.parts > b.parts; });
}

bool Mixture::contains_paint(Paint const &paint) const
{
    return std::any_of(_blobs.begin(), _blobs.end(),
                       [&](Blob const &blob) { return blob.paint.get() == &paint || *blob.paint == paint; });
}

MixedPaint::MixedPaint(std::vector<Blob> blobs, std::string name, std::string notes)
    : _mixture(std::move(blobs))
    , _name(std::move(name))
    , _notes(std::move(notes))
{}

/**
 * Divide every part count by their greatest common divisor.
 */
std::vector<Blob> simplify_parts(std::vector<Blob> blobs)
{
    unsigned divisor = 0;
    for (auto const &blob : blobs) {
        divisor = std::gcd(divisor, blob.parts);
    }
    if (divisor > 1) {
        for (auto &blob : blobs) {
            blob.parts /= divisor;
        }
    }
    return blobs;
}

} // namespace Paintmix::Paints
