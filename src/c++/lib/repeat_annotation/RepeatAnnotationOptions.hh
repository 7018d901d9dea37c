//
// TRanno - Tandem Repeat Annotation
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
///

#pragma once

#include <string>


/// options shared by repeat annotation loaders
struct RepeatAnnotationOptions
{
    /// reads are fetched from the locus region extended by this many bases on each side
    ///
    /// this must be at least as large as the flanks retained on reads by the repeat caller
    unsigned readSearchRadius = 1000;

    /// reference fasta, only required to decode CRAM alignment files
    std::string referenceFilename;
};
