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

#include "BaseLabel.hh"
#include "RegionLabel.hh"

#include <string>


/// one called haplotype at a repeat locus, with all annotation layers in allele coordinates
struct RepeatAllele
{
    /// full allele sequence: left flank, called repeat sequence, right flank
    std::string seq;
    RegionLabels regionLabels;
    RegionLabels flankLabels;
    BaseLabels baseLabels;
};
