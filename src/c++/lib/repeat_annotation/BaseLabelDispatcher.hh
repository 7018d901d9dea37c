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
/// \brief Route base labeling of called alleles to the labeler suited to the locus structure
///

#pragma once

#include "BaseLabel.hh"
#include "MotifSpan.hh"
#include "RepeatLocus.hh"

#include <string>
#include <vector>


namespace BASE_LABEL_STRATEGY
{
enum index_t
{
    NESTED_STRUCTURE,
    MOTIF_SPANS
};

inline
const char*
label(const index_t i)
{
    switch (i)
    {
    case NESTED_STRUCTURE:
        return "nested-structure";
    case MOTIF_SPANS:
        return "motif-spans";
    default:
        return "unknown";
    }
}
}


/// select the base labeling strategy from the locus structure descriptor
///
/// descriptors containing '<' describe nested or alternating repeats
BASE_LABEL_STRATEGY::index_t
getBaseLabelStrategy(const std::string& structure);


/// labeler for loci with nested repeat structure
///
/// must return one label per base for each input allele, in input allele order
struct NestedStructureBaseLabeler
{
    virtual ~NestedStructureBaseLabeler() {}

    virtual
    std::vector<BaseLabels>
    getBaseLabels(
        const RepeatLocus& locus,
        const std::vector<std::string>& alleleSeqs) const = 0;
};


/// labeler for simple loci, driven by the motif spans reported for each allele
///
/// must return one label per base for each input allele, in input allele order
struct MotifSpanBaseLabeler
{
    virtual ~MotifSpanBaseLabeler() {}

    virtual
    std::vector<BaseLabels>
    getBaseLabels(
        const RepeatLocus& locus,
        const std::vector<AlleleMotifSpans>& spansByAllele,
        const std::vector<std::string>& alleleSeqs) const = 0;
};


/// routes base labeling to one of two labelers, the dispatcher does no labeling itself
///
/// the labelers are owned by the caller and must outlive the dispatcher
struct BaseLabelDispatcher
{
    BaseLabelDispatcher(
        const NestedStructureBaseLabeler& nestedLabeler,
        const MotifSpanBaseLabeler& motifSpanLabeler)
        : _nestedLabeler(nestedLabeler),
          _motifSpanLabeler(motifSpanLabeler)
    {}

    /// \param[in] alleleSeqs full allele sequences, including flanks
    ///
    /// throws GeneralException if the selected labeler does not return one label per allele base
    std::vector<BaseLabels>
    getBaseLabels(
        const RepeatLocus& locus,
        const std::vector<AlleleMotifSpans>& spansByAllele,
        const std::vector<std::string>& alleleSeqs) const;

private:
    const NestedStructureBaseLabeler& _nestedLabeler;
    const MotifSpanBaseLabeler& _motifSpanLabeler;
};
