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

#include "blt_util/thirdparty_push.h"

#include "htslib/hts.h"
#include "htslib/sam.h"

#include "blt_util/thirdparty_pop.h"

#include <cstdint>

#include <string>
#include <vector>


/// replace all read data in an existing bam record with an unmapped read having the given name and
/// sequence, all base qualities are set to the BAM 'missing' value
///
/// any existing aux data is removed
void
edit_bam_read(
    const char* qname,
    const char* read,
    bam1_t& br);

/// replace all read data in an existing bam record with a read aligned without gaps
/// at the given 0-indexed position of contig tid
///
/// any existing aux data is removed
void
edit_bam_mapped_read(
    const char* qname,
    const int32_t tid,
    const int64_t pos,
    const char* read,
    bam1_t& br);

/// append a string ('Z') aux tag to the bam record
void
add_bam_string_tag(
    const char* tag,
    const char* value,
    bam1_t& br);

/// append an integer ('i') aux tag to the bam record
void
add_bam_int_tag(
    const char* tag,
    const int32_t value,
    bam1_t& br);

/// append a uint32 array ('B:I') aux tag to the bam record
void
add_bam_uint32_array_tag(
    const char* tag,
    const std::vector<uint32_t>& values,
    bam1_t& br);

/// append a uint8 array ('B:C') aux tag to the bam record
void
add_bam_uint8_array_tag(
    const char* tag,
    const std::vector<uint8_t>& values,
    bam1_t& br);
