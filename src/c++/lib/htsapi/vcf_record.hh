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
/// \author Chris Saunders
///

#pragma once

#include <iosfwd>
#include <string>
#include <vector>


/// a single VCF data line, retaining the fields required to read a per-locus call:
///
/// CHROM, POS, ID, REF, ALT, INFO, FORMAT and the first sample
///
struct vcf_record
{
    vcf_record()
    {
        clear();
    }

    /// set record from record string s, return false on error
    bool set(const char* s);

    void clear()
    {
        line.clear();
        chrom.clear();
        pos=0;
        id.clear();
        ref.clear();
        alt.clear();
        info.clear();
        format.clear();
        sample.clear();
    }

    /// get value for key from INFO field
    ///
    /// \return false if the key is absent
    bool
    getInfoValue(
        const char* key,
        std::string& value) const;

    /// get value for key from the first sample, using the FORMAT field
    ///
    /// \return false if the key is absent or there is no sample
    bool
    getSampleValue(
        const char* key,
        std::string& value) const;

    /// get allele sequence for GT allele index (0 is REF)
    ///
    /// \return false if the index is not a valid allele
    bool
    getAlleleSequence(
        const int alleleIndex,
        std::string& alleleSeq) const;

    std::string line;
    std::string chrom;
    int pos;
    std::string id;
    std::string ref;
    std::vector<std::string> alt;
    std::string info;
    std::string format;
    std::string sample;
};


std::ostream& operator<<(std::ostream& os, const vcf_record& vcfr);
