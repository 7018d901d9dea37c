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
/// \brief VCF utilities
///
/// \author Chris Saunders


#pragma once

#include <cstring>

#include <string>
#include <vector>


namespace VCFID
{
enum index_t
{
    CHROM,
    POS,
    ID,
    REF,
    ALT,
    QUAL,
    FILT,
    INFO,
    FORMAT,
    SAMPLE,
    SIZE
};
}



/// look for 'key' in vcf FORMAT field, provide index of key or return
/// false
///
inline
bool
get_format_key_index(const char* format,
                     const char* key,
                     unsigned& index)
{
    const size_t keySize(strlen(key));
    index=0;
    do
    {
        if (index>0) format++;
        if ((0==strncmp(format,key,keySize)) &&
            ((format[keySize] == ':') || (format[keySize] == '\0'))) return true;
        index++;
    }
    while (nullptr != (format=strchr(format,':')));
    return false;
}



/// find the value for 'key' in a sample field, given the matching FORMAT field
///
/// \return false if key is not found in format, or the sample field has too few entries
bool
get_format_value(
    const char* format,
    const char* sample,
    const char* key,
    std::string& value);



/// find the value for 'key' in a ';' delimited INFO field
///
/// \return false if key is not found, flags are returned with an empty value
bool
get_info_value(
    const char* info,
    const char* key,
    std::string& value);



/// returns -1 for '.' alleles
///
/// the parsed allele order matches the genotype string order
void
parse_gt(
    const char* gt,
    std::vector<int>& gti,
    const bool is_allow_bad_end_char=false);
