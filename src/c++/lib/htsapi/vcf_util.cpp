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
/// \author Chris Saunders
///

#include "htsapi/vcf_util.hh"

#include "blt_util/parse_util.hh"
#include "common/Exceptions.hh"

#include <cctype>

#include <sstream>



bool
get_format_value(
    const char* format,
    const char* sample,
    const char* key,
    std::string& value)
{
    value.clear();

    unsigned keynum(0);
    if (! get_format_key_index(format,key,keynum)) return false;

    for (; keynum>0; sample++)
    {
        if (! *sample) return false;
        if ((*sample)==':') keynum--;
    }

    const char* end(strchr(sample,':'));
    if (nullptr == end)
    {
        value = sample;
    }
    else
    {
        value.assign(sample,end-sample);
    }
    return true;
}



bool
get_info_value(
    const char* info,
    const char* key,
    std::string& value)
{
    value.clear();

    const size_t keySize(strlen(key));
    const char* p(info);
    while (true)
    {
        const char* end(strchr(p,';'));
        const size_t fieldSize((nullptr == end) ? strlen(p) : static_cast<size_t>(end-p));
        if ((fieldSize >= keySize) && (0 == strncmp(p,key,keySize)))
        {
            if (fieldSize == keySize) return true;
            if (p[keySize] == '=')
            {
                value.assign(p+keySize+1,fieldSize-(keySize+1));
                return true;
            }
        }
        if (nullptr == end) break;
        p = end+1;
    }
    return false;
}



static
void
parse_gt_exception(const char* const gt)
{
    std::ostringstream oss;
    oss << "Can't parse VCF GT field: '" << gt << "'";
    BOOST_THROW_EXCEPTION(tranno::common::InputFormatException(oss.str()));
}



void
parse_gt(
    const char* gt,
    std::vector<int>& gti,
    const bool is_allow_bad_end_char)
{
    using tranno::blt_util::parse_int;

    gti.clear();

    const char* const gtStart(gt);
    if ('\0' == *gt) parse_gt_exception(gtStart);

    while (true)
    {
        if ('.' == *gt)
        {
            gti.push_back(-1);
            gt++;
        }
        else if (isdigit(static_cast<unsigned char>(*gt)))
        {
            gti.push_back(parse_int(gt));
        }
        else
        {
            parse_gt_exception(gtStart);
        }

        if ((*gt == '/') || (*gt == '|'))
        {
            gt++;
            continue;
        }

        if ((*gt == '\0') || (*gt == ':') || (*gt == '\t')) break;

        if (! is_allow_bad_end_char) parse_gt_exception(gtStart);
        break;
    }
}
