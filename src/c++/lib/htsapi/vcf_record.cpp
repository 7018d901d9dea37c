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

///
/// \author Chris Saunders
///

#include "vcf_record.hh"
#include "vcf_util.hh"
#include "blt_util/parse_util.hh"

#include <cctype>

#include <algorithm>
#include <iostream>



struct convert
{
    void operator()(char& c) const
    {
        c = toupper((unsigned char)c);
    }
};


static
void
stoupper(std::string& s)
{
    std::for_each(s.begin(), s.end(), convert());
}



bool
vcf_record::
set(const char* s)
{
    static const char sep('\t');

    // INFO is the last required field, FORMAT and SAMPLE are optional:
    static const unsigned minword(VCFID::FORMAT);
    static const unsigned maxword(VCFID::SAMPLE+1);

    clear();

    line = s;

    // simple tab parse:
    const char* start(s);
    const char* p(start);

    unsigned wordindex(0);
    while (wordindex<maxword)
    {
        if ((*p == sep) || (*p == '\n') || (*p == '\0'))
        {
            switch (wordindex)
            {
            case VCFID::CHROM:
                chrom=std::string(start,p-start);
                break;
            case VCFID::POS:
            {
                const std::string posStr(start,p-start);
                pos=tranno::blt_util::parse_int_str(posStr);
            }
            break;
            case VCFID::ID:
                id=std::string(start,p-start);
                break;
            case VCFID::REF:
                ref=std::string(start,p-start);
                stoupper(ref);
                break;
            case VCFID::ALT:
                // additional parse loop for ',' character:
            {
                const char* p2(start);
                while (p2<=p)
                {
                    if ((*p2==',') || (p2==p))
                    {
                        alt.emplace_back(start,p2-start);
                        stoupper(alt.back());
                        start=p2+1;
                    }
                    p2++;
                }
            }
            break;
            case VCFID::QUAL:
            case VCFID::FILT:
                // skip these fields...
                break;
            case VCFID::INFO:
                info=std::string(start,p-start);
                break;
            case VCFID::FORMAT:
                format=std::string(start,p-start);
                break;
            case VCFID::SAMPLE:
                sample=std::string(start,p-start);
                break;
            default:
                break;
            }
            start=p+1;
            wordindex++;
        }
        if ((*p == '\n') || (*p == '\0')) break;
        ++p;
    }

    return (wordindex >= minword);
}



bool
vcf_record::
getInfoValue(
    const char* key,
    std::string& value) const
{
    return get_info_value(info.c_str(),key,value);
}



bool
vcf_record::
getSampleValue(
    const char* key,
    std::string& value) const
{
    value.clear();
    if (format.empty() || sample.empty()) return false;
    return get_format_value(format.c_str(),sample.c_str(),key,value);
}



bool
vcf_record::
getAlleleSequence(
    const int alleleIndex,
    std::string& alleleSeq) const
{
    alleleSeq.clear();
    if (alleleIndex < 0) return false;
    if (alleleIndex == 0)
    {
        alleleSeq = ref;
        return true;
    }
    const unsigned altIndex(alleleIndex-1);
    if (altIndex >= alt.size()) return false;
    alleleSeq = alt[altIndex];
    return true;
}



std::ostream& operator<<(std::ostream& os, const vcf_record& vcfr)
{
    os << vcfr.chrom << '\t'
       << vcfr.pos << '\t'
       << vcfr.id << '\t'
       << vcfr.ref << '\t';

    const unsigned nalt(vcfr.alt.size());
    for (unsigned a(0); a<nalt; ++a)
    {
        if (a) os << ',';
        os << vcfr.alt[a];
    }
    os << '\t'
       << '.' << '\t'
       << '.' << '\t'
       << vcfr.info;

    if (! vcfr.format.empty())
    {
        os << '\t' << vcfr.format
           << '\t' << vcfr.sample;
    }
    os << '\n';

    return os;
}
