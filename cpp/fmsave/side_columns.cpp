#include "side_columns.hpp"

namespace fmsave {

side_columns side_columns::of(const fmsave_core::schema& schema, fmsave_core::side s)
{
    side_columns result;
    result.side = s;
    result.lat = schema.find_by_provenance(s, provenance_field::lat);
    result.lon = schema.find_by_provenance(s, provenance_field::lon);
    result.lookup_date = schema.timezone_lookup_date(s);
    result.time = schema.find_by_provenance(s, provenance_field::time);
    result.tzid = schema.find_by_provenance(s, provenance_field::tzid);
    result.gmtoffset = schema.find_by_provenance(s, provenance_field::gmtoffset);
    return result;
}

} // namespace fmsave
