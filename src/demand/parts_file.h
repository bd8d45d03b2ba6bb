#pragma once
/**
 * Part-list text format (the upload format of the order form)
 *
 *   6000        <- first non-blank line: raw stock length
 *   2300
 *   1700        <- then one part length per line
 *   2300
 *
 * Blank lines are skipped. Equal lengths are merged into one row whose
 * quantity counts them, in order of first appearance. The lengths are not
 * range-checked here; build_demand() does that.
 */

#include "core/types.h"
#include <istream>
#include <string>
#include <vector>

namespace cutstock {

struct PartList {
    Length raw_length = 0.0;
    std::vector<RequiredPart> parts;
};

/**
 * Parse a part list from a stream. `source` names the input in error
 * messages. Throws InvalidInputError on a non-numeric line or when no raw
 * length is present.
 */
PartList parse_part_list(std::istream& in, const std::string& source = "<input>");

/** Open and parse a part-list file; an unreadable file is InvalidInputError */
PartList read_part_list_file(const std::string& path);

} // namespace cutstock
