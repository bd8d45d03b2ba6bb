#include "demand/parts_file.h"
#include "core/errors.h"
#include <fstream>
#include <sstream>

namespace cutstock {

static bool parse_number(const std::string& line, double& out) {
    std::istringstream in(line);
    double v = 0.0;
    if (!(in >> v)) return false;
    std::string rest;
    if (in >> rest) return false;
    out = v;
    return true;
}

static bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

PartList parse_part_list(std::istream& in, const std::string& source) {
    PartList list;
    bool have_raw = false;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank(line)) continue;

        double v = 0.0;
        if (!parse_number(line, v)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            throw InvalidInputError(source + ":" + std::to_string(line_no)
                                    + ": not a number: '" + line + "'");
        }
        if (!have_raw) {
            list.raw_length = v;
            have_raw = true;
            continue;
        }

        bool merged = false;
        for (auto& p : list.parts) {
            if (p.length == v) { p.quantity++; merged = true; break; }
        }
        if (!merged) list.parts.push_back({v, 1});
    }

    if (!have_raw) {
        throw InvalidInputError(source + ": missing raw stock length");
    }
    return list;
}

PartList read_part_list_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw InvalidInputError("cannot open " + path);
    }
    return parse_part_list(ifs, path);
}

} // namespace cutstock
