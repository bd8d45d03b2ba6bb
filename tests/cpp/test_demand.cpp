/**
 * test_demand.cpp — order validation and flattening
 *
 *   1. Flattening keeps input order, one entry per instance
 *   2. Histogram: first-seen order, equal lengths merged
 *   3. A part equal to the raw length is accepted
 *   4. Invalid input rejected (empty order, bad lengths, bad quantities)
 *   5. Part longer than stock -> InfeasiblePartError naming the length
 *   6. Part-list text: raw length line, blank lines, merging, bad lines
 */

#include "demand/demand.h"
#include "demand/parts_file.h"
#include "core/errors.h"
#include "test_utils.h"
#include <cstdio>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

static int g_pass = 0, g_fail = 0;

#define CHECK(cond, msg) do { \
    if (!(cond)) { printf("  [FAIL] %s\n", msg); g_fail++; return; } \
} while(0)

#define PASS(msg) do { printf("  [PASS] %s\n", msg); g_pass++; } while(0)

using namespace cutstock;

template <typename E, typename F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

// =============================================================================
// Test 1: flattening
// =============================================================================
void test_flatten() {
    printf("\n--- Test 1: flattening (length x quantity) ---\n");

    Demand d = build_demand(100.0, {{50.0, 2}, {30.0, 1}, {20.0, 1}});
    printf("    instances: %zu, total length: %s\n",
           d.size(), format_length(d.total_length).c_str());

    CHECK(d.size() == 4, "4 part instances");
    CHECK(d.instances[0] == 50.0 && d.instances[1] == 50.0, "first row expanded first");
    CHECK(d.instances[2] == 30.0 && d.instances[3] == 20.0, "rows kept in input order");
    CHECK(d.total_length == 150.0, "total demand 150");
    CHECK(d.raw_length == 100.0, "raw length kept");
    CHECK(d.instance_kind.size() == d.size(), "one kind per instance");
    CHECK(d.instance_kind[0] == 0 && d.instance_kind[2] == 1 && d.instance_kind[3] == 2,
          "instance kinds point into histogram");

    PASS("flattening");
}

// =============================================================================
// Test 2: histogram
// =============================================================================
void test_histogram() {
    printf("\n--- Test 2: unique-length histogram ---\n");

    Demand d = build_demand(1000.0, {{300.0, 2}, {120.5, 3}, {300.0, 1}, {75.0, 4}});

    CHECK(d.histogram.size() == 3, "3 distinct lengths");
    CHECK(d.histogram[0].length == 300.0 && d.histogram[0].count == 3,
          "repeated length merged at first position");
    CHECK(d.histogram[1].length == 120.5 && d.histogram[1].count == 3, "second distinct length");
    CHECK(d.histogram[2].length == 75.0 && d.histogram[2].count == 4, "third distinct length");
    CHECK(d.size() == 10, "10 instances");
    CHECK(d.kind_of(120.5) == 1, "kind_of finds a length");
    CHECK(d.kind_of(1.0) == d.histogram.size(), "kind_of reports a missing length");

    PASS("histogram");
}

// =============================================================================
// Test 3: boundary fit
// =============================================================================
void test_exact_fit_accepted() {
    printf("\n--- Test 3: part equal to raw length ---\n");

    Demand d = build_demand(10.0, {{10.0, 2}});
    CHECK(d.size() == 2, "exact-length parts accepted");

    PASS("exact fit accepted");
}

// =============================================================================
// Test 4: invalid input
// =============================================================================
void test_invalid_input() {
    printf("\n--- Test 4: invalid input ---\n");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    CHECK(throws<InvalidInputError>([] { build_demand(100.0, {}); }), "empty order");
    CHECK(throws<InvalidInputError>([] { build_demand(0.0, {{1.0, 1}}); }), "zero raw length");
    CHECK(throws<InvalidInputError>([] { build_demand(-5.0, {{1.0, 1}}); }), "negative raw length");
    CHECK(throws<InvalidInputError>([&] { build_demand(inf, {{1.0, 1}}); }), "infinite raw length");
    CHECK(throws<InvalidInputError>([] { build_demand(100.0, {{0.0, 1}}); }), "zero part length");
    CHECK(throws<InvalidInputError>([] { build_demand(100.0, {{-3.0, 1}}); }), "negative part length");
    CHECK(throws<InvalidInputError>([&] { build_demand(100.0, {{nan, 1}}); }), "NaN part length");
    CHECK(throws<InvalidInputError>([] { build_demand(100.0, {{10.0, 0}}); }), "zero quantity");
    CHECK(throws<InvalidInputError>([] { build_demand(100.0, {{10.0, 2}, {5.0, -1}}); }),
          "negative quantity in a later row");

    bool message_ok = false;
    try {
        build_demand(100.0, {{10.0, 1}, {20.0, 0}});
    } catch (const InvalidInputError& e) {
        std::string what = e.what();
        printf("    message: %s\n", e.what());
        message_ok = what.find("part 2") != std::string::npos;
    }
    CHECK(message_ok, "message names the offending row");

    PASS("invalid input rejected");
}

// =============================================================================
// Test 5: infeasible part
// =============================================================================
void test_infeasible_part() {
    printf("\n--- Test 5: part longer than raw stock ---\n");

    bool caught = false;
    try {
        build_demand(10.0, {{11.0, 1}});
    } catch (const InfeasiblePartError& e) {
        caught = true;
        std::string what = e.what();
        printf("    message: %s\n", e.what());
        CHECK(e.length() == 11.0, "error carries offending length");
        CHECK(e.raw_length() == 10.0, "error carries raw length");
        CHECK(what.find("11") != std::string::npos, "message names the length");
    }
    CHECK(caught, "InfeasiblePartError raised");

    // Validation order: the first infeasible row is reported
    double reported = 0.0;
    try {
        build_demand(100.0, {{40.0, 1}, {150.0, 1}, {200.0, 1}});
    } catch (const InfeasiblePartError& e) {
        reported = e.length();
    }
    CHECK(reported == 150.0, "first infeasible length reported");

    PASS("infeasible part rejected");
}

// =============================================================================
// Test 6: part-list text
// =============================================================================
static PartList parse_text(const std::string& text) {
    std::istringstream in(text);
    return parse_part_list(in, "order.txt");
}

void test_part_list_text() {
    printf("\n--- Test 6: part-list text ---\n");

    PartList list = parse_text("6000\n\n2300\n1700\r\n   \n2300\n450.5\n1700\n2300\n");
    printf("    raw length %s, %zu rows\n", format_length(list.raw_length).c_str(), list.parts.size());

    CHECK(list.raw_length == 6000.0, "first line is the raw length");
    CHECK(list.parts.size() == 3, "blank lines skipped, equal lengths merged");
    CHECK(list.parts[0].length == 2300.0 && list.parts[0].quantity == 3, "2300 x3 at first position");
    CHECK(list.parts[1].length == 1700.0 && list.parts[1].quantity == 2, "1700 x2 (CRLF line)");
    CHECK(list.parts[2].length == 450.5 && list.parts[2].quantity == 1, "fractional length kept");

    Demand d = build_demand(list.raw_length, list.parts);
    CHECK(d.size() == 6, "parsed order flattens to 6 instances");

    // Leading blank lines do not count as the raw length
    PartList late = parse_text("\n\n100\n50\n");
    CHECK(late.raw_length == 100.0 && late.parts.size() == 1, "leading blanks skipped");

    // Raw length alone parses; build_demand rejects the empty order
    PartList only_raw = parse_text("100\n");
    CHECK(only_raw.parts.empty(), "raw length only -> no parts");
    CHECK(throws<InvalidInputError>([&] { build_demand(only_raw.raw_length, only_raw.parts); }),
          "empty order rejected downstream");

    bool line_named = false;
    try {
        parse_text("100\n50\n3O\n");
    } catch (const InvalidInputError& e) {
        std::string what = e.what();
        printf("    message: %s\n", e.what());
        line_named = what.find("order.txt:3") != std::string::npos
                  && what.find("'3O'") != std::string::npos;
    }
    CHECK(line_named, "garbage line rejected with its line number");
    CHECK(throws<InvalidInputError>([] { parse_text("100\n50 mm\n"); }), "trailing text rejected");
    CHECK(throws<InvalidInputError>([] { parse_text(""); }), "empty file rejected");
    CHECK(throws<InvalidInputError>([] { parse_text("\n  \n"); }), "blank-only file rejected");
    CHECK(throws<InvalidInputError>([] { read_part_list_file("/nonexistent/order.txt"); }),
          "missing file rejected");

    PASS("part-list text");
}

// =========================================================================
// main
// =========================================================================
int main() {
    init_test_console();
    setvbuf(stdout, NULL, _IONBF, 0);
    printf("=== cutstock demand model tests ===\n");

    test_flatten();
    test_histogram();
    test_exact_fit_accepted();
    test_invalid_input();
    test_infeasible_part();
    test_part_list_text();

    printf("\n========================================\n");
    printf("  Passed: %d / %d\n", g_pass, g_pass + g_fail);
    printf("========================================\n");

    return g_fail > 0 ? 1 : 0;
}
