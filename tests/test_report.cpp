#include "../kbfit_cli/src/cli/exit_policy.hpp"
#include "../kbfit_cli/src/report/report_generator.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <sstream>
#include <string>

TEST_CASE("CSV field escaping", "[report]") {
    CHECK(csv_escape("plain") == "plain");
    CHECK(csv_escape("") == "");
    CHECK(csv_escape("a,b") == "\"a,b\"");
    CHECK(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(csv_escape("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("Probe trail formatting", "[report]") {
    const std::vector<kbfit::ProbeRecord> trail = {{60, 81234, true}, {77, 99012, false}};
    CHECK(format_trail(trail) == "q=60:81234<=; q=77:99012>");
    CHECK(format_trail({}).empty());
}

TEST_CASE("Outcome labels", "[report]") {
    Result r;
    r.success = true;
    r.meets_target = true;
    r.written = true;
    CHECK(outcome_label(r) == "OK");
    r.written = false;
    CHECK(outcome_label(r) == "OK (dry-run)");
    r.meets_target = false;
    r.written = true;
    CHECK(outcome_label(r) == "FORCED");
    r.success = false;
    CHECK(outcome_label(r) == "FAIL");
}

TEST_CASE("CSV export writes a header and one row", "[report]") {
    kbfit::test::TempDir tmp("report");
    Result r;
    r.input = "dir/photo, final.png";
    r.format = "jpg";
    r.target = 153600;
    r.size_before = 400000;
    r.size_after = 150549;
    r.quality = 16;
    r.reason = "feasible-found";
    r.iterations = 7;
    r.meets_target = true;
    r.written = true;
    r.success = true;

    const auto path = tmp.path() / "report.csv";
    REQUIRE(export_csv_report(r, path));

    std::ifstream in(path);
    std::string header, row, extra;
    REQUIRE(std::getline(in, header));
    REQUIRE(std::getline(in, row));
    CHECK_FALSE(std::getline(in, extra));

    CHECK(header.rfind("File,Output,Format", 0) == 0);
    CHECK(row.rfind("\"photo, final.png\",", 0) == 0);
    CHECK(row.find(",jpg,") != std::string::npos);
    CHECK(row.find(",16,7,feasible-found,yes,") != std::string::npos);
}

TEST_CASE("Infeasible results follow the force policy", "[report][exit]") {
    using kbfit::TerminalReason;

    SECTION("without force nothing is written and the run exits 3") {
        const WriteDecision d = decide_write(TerminalReason::InfeasibleAtMinimum, false);
        CHECK_FALSE(d.write);
        CHECK(d.exit_code == kExitInfeasible);
        CHECK(kExitInfeasible == 3);
    }

    SECTION("with force the fallback is written and the run exits 0") {
        const WriteDecision d = decide_write(TerminalReason::InfeasibleAtMinimum, true);
        CHECK(d.write);
        CHECK(d.exit_code == kExitOk);
    }

    SECTION("feasible and best-effort results are always written") {
        for (const bool force : {false, true}) {
            CHECK(decide_write(TerminalReason::FeasibleFound, force).write);
            CHECK(decide_write(TerminalReason::FeasibleFound, force).exit_code == kExitOk);
            CHECK(decide_write(TerminalReason::NotSearchable, force).write);
            CHECK(decide_write(TerminalReason::NotSearchable, force).exit_code == kExitOk);
        }
    }
}

TEST_CASE("A failed report export fails an otherwise clean run", "[report][exit]") {
    kbfit::test::TempDir tmp("report_fail");
    Result r;
    r.success = true;

    // a directory cannot be opened as the report file
    const bool exported = export_csv_report(r, tmp.path());
    CHECK_FALSE(exported);
    CHECK(merge_report_status(kExitOk, exported) == kExitIoError);

    CHECK(merge_report_status(kExitOk, true) == kExitOk);
    CHECK(merge_report_status(kExitInfeasible, false) == kExitInfeasible);
    CHECK(merge_report_status(kExitEncodingError, false) == kExitEncodingError);
}
